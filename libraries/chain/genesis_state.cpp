/*
 * Copyright (c) 2023 Michel Santos and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <infusion/chain/genesis_state.hpp>

#include <fc/exception/exception.hpp>

namespace infusion { namespace chain {

void genesis_state_type::validate()const
{
   FC_ASSERT( !admin.is_null(), "Genesis must name an admin" );
   FC_ASSERT( minimum_infusion > 0, "The minimum infusion should be positive" );

   FC_ASSERT( !aura.symbol.empty(), "The Aura asset needs a symbol" );
   FC_ASSERT( aura.decimals <= INFUSION_MAX_ASSET_DECIMALS, "Aura may have at most ${max} decimals",
              ("max", INFUSION_MAX_ASSET_DECIMALS) );
   FC_ASSERT( aura.max_supply >= 0 && aura.max_supply <= INFUSION_MAX_SHARE_SUPPLY, "Invalid maximum supply" );

   FC_ASSERT( !fuse_block_collection.name.empty() && !item_collection.name.empty(), "Collections must be named" );
   FC_ASSERT( fuse_block_collection.name != item_collection.name, "Collection names must differ" );

   for( const auto& balance : initial_balances )
   {
      FC_ASSERT( !balance.owner.is_null(), "Initial balances must name an owner" );
      FC_ASSERT( balance.amount > 0, "Initial balance of ${o} should be positive", ("o",balance.owner) );
   }
}

genesis_state_type create_example_genesis( const address& admin )
{
   genesis_state_type genesis;
   genesis.admin = admin;
   return genesis;
}

} } // infusion::chain
