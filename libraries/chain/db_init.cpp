/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
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
#include <infusion/chain/database.hpp>

#include <infusion/chain/account_balance_object.hpp>
#include <infusion/chain/asset_object.hpp>
#include <infusion/chain/creator_object.hpp>
#include <infusion/chain/exceptions.hpp>
#include <infusion/chain/global_property_object.hpp>
#include <infusion/chain/infusable_object.hpp>

#include <infusion/chain/aura_evaluator.hpp>
#include <infusion/chain/infusable_evaluator.hpp>

#include <fc/log/logger.hpp>

namespace infusion { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize( 255 );
   register_evaluator<aura_mint_evaluator>();
   register_evaluator<aura_burn_evaluator>();
   register_evaluator<aura_override_transfer_evaluator>();
   register_evaluator<aura_transfer_evaluator>();
   register_evaluator<aura_freeze_evaluator>();
   register_evaluator<aura_unfreeze_evaluator>();
   register_evaluator<aura_infuse_evaluator>();
   register_evaluator<fuse_block_mint_evaluator>();
   register_evaluator<item_mint_evaluator>();
   register_evaluator<token_qualify_evaluator>();
   register_evaluator<token_override_transfer_evaluator>();
   register_evaluator<token_burn_evaluator>();
   register_evaluator<token_infuse_evaluator>();
}

void database::initialize_indexes()
{
   reset_indexes();

   add_index< global_property_index >();
   add_index< creator_index >();
   add_index< asset_index >();
   add_index< asset_dynamic_data_index >();
   add_index< account_balance_index >();
   add_index< collection_index >();
   add_index< infusable_token_index >();
}

const asset_object& database::create_aura( const creator_signer& signer, const genesis_state_type::initial_asset_type& a )
{ try {
   FC_ASSERT( signer.get_address() == get_creator().creator, "Only the creator may create the Aura asset" );
   FC_ASSERT( get_index_type<asset_index>().indices().empty(), "The Aura asset already exists" );

   const asset_dynamic_data_object& dyn_asset = create<asset_dynamic_data_object>( []( asset_dynamic_data_object& d ) {
      d.current_supply = 0;
      d.total_minted = 0;
      d.total_burned = 0;
   });

   return create<asset_object>( [&]( asset_object& obj ) {
      obj.asset_address = address::derive( signer.get_address(), a.symbol );
      obj.issuer = signer.get_address();
      obj.name = a.name;
      obj.symbol = a.symbol;
      obj.decimals = a.decimals;
      obj.icon_uri = a.icon_uri;
      obj.project_uri = a.project_uri;
      obj.max_supply = a.max_supply;
      obj.flags = 0;
      if( a.mintable )                 obj.flags |= mintable;
      if( a.transfer_ignoring_freeze ) obj.flags |= transfer_ignoring_freeze;
      if( a.burnable )                 obj.flags |= burnable;
      obj.dynamic_asset_data_id = dyn_asset.id;
   });
} FC_CAPTURE_AND_RETHROW( (a.symbol) ) }

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   INFUSION_ASSERT( !is_initialized(), already_initialized_exception,
                    "Genesis was already applied for admin ${admin}", ("admin",get_global_properties().admin) );
   genesis_state.validate();

   // Nothing is left behind if any part of genesis fails
   auto session = _undo_db.start_undo_session();

   create<global_property_object>( [&]( global_property_object& p ) {
      p.admin = genesis_state.admin;
      p.minimum_infusion = genesis_state.minimum_infusion;
   });

   creator::initialize( *this, genesis_state.admin );
   const creator_signer signer = creator::act_as_creator( *this );

   const asset_object& aura = create_aura( signer, genesis_state.aura );

   create_collection( signer, token_kind::fuse_block, genesis_state.fuse_block_collection );
   create_collection( signer, token_kind::item, genesis_state.item_collection );

   for( const auto& balance : genesis_state.initial_balances )
      issue_aura( signer, balance.owner, balance.amount );

   session.commit();

   ilog( "Genesis applied: admin ${admin}, creator ${creator}, ${symbol} at ${asset}",
         ("admin",genesis_state.admin)("creator",signer.get_address())
         ("symbol",aura.symbol)("asset",aura.asset_address) );
} FC_CAPTURE_AND_RETHROW() }

} }
