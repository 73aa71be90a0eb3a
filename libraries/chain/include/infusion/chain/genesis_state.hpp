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
#pragma once

#include <infusion/protocol/address.hpp>
#include <infusion/protocol/types.hpp>

#include <string>
#include <vector>

namespace infusion { namespace chain {
using std::string;
using std::vector;
using infusion::protocol::address;
using infusion::protocol::share_type;

struct genesis_state_type {
   struct initial_asset_type {
      string name = INFUSION_DEFAULT_AURA_NAME;
      string symbol = INFUSION_DEFAULT_AURA_SYMBOL;
      uint8_t decimals = INFUSION_DEFAULT_AURA_DECIMALS;
      string icon_uri = INFUSION_DEFAULT_AURA_ICON_URI;
      string project_uri = INFUSION_DEFAULT_AURA_PROJECT_URI;

      /// Zero leaves the supply unbounded
      share_type max_supply = 0;

      bool mintable = true;
      bool transfer_ignoring_freeze = true;
      bool burnable = true;
   };
   struct initial_collection_type {
      initial_collection_type(const string& name = string(),
                              const string& description = string(),
                              const string& uri = string(),
                              const string& token_name_prefix = string())
         : name(name),
           description(description),
           uri(uri),
           token_name_prefix(token_name_prefix)
      {}
      string name;
      string description;
      string uri;
      string token_name_prefix;
   };
   struct initial_balance_type {
      address owner;
      share_type amount;
   };

   /// Identity allowed to run admin-gated operations
   address admin;
   share_type minimum_infusion = INFUSION_MIN_INFUSION_AMOUNT;

   initial_asset_type aura;
   initial_collection_type fuse_block_collection = initial_collection_type( INFUSION_FUSE_BLOCK_COLLECTION_NAME,
                                                                            INFUSION_FUSE_BLOCK_COLLECTION_DESCRIPTION,
                                                                            INFUSION_FUSE_BLOCK_COLLECTION_URI,
                                                                            INFUSION_FUSE_BLOCK_TOKEN_PREFIX );
   initial_collection_type item_collection = initial_collection_type( INFUSION_ITEM_COLLECTION_NAME,
                                                                      INFUSION_ITEM_COLLECTION_DESCRIPTION,
                                                                      INFUSION_ITEM_COLLECTION_URI,
                                                                      INFUSION_ITEM_TOKEN_PREFIX );
   vector<initial_balance_type> initial_balances;

   /// Stateless checks run by database::init_genesis
   void validate()const;
};

/// Default deployment administered by @p admin
genesis_state_type create_example_genesis( const address& admin );

} } // namespace infusion::chain

FC_REFLECT( infusion::chain::genesis_state_type::initial_asset_type,
            (name)(symbol)(decimals)(icon_uri)(project_uri)(max_supply)
            (mintable)(transfer_ignoring_freeze)(burnable) )

FC_REFLECT( infusion::chain::genesis_state_type::initial_collection_type,
            (name)(description)(uri)(token_name_prefix) )

FC_REFLECT( infusion::chain::genesis_state_type::initial_balance_type,
            (owner)(amount) )

FC_REFLECT( infusion::chain::genesis_state_type,
            (admin)(minimum_infusion)(aura)(fuse_block_collection)(item_collection)(initial_balances) )
