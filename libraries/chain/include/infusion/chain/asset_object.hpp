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
#include <infusion/chain/types.hpp>

namespace infusion { namespace chain {
   class database;

   using namespace infusion::db;

   /// Capabilities fixed when the asset is created
   enum asset_capability_flags
   {
      mintable                 = 0x01,
      transfer_ignoring_freeze = 0x02,
      burnable                 = 0x04
   };

   /**
    *  @brief tracks the asset information that changes frequently
    *  @ingroup object
    *  @ingroup implementation
    *
    *  Because the asset_object is very large it doesn't make sense to save an undo state
    *  for all of the parameters that never change.   This object factors out the parameters
    *  of an asset that change in almost every transaction that involves the asset.
    *
    *  At every observation point total_minted - total_burned == current_supply,
    *  and current_supply equals the sum of all balances in the asset.
    */
   class asset_dynamic_data_object : public abstract_object<asset_dynamic_data_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_asset_dynamic_data_object_type;

         /// The number of shares currently in existence
         share_type current_supply;
         share_type total_minted;
         share_type total_burned;
   };

   /**
    *  @brief tracks the parameters of the Aura asset
    *  @ingroup object
    *
    *  All assets have a globally unique symbol name that controls how they are traded and an issuer who
    *  has authority over the parameters of the asset.  Here the issuer is always the creator.
    */
   class asset_object : public abstract_object<asset_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_asset_object_type;

         bool can_mint()const { return flags & mintable; }
         bool can_transfer_ignoring_freeze()const { return flags & transfer_ignoring_freeze; }
         bool can_burn()const { return flags & burnable; }

         /// Derived from the issuer and the symbol
         address  asset_address;
         /// Holds the mint capability
         address  issuer;

         string   name;
         /// Ticker symbol for this asset, i.e. "AURA"
         string   symbol;
         /// Maximum number of digits after the decimal point
         uint8_t  decimals = 0;
         string   icon_uri;
         string   project_uri;

         /// Zero means the supply is unbounded
         share_type max_supply;

         /// Set of asset_capability_flags
         uint8_t  flags = 0;

         object_id_type dynamic_asset_data_id;

         template<class DB>
         const asset_dynamic_data_object& dynamic_data( const DB& db )const
         { return db.template get<asset_dynamic_data_object>( dynamic_asset_data_id ); }
   };

   struct by_symbol;
   struct by_asset_address;
   typedef multi_index_container<
      asset_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_symbol>, member<asset_object, string, &asset_object::symbol> >,
         ordered_unique< tag<by_asset_address>, member<asset_object, address, &asset_object::asset_address> >
      >
   > asset_object_multi_index_type;
   typedef generic_index<asset_object, asset_object_multi_index_type> asset_index;

   typedef multi_index_container<
      asset_dynamic_data_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
      >
   > asset_dynamic_data_multi_index_type;
   typedef generic_index<asset_dynamic_data_object, asset_dynamic_data_multi_index_type> asset_dynamic_data_index;

} } // infusion::chain

FC_REFLECT_ENUM( infusion::chain::asset_capability_flags,
                 (mintable)
                 (transfer_ignoring_freeze)
                 (burnable)
               )

FC_REFLECT_DERIVED( infusion::chain::asset_dynamic_data_object, (infusion::db::object),
                    (current_supply)(total_minted)(total_burned)
                  )

FC_REFLECT_DERIVED( infusion::chain::asset_object, (infusion::db::object),
                    (asset_address)
                    (issuer)
                    (name)
                    (symbol)
                    (decimals)
                    (icon_uri)
                    (project_uri)
                    (max_supply)
                    (flags)
                    (dynamic_asset_data_id)
                  )
