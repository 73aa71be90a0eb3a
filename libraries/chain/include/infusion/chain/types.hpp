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
#include <infusion/db/generic_index.hpp>
#include <infusion/db/object.hpp>
#include <infusion/protocol/address.hpp>
#include <infusion/protocol/types.hpp>

namespace infusion { namespace chain {

   using namespace infusion::protocol;

   using infusion::db::abstract_object;
   using infusion::db::object;
   using infusion::db::object_id_type;

   enum reserved_spaces
   {
      implementation_ids = 2
   };

   enum impl_object_type
   {
      impl_global_property_object_type,
      impl_creator_object_type,
      impl_asset_object_type,
      impl_asset_dynamic_data_object_type,
      impl_account_balance_object_type,
      impl_collection_object_type,
      impl_infusable_token_object_type
   };

} } // infusion::chain

FC_REFLECT_ENUM( infusion::chain::impl_object_type,
                 (impl_global_property_object_type)
                 (impl_creator_object_type)
                 (impl_asset_object_type)
                 (impl_asset_dynamic_data_object_type)
                 (impl_account_balance_object_type)
                 (impl_collection_object_type)
                 (impl_infusable_token_object_type)
               )
