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

   using namespace infusion::db;

   /**
    * @class global_property_object
    * @brief Deployment-wide settings fixed at genesis
    * @ingroup object
    * @ingroup implementation
    *
    * There is exactly one instance once genesis has been applied.
    */
   class global_property_object : public abstract_object<global_property_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_global_property_object_type;

         /// The only identity allowed to run admin-gated operations
         address    admin;

         share_type minimum_infusion = INFUSION_MIN_INFUSION_AMOUNT;
   };

   typedef multi_index_container<
      global_property_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
      >
   > global_property_multi_index_type;
   typedef generic_index<global_property_object, global_property_multi_index_type> global_property_index;

} } // infusion::chain

FC_REFLECT_DERIVED( infusion::chain::global_property_object, (infusion::db::object),
                    (admin)
                    (minimum_infusion)
                  )
