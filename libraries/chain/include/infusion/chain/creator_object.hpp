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
#pragma once
#include <infusion/chain/types.hpp>

namespace infusion { namespace chain {

   using namespace infusion::db;

   /**
    * @brief Records the delegated signer that owns the Aura asset and both collections
    * @ingroup object
    * @ingroup implementation
    *
    * The creator address is derived from the admin, so it never changes
    * once initialized.  Only one creator exists per database.
    */
   class creator_object : public abstract_object<creator_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_creator_object_type;

         /// Admin that initialized the creator
         address admin;

         /// Identity the creator acts as
         address creator;
   };

   typedef multi_index_container<
      creator_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
      >
   > creator_multi_index_type;
   typedef generic_index<creator_object, creator_multi_index_type> creator_index;

} } // infusion::chain

FC_REFLECT_DERIVED( infusion::chain::creator_object, (infusion::db::object),
                    (admin)
                    (creator)
                  )
