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
#include <infusion/chain/creator.hpp>
#include <infusion/chain/database.hpp>
#include <infusion/chain/exceptions.hpp>

namespace infusion { namespace chain {

const creator_object& creator::initialize( database& db, const address& admin )
{ try {
   const auto& idx = db.get_index_type<creator_index>().indices();
   INFUSION_ASSERT( idx.empty(), already_initialized_exception,
                    "The creator was already initialized by ${admin}", ("admin",idx.begin()->admin) );
   FC_ASSERT( !admin.is_null(), "The creator requires an admin" );

   const creator_object& result = db.create<creator_object>( [&]( creator_object& obj ) {
      obj.admin = admin;
      obj.creator = derive_address( admin );
   });

   ilog( "Creator ${creator} initialized for admin ${admin}", ("creator",result.creator)("admin",admin) );
   return result;
} FC_CAPTURE_AND_RETHROW( (admin) ) }

address creator::derive_address( const address& admin )
{
   return address::derive( admin, INFUSION_CREATOR_SEED );
}

creator_signer creator::act_as_creator( const database& db )
{
   return creator_signer( db.get_creator().creator );
}

} } // infusion::chain
