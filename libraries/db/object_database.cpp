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
#include <infusion/db/object_database.hpp>

namespace infusion { namespace db {

object_database::object_database()
:_undo_db(*this)
{
}

object_database::~object_database(){}

const object* object_database::find_object( object_id_type id )const
{
   auto itr = _index.find( id.space_type() );
   if( itr == _index.end() ) return nullptr;
   return itr->second->find( id );
}

const object& object_database::get_object( object_id_type id )const
{
   const object* obj = find_object( id );
   FC_ASSERT( obj != nullptr, "Unable to find Object ${id}", ("id",id) );
   return *obj;
}

const index& object_database::get_index( uint8_t space_id, uint8_t type_id )const
{
   auto itr = _index.find( object_id_type( space_id, type_id, 0 ).space_type() );
   FC_ASSERT( itr != _index.end(), "No index registered for space ${s} type ${t}", ("s",space_id)("t",type_id) );
   return *itr->second;
}

index& object_database::get_mutable_index( uint8_t space_id, uint8_t type_id )
{
   auto itr = _index.find( object_id_type( space_id, type_id, 0 ).space_type() );
   FC_ASSERT( itr != _index.end(), "No index registered for space ${s} type ${t}", ("s",space_id)("t",type_id) );
   return *itr->second;
}

} } // infusion::db
