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
#include <infusion/db/undo_database.hpp>

namespace infusion { namespace db {

undo_database::session undo_database::start_undo_session()
{
   _stack.emplace_back();
   return session( *this );
}

void undo_database::on_create( const object& obj )
{
   if( _stack.empty() ) return;

   auto& state = _stack.back();
   auto index_id = obj.id.space_type();
   auto itr = state.old_index_next_ids.find( index_id );
   if( itr == state.old_index_next_ids.end() )
      state.old_index_next_ids[index_id] = obj.id;
   state.new_ids.insert( obj.id );
}

void undo_database::on_modify( const object& obj )
{
   if( _stack.empty() ) return;

   auto& state = _stack.back();
   if( state.new_ids.find( obj.id ) != state.new_ids.end() )
      return;
   auto itr = state.old_values.find( obj.id );
   if( itr != state.old_values.end() ) return;
   state.old_values[obj.id] = obj.clone();
}

void undo_database::on_remove( const object& obj )
{
   if( _stack.empty() ) return;

   undo_state& state = _stack.back();
   if( state.new_ids.count( obj.id ) )
   {
      state.new_ids.erase( obj.id );
      return;
   }
   if( state.old_values.count( obj.id ) )
   {
      state.removed[obj.id] = std::move( state.old_values[obj.id] );
      state.old_values.erase( obj.id );
      return;
   }
   if( state.removed.count( obj.id ) ) return;
   state.removed[obj.id] = obj.clone();
}

void undo_database::undo()
{ try {
   FC_ASSERT( !_stack.empty(), "There is no undo session to revert" );

   undo_state& state = _stack.back();

   for( const object_id_type& id : state.new_ids )
      _db.get_mutable_index( id ).remove( _db.get_object( id ) );

   for( auto& item : state.old_values )
   {
      const object_id_type id = item.second->id;
      _db.get_mutable_index( id ).modify( _db.get_object( id ), [&]( object& obj ){ obj.move_from( *item.second ); } );
   }

   for( auto& item : state.old_index_next_ids )
      _db.get_mutable_index( item.second.space(), item.second.type() ).set_next_id( item.second );

   for( auto& item : state.removed )
   {
      const object_id_type id = item.second->id;
      _db.get_mutable_index( id ).insert( std::move( *item.second ) );
   }

   _stack.pop_back();
} FC_CAPTURE_AND_RETHROW() }

void undo_database::merge()
{
   FC_ASSERT( !_stack.empty(), "There is no undo session to merge" );
   if( _stack.size() == 1 )
   {
      _stack.pop_back();
      return;
   }

   auto& state = _stack.back();
   auto& prev_state = _stack[_stack.size()-2];

   // An object's relationship to a state can be:
   // in new_ids            : new
   // in old_values (was=X) : upd(was=X)
   // in removed (was=X)    : del(was=X)
   // not in any of above   : nop
   //
   // When merging A=prev_state and B=state the earliest recorded value of
   // each object wins, and an object created in A and removed in B was never
   // there at all.

   for( auto& obj : state.old_values )
   {
      const object_id_type id = obj.second->id;
      if( prev_state.new_ids.find( id ) != prev_state.new_ids.end() )
         continue;
      if( prev_state.old_values.find( id ) == prev_state.old_values.end() )
         prev_state.old_values[id] = std::move( obj.second );
   }

   for( const object_id_type& id : state.new_ids )
      prev_state.new_ids.insert( id );

   for( auto& item : state.old_index_next_ids )
   {
      if( prev_state.old_index_next_ids.find( item.first ) == prev_state.old_index_next_ids.end() )
         prev_state.old_index_next_ids[item.first] = item.second;
   }

   for( auto& obj : state.removed )
   {
      const object_id_type id = obj.second->id;
      if( prev_state.new_ids.find( id ) != prev_state.new_ids.end() )
      {
         prev_state.new_ids.erase( id );
         continue;
      }
      auto it = prev_state.old_values.find( id );
      if( it != prev_state.old_values.end() )
      {
         prev_state.removed[id] = std::move( it->second );
         prev_state.old_values.erase( id );
         continue;
      }
      if( prev_state.removed.find( id ) == prev_state.removed.end() )
         prev_state.removed[id] = std::move( obj.second );
   }

   _stack.pop_back();
}

void undo_database::commit()
{
   // Without blocks there is nothing to keep a committed state around for
   merge();
}

} } // infusion::db
