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
#include <infusion/db/object.hpp>

#include <fc/log/logger.hpp>

#include <deque>
#include <map>
#include <set>

namespace infusion { namespace db {

   class object_database;

   /**
    *  Everything needed to put the database back the way it was when the
    *  state was pushed.
    */
   struct undo_state
   {
      std::map<object_id_type, std::unique_ptr<object>> old_values;
      std::map<uint16_t, object_id_type>                 old_index_next_ids;
      std::set<object_id_type>                           new_ids;
      std::map<object_id_type, std::unique_ptr<object>> removed;
   };

   /**
    * @class undo_database
    * @brief tracks changes to the state and allows changes to be undone
    *
    * Every create, modify and remove made through the object_database while a
    * session is open is recorded against the innermost session.  Changes made
    * while no session is open cannot be undone.
    */
   class undo_database
   {
      public:
         undo_database( object_database& db ):_db(db){}

         class session
         {
            public:
               session( session&& mv )
               :_db(mv._db),_apply_undo(mv._apply_undo)
               {
                  mv._apply_undo = false;
               }
               ~session() {
                  try {
                     if( _apply_undo ) _db.undo();
                  }
                  catch ( const fc::exception& e )
                  {
                     elog( "${e}", ("e",e.to_detail_string() ) );
                     throw; // the database is left in an unknown state
                  }
               }

               /** Keep the changes.  A nested session folds them into its parent. */
               void commit() { if( _apply_undo ) _db.commit(); _apply_undo = false; }
               void undo()   { if( _apply_undo ) _db.undo();   _apply_undo = false; }
               void merge()  { if( _apply_undo ) _db.merge();  _apply_undo = false; }

               session& operator = ( session&& mv )
               { try {
                  if( this == &mv ) return *this;
                  if( _apply_undo ) _db.undo();
                  _apply_undo = mv._apply_undo;
                  mv._apply_undo = false;
                  return *this;
               } FC_CAPTURE_AND_RETHROW() }

            private:
               friend class undo_database;
               session( undo_database& db ): _db(db) {}
               undo_database& _db;
               bool _apply_undo = true;
         };

         session start_undo_session();

         void on_create( const object& obj );
         void on_modify( const object& obj );
         void on_remove( const object& obj );

         /** Reverts every change recorded by the innermost session and pops it. */
         void undo();
         /** Folds the innermost session into the one below it. */
         void merge();
         void commit();

         std::size_t size()const { return _stack.size(); }
         bool        has_active_session()const { return !_stack.empty(); }

      private:
         std::deque<undo_state> _stack;
         object_database&       _db;
   };

} } // infusion::db
