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
#include <infusion/db/index.hpp>
#include <infusion/db/undo_database.hpp>

#include <map>

namespace infusion { namespace db {

   /**
    *   @class object_database
    *   @brief maintains a set of indexed objects that can be modified with multi-level rollback support
    */
   class object_database
   {
      public:
         object_database();
         ~object_database();

         void reset_indexes() { _index.clear(); }

         template<typename T, typename F>
         const T& create( F&& constructor )
         {
            auto& idx = get_mutable_index<T>();
            const object& result = idx.create( [&]( object& o )
            {
               constructor( static_cast<T&>(o) );
            } );
            _undo_db.on_create( result );
            return static_cast<const T&>( result );
         }

         template<typename T, typename Lambda>
         void modify( const T& obj, const Lambda& m )
         {
            _undo_db.on_modify( obj );
            get_mutable_index( obj.id ).modify( obj, [&m]( object& o ){ m( static_cast<T&>(o) ); } );
         }

         void remove( const object& obj )
         {
            _undo_db.on_remove( obj );
            get_mutable_index( obj.id ).remove( obj );
         }

         const object& get_object( object_id_type id )const;
         const object* find_object( object_id_type id )const;

         template<typename T>
         const T* find( object_id_type id )const
         {
            const object* obj = find_object( id );
            if( obj == nullptr ) return nullptr;
            FC_ASSERT( dynamic_cast<const T*>( obj ) != nullptr, "Object ${id} has an unexpected type", ("id",id) );
            return static_cast<const T*>( obj );
         }

         template<typename T>
         const T& get( object_id_type id )const
         {
            const T* obj = find<T>( id );
            FC_ASSERT( obj != nullptr, "Unable to find Object ${id}", ("id",id) );
            return *obj;
         }

         template<typename IndexType>
         IndexType* add_index()
         {
            typedef typename IndexType::object_type ObjectType;
            const uint16_t key = object_id_type( ObjectType::space_id, ObjectType::type_id, 0 ).space_type();
            FC_ASSERT( _index.find( key ) == _index.end(), "An index for object type ${k} was already added", ("k",key) );
            IndexType* new_index = new IndexType();
            _index[key].reset( new_index );
            return new_index;
         }

         template<typename IndexType>
         const IndexType& get_index_type()const
         {
            typedef typename IndexType::object_type ObjectType;
            return static_cast<const IndexType&>( get_index( ObjectType::space_id, ObjectType::type_id ) );
         }

         const index& get_index( uint8_t space_id, uint8_t type_id )const;
         const index& get_index( object_id_type id )const { return get_index( id.space(), id.type() ); }

      protected:
         template<typename T>
         index& get_mutable_index() { return get_mutable_index( T::space_id, T::type_id ); }
         index& get_mutable_index( object_id_type id ) { return get_mutable_index( id.space(), id.type() ); }
         index& get_mutable_index( uint8_t space_id, uint8_t type_id );

      private:
         friend class undo_database;

         std::map< uint16_t, std::unique_ptr<index> > _index;

      public:
         undo_database _undo_db;
   };

} } // infusion::db
