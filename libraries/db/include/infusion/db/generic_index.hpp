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

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/mem_fun.hpp>

#include <exception>
#include <type_traits>

namespace infusion { namespace db {

   using boost::multi_index_container;
   using namespace boost::multi_index;

   struct by_id;

   /**
    *  Almost all objects can be tracked and managed via a boost::multi_index container that uses
    *  an unordered_unique key on the object ID.  This template class adapts the generic index interface
    *  to work with arbitrary boost multi_index containers on the same type.
    */
   template<typename ObjectType, typename MultiIndexType>
   class generic_index : public index
   {
      public:
         typedef MultiIndexType index_type;
         typedef ObjectType     object_type;

         static_assert( std::is_same<typename MultiIndexType::key_type, object_id_type>::value,
                        "First index of MultiIndexType MUST be object_id_type!" );

         generic_index()
            : _next_id( ObjectType::space_id, ObjectType::type_id, 0 ) {}

         virtual uint8_t object_space_id()const override { return ObjectType::space_id; }
         virtual uint8_t object_type_id()const override  { return ObjectType::type_id; }

         virtual object_id_type get_next_id()const override          { return _next_id; }
         virtual void           use_next_id() override               { ++_next_id.number; }
         virtual void           set_next_id( object_id_type id ) override { _next_id = id; }

         virtual const object& insert( object&& obj ) override
         {
            FC_ASSERT( dynamic_cast<ObjectType*>( &obj ) != nullptr, "Object ${id} has the wrong type for this index", ("id",obj.id) );
            auto insert_result = _indices.insert( std::move( static_cast<ObjectType&>( obj ) ) );
            FC_ASSERT( insert_result.second, "Could not insert object, most likely a uniqueness constraint was violated" );
            return *insert_result.first;
         }

         virtual const object& create( const std::function<void(object&)>& constructor ) override
         {
            ObjectType item;
            item.id = get_next_id();
            constructor( item );
            auto insert_result = _indices.insert( std::move( item ) );
            FC_ASSERT( insert_result.second, "Could not create object! Most likely a uniqueness constraint is violated." );
            use_next_id();
            return *insert_result.first;
         }

         virtual void modify( const object& obj, const std::function<void(object&)>& m ) override
         {
            FC_ASSERT( dynamic_cast<const ObjectType*>( &obj ) != nullptr, "Object ${id} has the wrong type for this index", ("id",obj.id) );
            std::exception_ptr exc;
            auto ok = _indices.modify( _indices.iterator_to( static_cast<const ObjectType&>( obj ) ),
                                       [&m, &exc]( ObjectType& o ) mutable {
                                          // the multi_index modifier must not throw, the failure is raised below
                                          try {
                                             m( o );
                                          } catch( ... ) {
                                             exc = std::current_exception();
                                          }
                                       } );
            if( exc )
               std::rethrow_exception( exc );
            FC_ASSERT( ok, "Could not modify object, most likely an index constraint was violated" );
         }

         virtual void remove( const object& obj ) override
         {
            _indices.erase( _indices.iterator_to( static_cast<const ObjectType&>( obj ) ) );
         }

         virtual const object* find( object_id_type id )const override
         {
            auto itr = _indices.find( id );
            if( itr == _indices.end() ) return nullptr;
            return &*itr;
         }

         virtual size_t size()const override { return _indices.size(); }

         const index_type& indices()const { return _indices; }

      private:
         object_id_type _next_id;
         index_type     _indices;
   };

} } // infusion::db
