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
#include <infusion/db/object_id.hpp>

#include <memory>

namespace infusion { namespace db {

   /**
    *  @brief base for all database objects
    *
    *  The object is the fundamental building block of the database and
    *  is the level upon which undo/redo operations are performed.  Objects
    *  are used to track data and their relationships and provide an efficient
    *  means to find and update information.
    *
    *  Objects are assigned a unique and sequential object ID by the database
    *  within the id_space defined in the object.
    *
    *  All objects must be serializable via FC_REFLECT() and their content
    *  must be fully determined by their reflected fields.
    */
   class object
   {
      public:
         object(){}
         virtual ~object(){}

         // serialized
         object_id_type id;

         /// these methods are implemented for derived classes by inheriting abstract_object<DerivedClass>
         virtual std::unique_ptr<object> clone()const = 0;
         virtual void                    move_from( object& obj ) = 0;
   };

   /**
    * @class abstract_object
    * @brief   Use the Curiously Recurring Template Pattern to automatically add the ability to
    *  clone() any object in a type safe manner.
    */
   template<typename DerivedClass>
   class abstract_object : public object
   {
      public:
         virtual std::unique_ptr<object> clone()const
         {
            return std::unique_ptr<object>( new DerivedClass( *static_cast<const DerivedClass*>(this) ) );
         }

         virtual void move_from( object& obj )
         {
            static_cast<DerivedClass&>(*this) = std::move( static_cast<DerivedClass&>(obj) );
         }
   };

} } // infusion::db

FC_REFLECT( infusion::db::object, (id) )
