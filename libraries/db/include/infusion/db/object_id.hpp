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
#include <fc/exception/exception.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/variant.hpp>

#include <functional>

namespace infusion { namespace db {
   using std::string;

   /**
    *  @brief identifies an object held by the object_database
    *
    *  The 64 bit number packs the space (8 bits), the type within the space
    *  (8 bits) and the instance (48 bits).  Instances are assigned by the
    *  index that owns the type and are never reused while an object with the
    *  same number can still be restored by the undo database.
    */
   struct object_id_type
   {
      object_id_type( uint8_t s, uint8_t t, uint64_t i )
      {
         FC_ASSERT( i >> 48 == 0, "instance overflow", ("instance",i) );
         number = (uint64_t(s)<<56) | (uint64_t(t)<<48) | i;
      }
      object_id_type(){ number = 0; }

      uint8_t  space()const       { return number >> 56;              }
      uint8_t  type()const        { return number >> 48 & 0x00ff;     }
      uint16_t space_type()const  { return number >> 48;              }
      uint64_t instance()const    { return number & 0x0000ffffffffffffULL; }
      bool     is_null()const     { return number == 0; }
      explicit operator uint64_t()const { return number; }

      friend bool operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool operator <  ( const object_id_type& a, const object_id_type& b ) { return a.number < b.number; }

      object_id_type& operator++(int) { ++number; return *this; }
      object_id_type& operator++()    { ++number; return *this; }

      explicit operator string()const
      {
         return fc::to_string(space()) + "." + fc::to_string(type()) + "." + fc::to_string(instance());
      }

      uint64_t number;
   };

} } // infusion::db

namespace fc {
   void to_variant( const infusion::db::object_id_type& var, fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var, infusion::db::object_id_type& vo, uint32_t max_depth = 1 );
}

namespace std {
   template<> struct hash<infusion::db::object_id_type>
   {
      size_t operator()( const infusion::db::object_id_type& x )const
      {
         return std::hash<uint64_t>()( x.number );
      }
   };
}

FC_REFLECT_TYPENAME( infusion::db::object_id_type )
