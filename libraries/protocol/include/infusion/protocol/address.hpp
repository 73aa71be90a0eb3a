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
#include <infusion/protocol/types.hpp>

#include <fc/crypto/sha256.hpp>

namespace infusion { namespace protocol {

   /**
    *  @brief a 32 byte identity in the ledger
    *
    *  Accounts are addresses handed to us by the host.  Objects that must be
    *  found again from their name alone (the creator, the Aura asset,
    *  collections, tokens and token balance stores) have addresses derived
    *  from a parent address and a seed.
    *
    *  The textual form is "0x" followed by 64 hex digits.  Shorter hex forms
    *  are accepted and left padded with zeros.
    */
   class address
   {
      public:
         address(){} ///< constructs null address
         explicit address( const fc::sha256& a ):addr(a){}
         explicit address( const std::string& hex );

         /**
          *  SHA-256 over the parent bytes, the seed bytes and the
          *  INFUSION_OBJECT_FROM_SEED_SCHEME byte.
          */
         static address derive( const address& parent, const std::string& seed );

         bool is_null()const { return addr == fc::sha256(); }

         explicit operator std::string()const; ///< converts to "0x" hex form

         friend size_t hash_value( const address& v ) { return v.addr._hash[3]; }
         friend bool operator == ( const address& a, const address& b ) { return a.addr == b.addr; }
         friend bool operator != ( const address& a, const address& b ) { return a.addr != b.addr; }
         friend bool operator <  ( const address& a, const address& b ) { return a.addr <  b.addr; }

         fc::sha256 addr;
   };

} } // infusion::protocol

namespace fc
{
   void to_variant( const infusion::protocol::address& var, fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var, infusion::protocol::address& vo, uint32_t max_depth = 1 );
}

namespace std
{
   template<>
   struct hash<infusion::protocol::address>
   {
      public:
         size_t operator()( const infusion::protocol::address& a )const
         {
            return hash_value( a );
         }
   };
}

FC_REFLECT( infusion::protocol::address, (addr) )
