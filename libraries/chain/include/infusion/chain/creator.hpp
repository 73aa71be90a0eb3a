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
#include <infusion/chain/creator_object.hpp>

namespace infusion { namespace chain {

   class database;
   class aura_mint_evaluator;
   class fuse_block_mint_evaluator;
   class item_mint_evaluator;

   /**
    *  @brief The creator's acting identity
    *
    *  Issuing Aura and creating collections and tokens require a signer.
    *  A signer can only be produced by creator::act_as_creator(), which is
    *  reserved to the operations listed as friends of creator.
    */
   class creator_signer
   {
      public:
         const address& get_address()const { return _address; }

      private:
         friend class creator;
         explicit creator_signer( const address& a ) : _address( a ) {}

         address _address;
   };

   /**
    *  @brief Delegated signer that owns the Aura asset and both collections
    */
   class creator
   {
      public:
         /**
          *  Create the creator_object for @p admin.  Throws
          *  already_initialized_exception if a creator already exists.
          */
         static const creator_object& initialize( database& db, const address& admin );

         /// Address the creator of @p admin acts as
         static address derive_address( const address& admin );

      private:
         /// Requires an initialized creator
         static creator_signer act_as_creator( const database& db );

         friend class database;
         friend class aura_mint_evaluator;
         friend class fuse_block_mint_evaluator;
         friend class item_mint_evaluator;
   };

} } // infusion::chain
