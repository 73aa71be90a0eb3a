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
#include <infusion/protocol/aura.hpp>
#include <infusion/protocol/base.hpp>
#include <infusion/protocol/infusable.hpp>

namespace infusion { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef fc::static_variant<
            aura_mint_operation,               // 0
            aura_burn_operation,
            aura_override_transfer_operation,
            aura_transfer_operation,
            aura_freeze_operation,
            aura_unfreeze_operation,           // 5
            aura_infuse_operation,
            fuse_block_mint_operation,
            item_mint_operation,
            token_qualify_operation,
            token_override_transfer_operation, // 10
            token_burn_operation,
            token_infuse_operation
         > operation;

   /// Mints report the address of the new token
   typedef fc::static_variant< void_result, address > operation_result;

   /**
    *  Appends required authorities to the result set.
    */
   void operation_get_required_authorities( const operation& op, flat_set<address>& result );

   void operation_validate( const operation& op );

} } // infusion::protocol

FC_REFLECT_TYPENAME( infusion::protocol::operation )
FC_REFLECT_TYPENAME( infusion::protocol::operation_result )
