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
#include <infusion/protocol/infusable.hpp>

#include <fc/exception/exception.hpp>

namespace infusion {
   namespace protocol {
      // The minimum infusion is configured at genesis and is checked by the
      // evaluators, so the mint amounts are only bounded from above here.

      void fuse_block_mint_operation::validate() const {
         FC_ASSERT(!caller.is_null(), "The minting account must be named");
         FC_ASSERT(amount <= INFUSION_MAX_SHARE_SUPPLY, "The amount to infuse is too large");
      }

      void item_mint_operation::validate() const {
         FC_ASSERT(!caller.is_null(), "The minting account must be named");
         FC_ASSERT(amount <= INFUSION_MAX_SHARE_SUPPLY, "The amount to infuse is too large");
         if (origin.valid()) {
            FC_ASSERT(!origin->is_null(), "The originating FuseBlock should not be the null address");
         }
      }

      void token_qualify_operation::validate() const {
         FC_ASSERT(!admin.is_null(), "The admin must be named");
         FC_ASSERT(!token.is_null(), "The token to qualify must be named");
      }

      void token_override_transfer_operation::validate() const {
         FC_ASSERT(!admin.is_null(), "The admin must be named");
         FC_ASSERT(!token.is_null(), "The token to transfer must be named");
         FC_ASSERT(!new_owner.is_null(), "The new owner must be named");
      }

      void token_burn_operation::validate() const {
         FC_ASSERT(!owner.is_null(), "The owner must be named");
         FC_ASSERT(!token.is_null(), "The token to burn must be named");
      }

      void token_infuse_operation::validate() const {
         FC_ASSERT(!caller.is_null(), "The infusing account must be named");
         FC_ASSERT(!token.is_null(), "The token to infuse must be named");
         FC_ASSERT(amount > 0, "The amount to infuse should be positive");
      }
   }
}
