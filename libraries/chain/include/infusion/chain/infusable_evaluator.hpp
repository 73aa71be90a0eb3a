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

#include <infusion/chain/evaluator.hpp>
#include <infusion/protocol/infusable.hpp>

namespace infusion {
   namespace chain {
      class infusable_token_object;

      class fuse_block_mint_evaluator : public evaluator<fuse_block_mint_evaluator> {
      public:
         typedef fuse_block_mint_operation operation_type;

         void_result do_evaluate(const fuse_block_mint_operation &o);

         address do_apply(const fuse_block_mint_operation &o);
      };

      class item_mint_evaluator : public evaluator<item_mint_evaluator> {
      public:
         typedef item_mint_operation operation_type;

         void_result do_evaluate(const item_mint_operation &o);

         address do_apply(const item_mint_operation &o);
      };

      class token_qualify_evaluator : public evaluator<token_qualify_evaluator> {
      public:
         typedef token_qualify_operation operation_type;

         void_result do_evaluate(const token_qualify_operation &o);

         void_result do_apply(const token_qualify_operation &o);

         const infusable_token_object* _token = nullptr;
      };

      class token_override_transfer_evaluator : public evaluator<token_override_transfer_evaluator> {
      public:
         typedef token_override_transfer_operation operation_type;

         void_result do_evaluate(const token_override_transfer_operation &o);

         void_result do_apply(const token_override_transfer_operation &o);

         const infusable_token_object* _token = nullptr;
      };

      class token_burn_evaluator : public evaluator<token_burn_evaluator> {
      public:
         typedef token_burn_operation operation_type;

         void_result do_evaluate(const token_burn_operation &o);

         void_result do_apply(const token_burn_operation &o);

         const infusable_token_object* _token = nullptr;
      };

      class token_infuse_evaluator : public evaluator<token_infuse_evaluator> {
      public:
         typedef token_infuse_operation operation_type;

         void_result do_evaluate(const token_infuse_operation &o);

         void_result do_apply(const token_infuse_operation &o);

         const infusable_token_object* _token = nullptr;
      };

   } // namespace chain
} // namespace infusion
