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
#include <infusion/protocol/aura.hpp>

namespace infusion { namespace chain {

   class infusable_token_object;

   class aura_mint_evaluator : public evaluator<aura_mint_evaluator>
   {
      public:
         typedef aura_mint_operation operation_type;

         void_result do_evaluate( const aura_mint_operation& o );
         void_result do_apply( const aura_mint_operation& o );
   };

   class aura_burn_evaluator : public evaluator<aura_burn_evaluator>
   {
      public:
         typedef aura_burn_operation operation_type;

         void_result do_evaluate( const aura_burn_operation& o );
         void_result do_apply( const aura_burn_operation& o );
   };

   class aura_override_transfer_evaluator : public evaluator<aura_override_transfer_evaluator>
   {
      public:
         typedef aura_override_transfer_operation operation_type;

         void_result do_evaluate( const aura_override_transfer_operation& o );
         void_result do_apply( const aura_override_transfer_operation& o );

         bool _ignore_freeze = false;
         /// Set when the receiver is a token
         const infusable_token_object* _token = nullptr;
   };

   class aura_transfer_evaluator : public evaluator<aura_transfer_evaluator>
   {
      public:
         typedef aura_transfer_operation operation_type;

         void_result do_evaluate( const aura_transfer_operation& o );
         void_result do_apply( const aura_transfer_operation& o );

         const infusable_token_object* _token = nullptr;
   };

   class aura_freeze_evaluator : public evaluator<aura_freeze_evaluator>
   {
      public:
         typedef aura_freeze_operation operation_type;

         void_result do_evaluate( const aura_freeze_operation& o );
         void_result do_apply( const aura_freeze_operation& o );
   };

   class aura_unfreeze_evaluator : public evaluator<aura_unfreeze_evaluator>
   {
      public:
         typedef aura_unfreeze_operation operation_type;

         void_result do_evaluate( const aura_unfreeze_operation& o );
         void_result do_apply( const aura_unfreeze_operation& o );
   };

   class aura_infuse_evaluator : public evaluator<aura_infuse_evaluator>
   {
      public:
         typedef aura_infuse_operation operation_type;

         void_result do_evaluate( const aura_infuse_operation& o );
         void_result do_apply( const aura_infuse_operation& o );

         const infusable_token_object* _token = nullptr;
   };

} } // infusion::chain
