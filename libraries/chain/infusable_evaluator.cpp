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
#include <infusion/chain/access_control.hpp>
#include <infusion/chain/creator.hpp>
#include <infusion/chain/database.hpp>
#include <infusion/chain/exceptions.hpp>
#include <infusion/chain/infusable_evaluator.hpp>
#include <infusion/chain/infusable_object.hpp>

namespace infusion {
   namespace chain {
      namespace {
         // Checks shared by both entry points of mint_to
         void evaluate_infusion(const database &d, const address &caller, const share_type &amount) {
            // Verify the infusion meets the configured minimum
            const share_type &minimum = d.get_global_properties().minimum_infusion;
            INFUSION_ASSERT(amount >= minimum, below_minimum_infusion_exception,
                            "An infusion of ${amount} is below the minimum of ${min}",
                            ("amount", amount)("min", minimum));

            // Verify the caller may spend
            INFUSION_ASSERT(!d.is_frozen(caller), account_frozen_exception,
                            "Account ${a} is frozen", ("a", caller));

            // Verify the caller can pay for the infusion
            const share_type balance = d.get_balance(caller);
            INFUSION_ASSERT(balance >= amount, insufficient_aura_exception,
                            "Insufficient Aura: ${caller}'s balance of ${b} is less than required ${r}",
                            ("caller", caller)("b", balance)("r", amount));
         }
      }

      void_result fuse_block_mint_evaluator::do_evaluate(const fuse_block_mint_operation &op) {
         try {
            evaluate_infusion(db(), op.caller, op.amount);
            return void_result();

         } FC_CAPTURE_AND_RETHROW((op))
      }

      address fuse_block_mint_evaluator::do_apply(const fuse_block_mint_operation &op) {
         try {
            infusion::chain::database &d = db();

            const infusable_token_object &token = d.mint_infusable_token(creator::act_as_creator(d),
                                                                         token_kind::fuse_block,
                                                                         op.caller, op.amount,
                                                                         optional<address>());
            return token.token_address;

         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result item_mint_evaluator::do_evaluate(const item_mint_operation &op) {
         try {
            const infusion::chain::database &d = db();

            evaluate_infusion(d, op.caller, op.amount);

            // Verify the existence of the originating FuseBlock
            // Ownership of the FuseBlock is not required
            if (op.origin.valid()) {
               const infusable_token_object *origin = d.find_token(*op.origin);
               INFUSION_ASSERT(origin != nullptr && origin->kind == token_kind::fuse_block, not_found_exception,
                               "FuseBlock ${origin} does not exist", ("origin", *op.origin));
            }

            return void_result();

         } FC_CAPTURE_AND_RETHROW((op))
      }

      address item_mint_evaluator::do_apply(const item_mint_operation &op) {
         try {
            infusion::chain::database &d = db();

            const infusable_token_object &token = d.mint_infusable_token(creator::act_as_creator(d),
                                                                         token_kind::item,
                                                                         op.caller, op.amount,
                                                                         op.origin);
            return token.token_address;

         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result token_qualify_evaluator::do_evaluate(const token_qualify_operation &op) {
         try {
            const infusion::chain::database &d = db();

            // Verify the caller is the admin
            assert_admin(d, op.admin);

            // Verify the existence of the token
            _token = &d.get_token(op.token);

            return void_result();

         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result token_qualify_evaluator::do_apply(const token_qualify_operation &op) {
         try {
            db().qualify_token(*_token);
            return void_result();

         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result token_override_transfer_evaluator::do_evaluate(const token_override_transfer_operation &op) {
         try {
            const infusion::chain::database &d = db();

            // Verify the caller is the admin
            assert_admin(d, op.admin);

            // Verify the existence of the token
            _token = &d.get_token(op.token);

            // Verify the token has been qualified for admin transfers
            INFUSION_ASSERT(_token->qualifies, not_qualified_exception,
                            "${name} has not been qualified", ("name", _token->name)("token", op.token));

            return void_result();

         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result token_override_transfer_evaluator::do_apply(const token_override_transfer_operation &op) {
         try {
            db().transfer_token(*_token, op.new_owner);
            return void_result();

         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result token_burn_evaluator::do_evaluate(const token_burn_operation &op) {
         try {
            const infusion::chain::database &d = db();

            // Verify the existence of the token
            _token = &d.get_token(op.token);

            // Verify the caller owns the token
            INFUSION_ASSERT(_token->owner == op.owner, not_owner_exception,
                            "${caller} does not own ${name}",
                            ("caller", op.owner)("name", _token->name)("owner", _token->owner));

            // Verify the owner can receive the extracted Aura
            INFUSION_ASSERT(!d.is_frozen(op.owner), account_frozen_exception,
                            "Account ${a} is frozen", ("a", op.owner));

            return void_result();

         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result token_burn_evaluator::do_apply(const token_burn_operation &op) {
         try {
            infusion::chain::database &d = db();

            const string name = _token->name;
            const share_type extracted = d.burn_token(*_token);
            _token = nullptr;
            dlog("${owner} burned ${name} and extracted ${amount}",
                 ("owner", op.owner)("name", name)("amount", extracted));

            return void_result();

         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result token_infuse_evaluator::do_evaluate(const token_infuse_operation &op) {
         try {
            const infusion::chain::database &d = db();

            // Verify the existence of the token
            _token = &d.get_token(op.token);

            // Verify the caller may spend
            INFUSION_ASSERT(!d.is_frozen(op.caller), account_frozen_exception,
                            "Account ${a} is frozen", ("a", op.caller));

            // Verify the caller can pay for the infusion
            const share_type balance = d.get_balance(op.caller);
            INFUSION_ASSERT(balance >= op.amount, insufficient_aura_exception,
                            "Insufficient Aura: ${caller}'s balance of ${b} is less than required ${r}",
                            ("caller", op.caller)("b", balance)("r", op.amount));

            return void_result();

         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result token_infuse_evaluator::do_apply(const token_infuse_operation &op) {
         try {
            db().infuse_token(op.caller, *_token, op.amount);
            return void_result();

         } FC_CAPTURE_AND_RETHROW((op))
      }

   } // namespace chain
} // namespace infusion
