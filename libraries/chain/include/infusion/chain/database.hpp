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
#include <infusion/chain/account_balance_object.hpp>
#include <infusion/chain/asset_object.hpp>
#include <infusion/chain/aura_unit.hpp>
#include <infusion/chain/creator.hpp>
#include <infusion/chain/evaluator.hpp>
#include <infusion/chain/genesis_state.hpp>
#include <infusion/chain/global_property_object.hpp>
#include <infusion/chain/infusable_object.hpp>

#include <infusion/db/object_database.hpp>
#include <infusion/protocol/transaction.hpp>

#include <fc/log/logger.hpp>

namespace infusion { namespace chain {
   using infusion::db::object_id_type;
   using infusion::db::object;

   class op_evaluator;
   class transaction_evaluation_state;

   /**
    *   @class database
    *   @brief tracks the Aura ledger and the infusable token registry
    *
    *   Every operation reaches the state through this class.  Transactions are
    *   applied by push_transaction(), which runs them inside one undo session:
    *   either every operation takes effect or none does.
    */
   class database : public db::object_database
   {
      public:
         //////////////////// db_management.cpp ////////////////////

         database();
         ~database();

         //////////////////// db_init.cpp ////////////////////

         /**
          * Apply the deployment configuration: record the admin, initialize the
          * creator, create the Aura asset and both collections and issue the
          * initial balances.  May only be called once.
          */
         void init_genesis( const genesis_state_type& genesis_state );

         //////////////////// db_block.cpp ////////////////////

         /**
          * Validate @p trx, check that every actor is among its signers and
          * apply its operations.  On failure nothing is changed and the
          * exception is rethrown.
          */
         processed_transaction push_transaction( const signed_transaction& trx );

         operation_result apply_operation( transaction_evaluation_state& eval_state, const operation& op );

         //////////////////// db_getter.cpp ////////////////////

         bool                             is_initialized()const;
         const global_property_object&    get_global_properties()const;
         const creator_object&            get_creator()const;
         const asset_object&              get_aura()const;
         const asset_dynamic_data_object& get_aura_dynamic_data()const;

         const collection_object&         get_collection( token_kind kind )const;

         /// @return nullptr if there is no token at @p token
         const infusable_token_object*    find_token( const address& token )const;
         /// Throws not_found_exception if there is no token at @p token
         const infusable_token_object&    get_token( const address& token )const;
         vector<const infusable_token_object*> get_tokens_by_owner( const address& owner )const;

         /// Address the token with @p sequence in the collection of @p kind has, minted or not
         address                          token_address_for( token_kind kind, uint64_t sequence )const;

         //////////////////// db_balance.cpp ////////////////////

         /**
          * @brief Retrieve a particular account's Aura balance
          * @param owner Account or balance store whose balance should be retrieved
          * @return @p owner's balance, zero if it has no entry
          */
         share_type get_balance( const address& owner )const;
         bool       is_frozen( const address& owner )const;
         const account_balance_object* find_balance_entry( const address& owner )const;

         /**
          * @brief Adjust a particular account's balance in Aura by a delta
          * @param owner Account whose balance should be adjusted
          * @param delta Amount to adjust balance by
          *
          * Ignores the frozen flag.  Throws insufficient_balance_exception
          * rather than letting a balance go negative.
          */
         void adjust_balance( const address& owner, share_type delta );

         /// Idempotent.  Freezing an account without an entry creates an empty one.
         void set_frozen( const address& owner, bool frozen );

         /// Creates new supply in @p to.  Only the creator can sign for it.
         void issue_aura( const creator_signer& signer, const address& to, share_type amount );
         void retire_aura( const address& from, share_type amount );

         /**
          * Take @p amount out of @p from.  Unless @p ignore_freeze is set a
          * frozen account cannot be withdrawn from.
          */
         aura_unit withdraw_aura( const address& from, share_type amount, bool ignore_freeze = false );
         /// Depositing an empty unit changes nothing
         void      deposit_aura( aura_unit&& unit, const address& to, bool ignore_freeze = false );
         /// Throws invariant_violation_exception unless @p unit is empty
         void      destroy_zero( aura_unit&& unit );
         /// Checks @p to before withdrawing, so a rejected transfer takes nothing from @p from
         void      transfer_aura( const address& from, const address& to, share_type amount, bool ignore_freeze = false );

         //////////////////// db_infusable.cpp ////////////////////

         const collection_object&      create_collection( const creator_signer& signer, token_kind kind,
                                                          const genesis_state_type::initial_collection_type& c );

         /**
          * Create the next token of @p kind owned by @p caller and move
          * @p amount of the caller's Aura into it.  The minimum infusion is
          * enforced by the evaluators.
          */
         const infusable_token_object& mint_infusable_token( const creator_signer& signer, token_kind kind,
                                                             const address& caller, share_type amount,
                                                             const optional<address>& origin );
         void       qualify_token( const infusable_token_object& token );
         void       transfer_token( const infusable_token_object& token, const address& new_owner );
         /// Returns the Aura released to the owner.  @p token is removed.
         share_type burn_token( const infusable_token_object& token );
         /**
          * Move @p amount from @p from into the balance store of @p token.  The
          * store's frozen flag is never checked.  @p ignore_freeze applies to
          * @p from only.
          */
         void       infuse_token( const address& from, const infusable_token_object& token, share_type amount,
                                  bool ignore_freeze = false );

         /// The balance store of the token at @p target, or @p target itself when it is not a token
         address    aura_receiver( const address& target )const;

      private:
         //////////////////// db_init.cpp ////////////////////

         void initialize_indexes();
         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            _operation_evaluators[
               operation::tag<typename EvaluatorType::operation_type>::value].reset( new op_evaluator_impl<EvaluatorType>() );
         }

         const asset_object& create_aura( const creator_signer& signer, const genesis_state_type::initial_asset_type& a );

         processed_transaction _apply_transaction( const signed_transaction& trx );

         vector< std::unique_ptr<op_evaluator> > _operation_evaluators;
   };

} }
