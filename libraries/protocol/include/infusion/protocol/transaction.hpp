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
#include <infusion/protocol/operations.hpp>

namespace infusion { namespace protocol {

   /**
    * @defgroup transactions Transactions
    *
    * All transactions are sets of operations that must be applied atomically.
    * Either every operation takes effect or the ledger is left exactly as it
    * was before the transaction.
    */

   /**
    *  @brief groups operations that should be applied atomically
    */
   struct transaction
   {
      vector<operation> operations;

      /// Stateless checks of the transaction and every operation in it
      void validate()const;

      void get_required_authorities( flat_set<address>& result )const;

      void clear() { operations.clear(); }
   };

   /**
    *  @brief adds the identities the host has authenticated for a transaction
    *
    *  Signature checking belongs to the host.  The ledger only checks that the
    *  actor of every operation is among the authenticated identities.
    */
   struct signed_transaction : public transaction
   {
      signed_transaction( const transaction& trx = transaction() )
         : transaction(trx){}

      /// Throws tx_missing_authority naming the first actor not among the signers
      void verify_authority()const;

      void clear() { operations.clear(); signers.clear(); }

      flat_set<address> signers;
   };

   /**
    *  @brief captures the result of evaluating the operations contained in the transaction
    */
   struct processed_transaction : public signed_transaction
   {
      processed_transaction( const signed_transaction& trx = signed_transaction() )
         : signed_transaction(trx){}

      vector<operation_result> operation_results;
   };

} } // infusion::protocol

FC_REFLECT( infusion::protocol::transaction, (operations) )
FC_REFLECT_DERIVED( infusion::protocol::signed_transaction, (infusion::protocol::transaction), (signers) )
FC_REFLECT_DERIVED( infusion::protocol::processed_transaction, (infusion::protocol::signed_transaction), (operation_results) )
