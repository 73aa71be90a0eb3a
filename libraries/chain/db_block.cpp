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
#include <infusion/chain/database.hpp>
#include <infusion/chain/evaluator.hpp>
#include <infusion/chain/exceptions.hpp>
#include <infusion/chain/transaction_evaluation_state.hpp>

#include <fc/log/logger.hpp>

namespace infusion { namespace chain {

processed_transaction database::push_transaction( const signed_transaction& trx )
{
   try
   {
      auto session = _undo_db.start_undo_session();
      processed_transaction result = _apply_transaction( trx );
      session.commit();
      return result;
   }
   catch( const fc::exception& e )
   {
      dlog( "Rejected transaction: ${e}", ("e",e.to_string()) );
      throw;
   }
}

processed_transaction database::_apply_transaction( const signed_transaction& trx )
{ try {
   FC_ASSERT( is_initialized(), "Genesis has not been applied" );

   trx.validate();
   trx.verify_authority();

   transaction_evaluation_state eval_state( this );
   eval_state._trx = &trx;

   processed_transaction ptrx( trx );
   for( const auto& op : ptrx.operations )
      ptrx.operation_results.push_back( apply_operation( eval_state, op ) );

   return ptrx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

operation_result database::apply_operation( transaction_evaluation_state& eval_state, const operation& op )
{ try {
   int i_which = op.which();
   uint64_t u_which = uint64_t( i_which );
   FC_ASSERT( i_which >= 0, "Negative operation tag in operation ${op}", ("op",op) );
   FC_ASSERT( u_which < _operation_evaluators.size(), "No registered evaluator for operation ${op}", ("op",op) );
   std::unique_ptr<op_evaluator>& eval = _operation_evaluators[ u_which ];
   FC_ASSERT( eval, "No registered evaluator for operation ${op}", ("op",op) );
   return eval->evaluate( eval_state, op, true );
} FC_CAPTURE_AND_RETHROW( (op) ) }

} }
