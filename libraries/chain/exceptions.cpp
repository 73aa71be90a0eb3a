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
#include <infusion/chain/exceptions.hpp>

namespace infusion { namespace chain {

   // Internal exceptions

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "blockchain exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( database_query_exception, chain_exception, 3010000, "database query exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( evaluation_error, chain_exception, 3100000, "evaluation error" )

   // Evaluation failures

   FC_IMPLEMENT_DERIVED_EXCEPTION( permission_denied_exception, evaluation_error, 3100001,
                                   "permission denied" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_qualified_exception, evaluation_error, 3100002,
                                   "token is not qualified" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_owner_exception, evaluation_error, 3100003,
                                   "caller does not own the token" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_balance_exception, evaluation_error, 3100004,
                                   "insufficient balance" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_aura_exception, insufficient_balance_exception, 3100005,
                                   "insufficient Aura" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( below_minimum_infusion_exception, evaluation_error, 3100006,
                                   "infusion is below the minimum" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_found_exception, evaluation_error, 3100007,
                                   "not found" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invariant_violation_exception, evaluation_error, 3100008,
                                   "invariant violation" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( account_frozen_exception, evaluation_error, 3100009,
                                   "account is frozen" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( max_supply_exceeded_exception, evaluation_error, 3100010,
                                   "maximum supply exceeded" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( capability_disabled_exception, evaluation_error, 3100011,
                                   "asset capability is disabled" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( already_initialized_exception, evaluation_error, 3100012,
                                   "already initialized" )

} } // infusion::chain
