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

#include <fc/exception/exception.hpp>
#include <infusion/protocol/exceptions.hpp>

namespace infusion { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( database_query_exception,     infusion::chain::chain_exception, 3010000 )
   FC_DECLARE_DERIVED_EXCEPTION( evaluation_error,             infusion::chain::chain_exception, 3100000 )

   /// The caller is not the admin
   FC_DECLARE_DERIVED_EXCEPTION( permission_denied_exception,      infusion::chain::evaluation_error, 3100001 )
   /// The token has not been qualified for admin transfers
   FC_DECLARE_DERIVED_EXCEPTION( not_qualified_exception,          infusion::chain::evaluation_error, 3100002 )
   /// The caller does not own the token
   FC_DECLARE_DERIVED_EXCEPTION( not_owner_exception,              infusion::chain::evaluation_error, 3100003 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance_exception,   infusion::chain::evaluation_error, 3100004 )
   /// Not enough Aura to pay for an infusion
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_aura_exception,      infusion::chain::insufficient_balance_exception, 3100005 )
   FC_DECLARE_DERIVED_EXCEPTION( below_minimum_infusion_exception, infusion::chain::evaluation_error, 3100006 )
   FC_DECLARE_DERIVED_EXCEPTION( not_found_exception,              infusion::chain::evaluation_error, 3100007 )
   /// Ledger state broke a conservation rule.  The transaction is reverted.
   FC_DECLARE_DERIVED_EXCEPTION( invariant_violation_exception,    infusion::chain::evaluation_error, 3100008 )
   FC_DECLARE_DERIVED_EXCEPTION( account_frozen_exception,         infusion::chain::evaluation_error, 3100009 )
   FC_DECLARE_DERIVED_EXCEPTION( max_supply_exceeded_exception,    infusion::chain::evaluation_error, 3100010 )
   FC_DECLARE_DERIVED_EXCEPTION( capability_disabled_exception,    infusion::chain::evaluation_error, 3100011 )
   FC_DECLARE_DERIVED_EXCEPTION( already_initialized_exception,    infusion::chain::evaluation_error, 3100012 )

} } // infusion::chain
