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

#include <infusion/protocol/address.hpp>
#include <infusion/protocol/types.hpp>

namespace infusion { namespace protocol {

   /**
    *  @defgroup operations Operations
    *  @ingroup transactions Transactions
    *  @brief A set of valid commands for mutating the ledger
    *
    *  An operation can be thought of like a function that will modify the state
    *  of the database.  Every operation names the identity on whose behalf it
    *  acts, and that identity must have been authenticated by the host for the
    *  transaction that carries it.
    *
    *  Operations are validated in two steps.  validate() checks everything
    *  that can be checked without the database.  The evaluator then checks
    *  the operation against the current state before anything is changed.
    *
    *  @{
    */

   struct base_operation
   {
      void get_required_authorities( flat_set<address>& )const{}
      void validate()const{}
   };

   ///@}

} } // infusion::protocol
