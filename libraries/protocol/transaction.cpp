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
#include <infusion/protocol/exceptions.hpp>
#include <infusion/protocol/transaction.hpp>

namespace infusion { namespace protocol {

void transaction::validate()const
{
   INFUSION_ASSERT( operations.size() > 0, tx_empty, "A transaction must have at least one operation", ("trx",*this) );
   for( const auto& op : operations )
      operation_validate( op );
}

void transaction::get_required_authorities( flat_set<address>& result )const
{
   for( const auto& op : operations )
      operation_get_required_authorities( op, result );
}

void signed_transaction::verify_authority()const
{ try {
   flat_set<address> required;
   get_required_authorities( required );

   for( const address& id : required )
      INFUSION_ASSERT( signers.find( id ) != signers.end(), tx_missing_authority,
                       "Missing authority of ${id}", ("id",id)("signers",signers) );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // infusion::protocol
