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
#include <infusion/protocol/exceptions.hpp>

namespace infusion { namespace protocol {

   FC_IMPLEMENT_EXCEPTION( protocol_exception, 4000000, "protocol exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( transaction_exception, protocol_exception, 4010000,
                                   "transaction validation exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( tx_missing_authority, transaction_exception, 4010001,
                                   "missing required authority" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( tx_empty, transaction_exception, 4010002,
                                   "transaction has no operations" )

} } // infusion::protocol
