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
#include <infusion/protocol/aura.hpp>

#include <fc/exception/exception.hpp>

namespace infusion { namespace protocol {

void aura_mint_operation::validate()const
{
   FC_ASSERT( !admin.is_null(), "The admin must be named" );
   FC_ASSERT( !to.is_null(), "The receiving account must be named" );
   FC_ASSERT( amount > 0, "The amount to mint should be positive" );
   FC_ASSERT( amount <= INFUSION_MAX_SHARE_SUPPLY, "The amount to mint is too large" );
}

void aura_burn_operation::validate()const
{
   FC_ASSERT( !admin.is_null(), "The admin must be named" );
   FC_ASSERT( !from.is_null(), "The account to burn from must be named" );
   FC_ASSERT( amount > 0, "The amount to burn should be positive" );
}

void aura_override_transfer_operation::validate()const
{
   FC_ASSERT( !admin.is_null(), "The admin must be named" );
   FC_ASSERT( !from.is_null() && !to.is_null(), "Both accounts of a transfer must be named" );
   FC_ASSERT( from != to, "Cannot transfer to the same account" );
   FC_ASSERT( amount > 0, "The amount to transfer should be positive" );
}

void aura_transfer_operation::validate()const
{
   FC_ASSERT( !from.is_null() && !to.is_null(), "Both accounts of a transfer must be named" );
   FC_ASSERT( from != to, "Cannot transfer to the same account" );
   FC_ASSERT( amount > 0, "The amount to transfer should be positive" );
}

void aura_freeze_operation::validate()const
{
   FC_ASSERT( !admin.is_null(), "The admin must be named" );
   FC_ASSERT( !account.is_null(), "The account to freeze must be named" );
}

void aura_unfreeze_operation::validate()const
{
   FC_ASSERT( !admin.is_null(), "The admin must be named" );
   FC_ASSERT( !account.is_null(), "The account to unfreeze must be named" );
}

void aura_infuse_operation::validate()const
{
   FC_ASSERT( !from.is_null() && !target.is_null(), "Both the sender and the target must be named" );
   FC_ASSERT( from != target, "Cannot infuse into the sending account" );
   FC_ASSERT( amount > 0, "The amount to infuse should be positive" );
}

} } // infusion::protocol
