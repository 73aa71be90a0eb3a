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
#include <infusion/chain/aura_evaluator.hpp>
#include <infusion/chain/creator.hpp>
#include <infusion/chain/database.hpp>
#include <infusion/chain/exceptions.hpp>
#include <infusion/chain/infusable_object.hpp>

namespace infusion { namespace chain {

void_result aura_mint_evaluator::do_evaluate( const aura_mint_operation& op )
{ try {
   const database& d = db();
   assert_admin( d, op.admin );

   const asset_object& aura = d.get_aura();
   INFUSION_ASSERT( aura.can_mint(), capability_disabled_exception,
                    "${symbol} does not allow new supply", ("symbol",aura.symbol) );

   const asset_dynamic_data_object& dyn = aura.dynamic_data( d );
   if( aura.max_supply > 0 )
   {
      INFUSION_ASSERT( dyn.current_supply + op.amount <= aura.max_supply, max_supply_exceeded_exception,
                       "Minting ${amount} would exceed the maximum supply of ${max}",
                       ("amount",op.amount)("max",aura.max_supply)("current",dyn.current_supply) );
   }

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result aura_mint_evaluator::do_apply( const aura_mint_operation& op )
{ try {
   database& d = db();
   // Aura minted to a token lands in its balance store
   d.issue_aura( creator::act_as_creator( d ), d.aura_receiver( op.to ), op.amount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result aura_burn_evaluator::do_evaluate( const aura_burn_operation& op )
{ try {
   const database& d = db();
   assert_admin( d, op.admin );

   const asset_object& aura = d.get_aura();
   INFUSION_ASSERT( aura.can_burn(), capability_disabled_exception,
                    "${symbol} does not allow burning", ("symbol",aura.symbol) );

   const share_type balance = d.get_balance( op.from );
   INFUSION_ASSERT( balance >= op.amount, insufficient_balance_exception,
                    "Insufficient Balance: ${from}'s balance of ${b} is less than required ${r}",
                    ("from",op.from)("b",balance)("r",op.amount) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result aura_burn_evaluator::do_apply( const aura_burn_operation& op )
{ try {
   db().retire_aura( op.from, op.amount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result aura_override_transfer_evaluator::do_evaluate( const aura_override_transfer_operation& op )
{ try {
   const database& d = db();
   assert_admin( d, op.admin );

   _ignore_freeze = d.get_aura().can_transfer_ignoring_freeze();
   _token = d.find_token( op.to );
   if( !_ignore_freeze )
   {
      INFUSION_ASSERT( !d.is_frozen( op.from ), account_frozen_exception,
                       "'from' account ${a} is frozen", ("a",op.from) );
      if( _token == nullptr )
         INFUSION_ASSERT( !d.is_frozen( op.to ), account_frozen_exception,
                          "'to' account ${a} is frozen", ("a",op.to) );
   }

   const share_type balance = d.get_balance( op.from );
   INFUSION_ASSERT( balance >= op.amount, insufficient_balance_exception,
                    "Insufficient Balance: ${from}'s balance of ${b} is less than required ${r}",
                    ("from",op.from)("b",balance)("r",op.amount) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result aura_override_transfer_evaluator::do_apply( const aura_override_transfer_operation& op )
{ try {
   if( _token != nullptr )
      db().infuse_token( op.from, *_token, op.amount, _ignore_freeze );
   else
      db().transfer_aura( op.from, op.to, op.amount, _ignore_freeze );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result aura_transfer_evaluator::do_evaluate( const aura_transfer_operation& op )
{ try {
   const database& d = db();
   _token = d.find_token( op.to );

   INFUSION_ASSERT( !d.is_frozen( op.from ), account_frozen_exception,
                    "'from' account ${a} is frozen", ("a",op.from) );
   if( _token == nullptr )
      INFUSION_ASSERT( !d.is_frozen( op.to ), account_frozen_exception,
                       "'to' account ${a} is frozen", ("a",op.to) );

   const share_type balance = d.get_balance( op.from );
   INFUSION_ASSERT( balance >= op.amount, insufficient_balance_exception,
                    "Insufficient Balance: ${from}'s balance of ${b} is less than required ${r}",
                    ("from",op.from)("b",balance)("r",op.amount) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result aura_transfer_evaluator::do_apply( const aura_transfer_operation& op )
{ try {
   // Aura sent to a token lands in its balance store
   if( _token != nullptr )
      db().infuse_token( op.from, *_token, op.amount );
   else
      db().transfer_aura( op.from, op.to, op.amount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result aura_freeze_evaluator::do_evaluate( const aura_freeze_operation& op )
{ try {
   assert_admin( db(), op.admin );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result aura_freeze_evaluator::do_apply( const aura_freeze_operation& op )
{ try {
   db().set_frozen( op.account, true );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result aura_unfreeze_evaluator::do_evaluate( const aura_unfreeze_operation& op )
{ try {
   assert_admin( db(), op.admin );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result aura_unfreeze_evaluator::do_apply( const aura_unfreeze_operation& op )
{ try {
   db().set_frozen( op.account, false );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result aura_infuse_evaluator::do_evaluate( const aura_infuse_operation& op )
{ try {
   const database& d = db();

   _token = d.find_token( op.target );

   INFUSION_ASSERT( !d.is_frozen( op.from ), account_frozen_exception,
                    "'from' account ${a} is frozen", ("a",op.from) );
   if( _token == nullptr )
      INFUSION_ASSERT( !d.is_frozen( op.target ), account_frozen_exception,
                       "Target ${a} is frozen", ("a",op.target) );

   const share_type balance = d.get_balance( op.from );
   INFUSION_ASSERT( balance >= op.amount, insufficient_balance_exception,
                    "Insufficient Balance: ${from}'s balance of ${b} is less than required ${r}",
                    ("from",op.from)("b",balance)("r",op.amount) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result aura_infuse_evaluator::do_apply( const aura_infuse_operation& op )
{ try {
   // Aura infused into a token lands in the token's balance store
   if( _token != nullptr )
      db().infuse_token( op.from, *_token, op.amount );
   else
      db().transfer_aura( op.from, op.target, op.amount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // infusion::chain
