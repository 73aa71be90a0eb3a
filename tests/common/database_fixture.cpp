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
#include <boost/test/unit_test.hpp>

#include <infusion/chain/account_balance_object.hpp>
#include <infusion/chain/asset_object.hpp>
#include <infusion/chain/infusable_object.hpp>

#include <fc/crypto/sha256.hpp>

#include "database_fixture.hpp"

using namespace infusion::chain::test;

namespace infusion { namespace chain {

database_fixture::database_fixture()
   : admin_id( actor_address( "admin" ) )
{ try {
   genesis_state = create_example_genesis( admin_id );
   db.init_genesis( genesis_state );
} FC_LOG_AND_RETHROW() }

database_fixture::~database_fixture()
{
   try
   {
      // If we're unwinding due to an exception, don't do any more checks.
      // This way, boost test's last checkpoint tells us approximately where the error was.
      if( !std::uncaught_exception() )
         verify_aura_supply();
   }
   catch( const fc::exception& e )
   {
      BOOST_ERROR( e.to_detail_string() );
   }
}

address database_fixture::actor_address( const string& name )
{
   return address( fc::sha256::hash( name ) );
}

void database_fixture::sign( signed_transaction& tx, const address& signer )
{
   tx.signers.insert( signer );
}

processed_transaction database_fixture::push_op( const operation& op, const address& signer )
{
   trx.clear();
   trx.operations.push_back( op );
   sign( trx, signer );
   processed_transaction ptx = PUSH_TX( db, trx );
   trx.clear();
   return ptx;
}

void database_fixture::verify_aura_supply()
{
   const asset_dynamic_data_object& dyn = db.get_aura_dynamic_data();

   share_type total_balances = 0;
   for( const account_balance_object& b : db.get_index_type<account_balance_index>().indices() )
   {
      BOOST_CHECK( b.balance >= 0 );
      total_balances += b.balance;
   }

   BOOST_CHECK_EQUAL( dyn.total_minted.value - dyn.total_burned.value, dyn.current_supply.value );
   BOOST_CHECK_EQUAL( total_balances.value, dyn.current_supply.value );
}

int64_t database_fixture::get_balance( const address& owner )const
{
   return db.get_balance( owner ).value;
}

int64_t database_fixture::get_infused( const address& token )const
{
   return db.get_balance( db.get_token( token ).balance_store ).value;
}

void database_fixture::mint_aura( const address& to, share_type amount )
{
   aura_mint_operation op;
   op.admin = admin_id;
   op.to = to;
   op.amount = amount;
   push_op( op, admin_id );
}

void database_fixture::burn_aura( const address& from, share_type amount )
{
   aura_burn_operation op;
   op.admin = admin_id;
   op.from = from;
   op.amount = amount;
   push_op( op, admin_id );
}

void database_fixture::transfer( const address& from, const address& to, share_type amount )
{
   aura_transfer_operation op;
   op.from = from;
   op.to = to;
   op.amount = amount;
   push_op( op, from );
}

void database_fixture::override_transfer( const address& from, const address& to, share_type amount )
{
   aura_override_transfer_operation op;
   op.admin = admin_id;
   op.from = from;
   op.to = to;
   op.amount = amount;
   push_op( op, admin_id );
}

void database_fixture::freeze( const address& account )
{
   aura_freeze_operation op;
   op.admin = admin_id;
   op.account = account;
   push_op( op, admin_id );
}

void database_fixture::unfreeze( const address& account )
{
   aura_unfreeze_operation op;
   op.admin = admin_id;
   op.account = account;
   push_op( op, admin_id );
}

address database_fixture::mint_fuse_block( const address& caller, share_type amount )
{
   fuse_block_mint_operation op;
   op.caller = caller;
   op.amount = amount;
   processed_transaction ptx = push_op( op, caller );
   return ptx.operation_results[0].get<address>();
}

address database_fixture::mint_item( const address& caller, share_type amount, const optional<address>& origin )
{
   item_mint_operation op;
   op.caller = caller;
   op.amount = amount;
   op.origin = origin;
   processed_transaction ptx = push_op( op, caller );
   return ptx.operation_results[0].get<address>();
}

void database_fixture::qualify( const address& token )
{
   token_qualify_operation op;
   op.admin = admin_id;
   op.token = token;
   push_op( op, admin_id );
}

void database_fixture::elevated_transfer( const address& token, const address& new_owner )
{
   token_override_transfer_operation op;
   op.admin = admin_id;
   op.token = token;
   op.new_owner = new_owner;
   push_op( op, admin_id );
}

void database_fixture::burn_and_extract( const address& owner, const address& token )
{
   token_burn_operation op;
   op.owner = owner;
   op.token = token;
   push_op( op, owner );
}

void database_fixture::infuse_more( const address& caller, const address& token, share_type amount )
{
   token_infuse_operation op;
   op.caller = caller;
   op.token = token;
   op.amount = amount;
   push_op( op, caller );
}

namespace test {

processed_transaction _push_transaction( database& db, const signed_transaction& tx )
{ try {
   auto pt = db.push_transaction( tx );
   return pt;
} FC_CAPTURE_AND_RETHROW((tx)) }

} // infusion::chain::test

} } // infusion::chain
