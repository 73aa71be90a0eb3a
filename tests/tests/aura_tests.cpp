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
#include <boost/test/unit_test.hpp>

#include <infusion/chain/database.hpp>
#include <infusion/chain/exceptions.hpp>

#include <infusion/chain/account_balance_object.hpp>
#include <infusion/chain/asset_object.hpp>

#include "../common/database_fixture.hpp"

using namespace infusion::chain;
using namespace infusion::chain::test;

BOOST_FIXTURE_TEST_SUITE( aura_tests, database_fixture )

BOOST_AUTO_TEST_CASE( aura_genesis_metadata )
{
   try {
      const asset_object& aura = db.get_aura();
      BOOST_CHECK_EQUAL( aura.name, "Aura" );
      BOOST_CHECK_EQUAL( aura.symbol, "AURA" );
      BOOST_CHECK_EQUAL( aura.decimals, 8 );
      BOOST_CHECK( aura.issuer == db.get_creator().creator );
      BOOST_CHECK( aura.can_mint() );
      BOOST_CHECK( aura.can_burn() );
      BOOST_CHECK( aura.can_transfer_ignoring_freeze() );
      BOOST_CHECK_EQUAL( db.get_aura_dynamic_data().current_supply.value, 0 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( mint_and_burn )
{
   try {
      ACTORS((alice));

      mint_aura( alice_id, 1000 );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 1000 );
      BOOST_CHECK_EQUAL( db.get_aura_dynamic_data().current_supply.value, 1000 );
      BOOST_CHECK_EQUAL( db.get_aura_dynamic_data().total_minted.value, 1000 );

      burn_aura( alice_id, 300 );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 700 );
      BOOST_CHECK_EQUAL( db.get_aura_dynamic_data().current_supply.value, 700 );
      BOOST_CHECK_EQUAL( db.get_aura_dynamic_data().total_burned.value, 300 );

      BOOST_TEST_MESSAGE( "Burning more than the balance" );
      INFUSION_REQUIRE_THROW( burn_aura( alice_id, 701 ), insufficient_balance_exception );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 700 );

      burn_aura( alice_id, 700 );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 0 );
      BOOST_CHECK_EQUAL( db.get_aura_dynamic_data().current_supply.value, 0 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( mint_and_burn_require_admin )
{
   try {
      ACTORS((alice)(mallory));
      mint_aura( alice_id, 500 );

      aura_mint_operation mint;
      mint.admin = mallory_id;
      mint.to = mallory_id;
      mint.amount = 1000;
      INFUSION_REQUIRE_THROW( push_op( mint, mallory_id ), permission_denied_exception );

      aura_burn_operation burn;
      burn.admin = mallory_id;
      burn.from = alice_id;
      burn.amount = 100;
      INFUSION_REQUIRE_THROW( push_op( burn, mallory_id ), permission_denied_exception );

      BOOST_CHECK_EQUAL( get_balance( alice_id ), 500 );
      BOOST_CHECK_EQUAL( get_balance( mallory_id ), 0 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( transfer_test )
{
   try {
      ACTORS((alice)(bob));
      mint_aura( alice_id, 1000 );

      transfer( alice_id, bob_id, 400 );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 600 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ), 400 );

      INFUSION_REQUIRE_THROW( transfer( bob_id, alice_id, 401 ), insufficient_balance_exception );

      BOOST_TEST_MESSAGE( "Transfer signed by the receiver" );
      aura_transfer_operation op;
      op.from = alice_id;
      op.to = bob_id;
      op.amount = 10;
      INFUSION_REQUIRE_THROW( push_op( op, bob_id ), tx_missing_authority );

      BOOST_CHECK_EQUAL( get_balance( alice_id ), 600 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ), 400 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( override_transfer_test )
{
   try {
      ACTORS((alice)(bob)(mallory));
      mint_aura( alice_id, 500 );

      override_transfer( alice_id, bob_id, 200 );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 300 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ), 200 );

      INFUSION_REQUIRE_THROW( override_transfer( alice_id, bob_id, 301 ), insufficient_balance_exception );

      aura_override_transfer_operation op;
      op.admin = mallory_id;
      op.from = alice_id;
      op.to = mallory_id;
      op.amount = 300;
      INFUSION_REQUIRE_THROW( push_op( op, mallory_id ), permission_denied_exception );
      BOOST_CHECK_EQUAL( get_balance( mallory_id ), 0 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( freeze_blocks_direct_transfers )
{
   try {
      ACTORS((alice)(bob));
      mint_aura( alice_id, 500 );
      mint_aura( bob_id, 500 );

      freeze( alice_id );
      BOOST_CHECK( db.is_frozen( alice_id ) );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 500 );

      INFUSION_REQUIRE_THROW( transfer( alice_id, bob_id, 10 ), account_frozen_exception );
      INFUSION_REQUIRE_THROW( transfer( bob_id, alice_id, 10 ), account_frozen_exception );

      BOOST_TEST_MESSAGE( "The admin can still move funds of a frozen account" );
      override_transfer( alice_id, bob_id, 100 );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 400 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ), 600 );

      BOOST_TEST_MESSAGE( "Minting into a frozen account is allowed" );
      mint_aura( alice_id, 50 );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 450 );

      unfreeze( alice_id );
      BOOST_CHECK( !db.is_frozen( alice_id ) );
      transfer( alice_id, bob_id, 50 );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 400 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ), 650 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( freeze_is_idempotent )
{
   try {
      ACTORS((alice)(carol)(mallory));
      mint_aura( alice_id, 100 );

      freeze( alice_id );
      freeze( alice_id );
      BOOST_CHECK( db.is_frozen( alice_id ) );
      unfreeze( alice_id );
      unfreeze( alice_id );
      BOOST_CHECK( !db.is_frozen( alice_id ) );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 100 );

      BOOST_TEST_MESSAGE( "Freezing an account that never held Aura" );
      BOOST_CHECK( db.find_balance_entry( carol_id ) == nullptr );
      freeze( carol_id );
      const account_balance_object* entry = db.find_balance_entry( carol_id );
      BOOST_REQUIRE( entry != nullptr );
      BOOST_CHECK( entry->frozen );
      BOOST_CHECK_EQUAL( entry->balance.value, 0 );

      aura_freeze_operation op;
      op.admin = mallory_id;
      op.account = alice_id;
      INFUSION_REQUIRE_THROW( push_op( op, mallory_id ), permission_denied_exception );
      BOOST_CHECK( !db.is_frozen( alice_id ) );

      aura_unfreeze_operation uop;
      uop.admin = mallory_id;
      uop.account = carol_id;
      INFUSION_REQUIRE_THROW( push_op( uop, mallory_id ), permission_denied_exception );
      BOOST_CHECK( db.is_frozen( carol_id ) );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( zero_deposit_creates_no_entry )
{
   try {
      ACTORS((alice)(carol));
      mint_aura( alice_id, 100 );

      db.transfer_aura( alice_id, carol_id, 0 );
      BOOST_CHECK( db.find_balance_entry( carol_id ) == nullptr );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 100 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( infuse_into_account )
{
   try {
      ACTORS((alice)(bob));
      mint_aura( alice_id, 300 );

      aura_infuse_operation op;
      op.from = alice_id;
      op.target = bob_id;
      op.amount = 120;
      push_op( op, alice_id );

      BOOST_CHECK_EQUAL( get_balance( alice_id ), 180 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ), 120 );

      op.amount = 181;
      INFUSION_REQUIRE_THROW( push_op( op, alice_id ), insufficient_balance_exception );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( infuse_into_token )
{
   try {
      ACTORS((alice)(bob));
      mint_aura( alice_id, 200 );
      mint_aura( bob_id, 100 );
      const address token = mint_fuse_block( alice_id, 100 );

      aura_infuse_operation op;
      op.from = bob_id;
      op.target = token;
      op.amount = 60;
      push_op( op, bob_id );

      BOOST_CHECK_EQUAL( get_balance( bob_id ), 40 );
      BOOST_CHECK_EQUAL( get_infused( token ), 160 );
      BOOST_CHECK_EQUAL( get_balance( token ), 0 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( operation_validation )
{
   try {
      ACTORS((alice)(bob));

      aura_mint_operation mint;
      mint.admin = admin_id;
      mint.to = alice_id;
      mint.amount = 10;
      mint.validate();
      REQUIRE_OP_VALIDATION_FAILURE( mint, amount, 0 );
      REQUIRE_OP_VALIDATION_FAILURE( mint, amount, -1 );
      REQUIRE_OP_VALIDATION_FAILURE( mint, to, address() );

      aura_transfer_operation xfer;
      xfer.from = alice_id;
      xfer.to = bob_id;
      xfer.amount = 10;
      xfer.validate();
      REQUIRE_OP_VALIDATION_FAILURE( xfer, to, alice_id );
      REQUIRE_OP_VALIDATION_FAILURE( xfer, amount, 0 );

      aura_freeze_operation freeze_op;
      freeze_op.admin = admin_id;
      freeze_op.account = alice_id;
      freeze_op.validate();
      REQUIRE_OP_VALIDATION_FAILURE( freeze_op, account, address() );

      BOOST_TEST_MESSAGE( "Empty transaction" );
      trx.clear();
      sign( trx, alice_id );
      INFUSION_REQUIRE_THROW( PUSH_TX( db, trx ), tx_empty );
      trx.clear();
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( max_supply_is_enforced )
{
   try {
      ACTORS((alice));

      database capped;
      genesis_state_type genesis = create_example_genesis( admin_id );
      genesis.aura.max_supply = 1000;
      genesis.initial_balances.push_back( { alice_id, 400 } );
      capped.init_genesis( genesis );
      BOOST_CHECK_EQUAL( capped.get_balance( alice_id ).value, 400 );
      BOOST_CHECK_EQUAL( capped.get_aura_dynamic_data().current_supply.value, 400 );

      signed_transaction tx;
      aura_mint_operation op;
      op.admin = admin_id;
      op.to = alice_id;
      op.amount = 600;
      tx.operations.push_back( op );
      tx.signers.insert( admin_id );
      PUSH_TX( capped, tx );
      BOOST_CHECK_EQUAL( capped.get_aura_dynamic_data().current_supply.value, 1000 );

      tx.clear();
      op.amount = 1;
      tx.operations.push_back( op );
      tx.signers.insert( admin_id );
      INFUSION_REQUIRE_THROW( PUSH_TX( capped, tx ), max_supply_exceeded_exception );
      BOOST_CHECK_EQUAL( capped.get_balance( alice_id ).value, 1000 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( disabled_capabilities )
{
   try {
      ACTORS((alice)(bob));

      database locked;
      genesis_state_type genesis = create_example_genesis( admin_id );
      genesis.aura.mintable = false;
      genesis.aura.burnable = false;
      genesis.aura.transfer_ignoring_freeze = false;
      genesis.initial_balances.push_back( { alice_id, 500 } );
      locked.init_genesis( genesis );
      BOOST_CHECK_EQUAL( locked.get_balance( alice_id ).value, 500 );

      signed_transaction tx;
      aura_mint_operation mint;
      mint.admin = admin_id;
      mint.to = alice_id;
      mint.amount = 10;
      tx.operations.push_back( mint );
      tx.signers.insert( admin_id );
      INFUSION_REQUIRE_THROW( PUSH_TX( locked, tx ), capability_disabled_exception );

      tx.clear();
      aura_burn_operation burn;
      burn.admin = admin_id;
      burn.from = alice_id;
      burn.amount = 10;
      tx.operations.push_back( burn );
      tx.signers.insert( admin_id );
      INFUSION_REQUIRE_THROW( PUSH_TX( locked, tx ), capability_disabled_exception );

      BOOST_TEST_MESSAGE( "Without the freeze override a frozen account stays frozen to the admin" );
      tx.clear();
      aura_freeze_operation freeze_op;
      freeze_op.admin = admin_id;
      freeze_op.account = alice_id;
      tx.operations.push_back( freeze_op );
      tx.signers.insert( admin_id );
      PUSH_TX( locked, tx );

      tx.clear();
      aura_override_transfer_operation xfer;
      xfer.admin = admin_id;
      xfer.from = alice_id;
      xfer.to = bob_id;
      xfer.amount = 10;
      tx.operations.push_back( xfer );
      tx.signers.insert( admin_id );
      INFUSION_REQUIRE_THROW( PUSH_TX( locked, tx ), account_frozen_exception );

      BOOST_CHECK_EQUAL( locked.get_balance( alice_id ).value, 500 );
      BOOST_CHECK_EQUAL( locked.get_aura_dynamic_data().current_supply.value, 500 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( transfer_to_frozen_account_keeps_funds )
{
   try {
      ACTORS((alice)(carol));
      mint_aura( alice_id, 100 );
      freeze( carol_id );

      INFUSION_REQUIRE_THROW( db.transfer_aura( alice_id, carol_id, 10 ), account_frozen_exception );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 100 );
      BOOST_CHECK_EQUAL( get_balance( carol_id ), 0 );
      BOOST_CHECK_EQUAL( db.get_aura_dynamic_data().current_supply.value, 100 );

      BOOST_TEST_MESSAGE( "The admin path still reaches a frozen receiver" );
      db.transfer_aura( alice_id, carol_id, 10, true );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 90 );
      BOOST_CHECK_EQUAL( get_balance( carol_id ), 10 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( destroy_zero_rejects_held_aura )
{
   try {
      ACTORS((alice));
      mint_aura( alice_id, 20 );

      {
         auto ses = db._undo_db.start_undo_session();
         INFUSION_REQUIRE_THROW( db.destroy_zero( db.withdraw_aura( alice_id, 5 ) ), invariant_violation_exception );
         // dropping the session restores the withdrawn balance
      }
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 20 );

      db.destroy_zero( db.withdraw_aura( alice_id, 0 ) );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 20 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( aura_sent_to_token_lands_in_store )
{
   try {
      ACTORS((alice)(bob));
      mint_aura( alice_id, 100 );
      mint_aura( bob_id, 100 );
      const address token = mint_fuse_block( alice_id, 100 );
      const address store = db.get_token( token ).balance_store;

      BOOST_TEST_MESSAGE( "Minting to a token address" );
      mint_aura( token, 50 );
      BOOST_CHECK_EQUAL( get_infused( token ), 150 );

      BOOST_TEST_MESSAGE( "Transferring to a token address" );
      transfer( bob_id, token, 30 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ), 70 );
      BOOST_CHECK_EQUAL( get_infused( token ), 180 );

      BOOST_TEST_MESSAGE( "Admin transfer to a token address" );
      override_transfer( bob_id, token, 20 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ), 50 );
      BOOST_CHECK_EQUAL( get_infused( token ), 200 );

      BOOST_CHECK_EQUAL( get_balance( token ), 0 );
      BOOST_CHECK_EQUAL( get_balance( store ), 200 );

      burn_and_extract( alice_id, token );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 200 );
      BOOST_CHECK_EQUAL( get_balance( token ), 0 );
      BOOST_CHECK( db.find_balance_entry( store ) == nullptr );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
