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

#include <infusion/chain/infusable_object.hpp>

#include "../common/database_fixture.hpp"

using namespace infusion::chain;
using namespace infusion::chain::test;

BOOST_FIXTURE_TEST_SUITE( fuse_block_tests, database_fixture )

BOOST_AUTO_TEST_CASE( fuse_block_mint )
{
   try {
      ACTORS((alice));

      mint_aura( alice_id, 211 );

      BOOST_TEST_MESSAGE( "Minting a FuseBlock infused with 100 Aura" );
      const address token_id = mint_fuse_block( alice_id, 100 );

      BOOST_CHECK_EQUAL( get_balance( alice_id ), 111 );
      BOOST_CHECK_EQUAL( get_infused( token_id ), 100 );
      BOOST_CHECK_EQUAL( db.get_collection( token_kind::fuse_block ).counter, 1u );
      BOOST_CHECK_EQUAL( db.get_collection( token_kind::item ).counter, 0u );
      BOOST_CHECK( token_id == db.token_address_for( token_kind::fuse_block, 1 ) );

      const infusable_token_object& token = db.get_token( token_id );
      BOOST_CHECK( token.kind == token_kind::fuse_block );
      BOOST_CHECK( token.owner == alice_id );
      BOOST_CHECK( token.creator == db.get_creator().creator );
      BOOST_CHECK( token.collection == db.get_collection( token_kind::fuse_block ).collection_address );
      BOOST_CHECK_EQUAL( token.sequence, 1u );
      BOOST_CHECK_EQUAL( token.name, "FuseBlock #1" );
      BOOST_CHECK_EQUAL( token.uri, std::string( INFUSION_FUSE_BLOCK_COLLECTION_URI ) + "/1" );
      BOOST_CHECK_EQUAL( token.description, INFUSION_FUSE_BLOCK_COLLECTION_DESCRIPTION );
      BOOST_CHECK( !token.qualifies );
      BOOST_CHECK( !token.origin.valid() );
      BOOST_CHECK( token.balance_store == address::derive( token_id, INFUSION_TOKEN_STORE_SEED ) );
      BOOST_CHECK( token.capabilities.is_bound_to( token_id ) );

      BOOST_TEST_MESSAGE( "A second FuseBlock gets the next sequence" );
      const address second_id = mint_fuse_block( alice_id, 111 );
      BOOST_CHECK( second_id == db.token_address_for( token_kind::fuse_block, 2 ) );
      BOOST_CHECK_EQUAL( db.get_token( second_id ).name, "FuseBlock #2" );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 0 );
      BOOST_CHECK_EQUAL( db.get_collection( token_kind::fuse_block ).counter, 2u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( mint_below_minimum )
{
   try {
      ACTORS((alice));
      mint_aura( alice_id, 1000 );

      INFUSION_REQUIRE_THROW( mint_fuse_block( alice_id, 99 ), below_minimum_infusion_exception );
      INFUSION_REQUIRE_THROW( mint_fuse_block( alice_id, 0 ), below_minimum_infusion_exception );
      INFUSION_REQUIRE_THROW( mint_fuse_block( alice_id, -5 ), below_minimum_infusion_exception );

      BOOST_CHECK_EQUAL( get_balance( alice_id ), 1000 );
      BOOST_CHECK_EQUAL( db.get_collection( token_kind::fuse_block ).counter, 0u );
      BOOST_CHECK( db.get_tokens_by_owner( alice_id ).empty() );

      mint_fuse_block( alice_id, INFUSION_MIN_INFUSION_AMOUNT );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 900 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( mint_with_insufficient_aura )
{
   try {
      ACTORS((alice)(bob));
      mint_aura( alice_id, 150 );

      INFUSION_REQUIRE_THROW( mint_fuse_block( alice_id, 200 ), insufficient_aura_exception );
      INFUSION_REQUIRE_THROW( mint_fuse_block( bob_id, 100 ), insufficient_balance_exception );

      BOOST_CHECK_EQUAL( get_balance( alice_id ), 150 );
      BOOST_CHECK_EQUAL( db.get_collection( token_kind::fuse_block ).counter, 0u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( frozen_account_cannot_mint )
{
   try {
      ACTORS((alice));
      mint_aura( alice_id, 500 );
      freeze( alice_id );

      INFUSION_REQUIRE_THROW( mint_fuse_block( alice_id, 100 ), account_frozen_exception );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 500 );

      unfreeze( alice_id );
      mint_fuse_block( alice_id, 100 );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 400 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( mint_requires_caller_signature )
{
   try {
      ACTORS((alice)(bob));
      mint_aura( alice_id, 500 );

      fuse_block_mint_operation op;
      op.caller = alice_id;
      op.amount = 100;
      INFUSION_REQUIRE_THROW( push_op( op, bob_id ), tx_missing_authority );
      REQUIRE_OP_VALIDATION_FAILURE( op, caller, address() );

      BOOST_CHECK_EQUAL( get_balance( alice_id ), 500 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( qualify_test )
{
   try {
      ACTORS((alice)(mallory));
      mint_aura( alice_id, 100 );
      const address token_id = mint_fuse_block( alice_id, 100 );

      token_qualify_operation op;
      op.admin = mallory_id;
      op.token = token_id;
      INFUSION_REQUIRE_THROW( push_op( op, mallory_id ), permission_denied_exception );
      BOOST_CHECK( !db.get_token( token_id ).qualifies );

      INFUSION_REQUIRE_THROW( qualify( actor_address( "nothing" ) ), not_found_exception );

      qualify( token_id );
      BOOST_CHECK( db.get_token( token_id ).qualifies );

      BOOST_TEST_MESSAGE( "Qualifying twice changes nothing" );
      qualify( token_id );
      BOOST_CHECK( db.get_token( token_id ).qualifies );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( elevated_transfer_test )
{
   try {
      ACTORS((alice)(bob)(mallory));
      mint_aura( alice_id, 300 );
      const address token_id = mint_fuse_block( alice_id, 200 );

      BOOST_TEST_MESSAGE( "Transfer before qualification" );
      INFUSION_REQUIRE_THROW( elevated_transfer( token_id, bob_id ), not_qualified_exception );
      BOOST_CHECK( db.get_token( token_id ).owner == alice_id );

      qualify( token_id );

      token_override_transfer_operation op;
      op.admin = mallory_id;
      op.token = token_id;
      op.new_owner = mallory_id;
      INFUSION_REQUIRE_THROW( push_op( op, mallory_id ), permission_denied_exception );

      INFUSION_REQUIRE_THROW( elevated_transfer( actor_address( "nothing" ), bob_id ), not_found_exception );

      elevated_transfer( token_id, bob_id );
      BOOST_CHECK( db.get_token( token_id ).owner == bob_id );
      BOOST_CHECK_EQUAL( get_infused( token_id ), 200 );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 100 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ), 0 );
      BOOST_CHECK_EQUAL( db.get_tokens_by_owner( alice_id ).size(), 0u );
      BOOST_CHECK_EQUAL( db.get_tokens_by_owner( bob_id ).size(), 1u );

      BOOST_TEST_MESSAGE( "Transfers do not require the owner's consent nor an unfrozen owner" );
      freeze( bob_id );
      elevated_transfer( token_id, alice_id );
      BOOST_CHECK( db.get_token( token_id ).owner == alice_id );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( burn_and_extract_test )
{
   try {
      ACTORS((alice)(bob));
      mint_aura( alice_id, 250 );
      const address token_id = mint_fuse_block( alice_id, 150 );
      const address store = db.get_token( token_id ).balance_store;

      INFUSION_REQUIRE_THROW( burn_and_extract( bob_id, token_id ), not_owner_exception );
      INFUSION_REQUIRE_THROW( burn_and_extract( alice_id, actor_address( "nothing" ) ), not_found_exception );

      burn_and_extract( alice_id, token_id );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 250 );
      BOOST_CHECK( db.find_token( token_id ) == nullptr );
      BOOST_CHECK( db.find_balance_entry( store ) == nullptr );
      BOOST_CHECK( db.get_tokens_by_owner( alice_id ).empty() );

      BOOST_TEST_MESSAGE( "A burned token is gone for every operation" );
      INFUSION_REQUIRE_THROW( burn_and_extract( alice_id, token_id ), not_found_exception );
      INFUSION_REQUIRE_THROW( qualify( token_id ), not_found_exception );
      INFUSION_REQUIRE_THROW( infuse_more( alice_id, token_id, 10 ), not_found_exception );

      BOOST_TEST_MESSAGE( "The counter is not reused" );
      BOOST_CHECK_EQUAL( db.get_collection( token_kind::fuse_block ).counter, 1u );
      const address next_id = mint_fuse_block( alice_id, 100 );
      BOOST_CHECK( next_id != token_id );
      BOOST_CHECK_EQUAL( db.get_token( next_id ).sequence, 2u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( frozen_owner_cannot_burn )
{
   try {
      ACTORS((alice));
      mint_aura( alice_id, 100 );
      const address token_id = mint_fuse_block( alice_id, 100 );

      freeze( alice_id );
      INFUSION_REQUIRE_THROW( burn_and_extract( alice_id, token_id ), account_frozen_exception );
      BOOST_CHECK( db.find_token( token_id ) != nullptr );
      BOOST_CHECK_EQUAL( get_infused( token_id ), 100 );

      unfreeze( alice_id );
      burn_and_extract( alice_id, token_id );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 100 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( infuse_more_test )
{
   try {
      ACTORS((alice)(bob));
      mint_aura( alice_id, 100 );
      mint_aura( bob_id, 80 );
      const address token_id = mint_fuse_block( alice_id, 100 );

      BOOST_TEST_MESSAGE( "Anyone may add Aura to a token" );
      infuse_more( bob_id, token_id, 50 );
      BOOST_CHECK_EQUAL( get_infused( token_id ), 150 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ), 30 );

      INFUSION_REQUIRE_THROW( infuse_more( bob_id, token_id, 31 ), insufficient_aura_exception );

      token_infuse_operation op;
      op.caller = bob_id;
      op.token = token_id;
      op.amount = 0;
      INFUSION_REQUIRE_THROW( op.validate(), fc::exception );

      freeze( bob_id );
      INFUSION_REQUIRE_THROW( infuse_more( bob_id, token_id, 10 ), account_frozen_exception );
      unfreeze( bob_id );

      BOOST_TEST_MESSAGE( "The owner extracts everything infused" );
      burn_and_extract( alice_id, token_id );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 150 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ), 30 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( fuse_block_lifecycle )
{
   try {
      ACTORS((alice)(bob));

      mint_aura( alice_id, 211 );
      const address token_id = mint_fuse_block( alice_id, 100 );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 111 );
      BOOST_CHECK_EQUAL( get_infused( token_id ), 100 );

      INFUSION_REQUIRE_THROW( elevated_transfer( token_id, bob_id ), not_qualified_exception );

      qualify( token_id );
      elevated_transfer( token_id, bob_id );
      BOOST_CHECK( db.get_token( token_id ).owner == bob_id );

      qualify( token_id );
      elevated_transfer( token_id, alice_id );
      BOOST_CHECK( db.get_token( token_id ).owner == alice_id );

      INFUSION_REQUIRE_THROW( burn_and_extract( bob_id, token_id ), not_owner_exception );

      burn_and_extract( alice_id, token_id );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 211 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ), 0 );
      INFUSION_REQUIRE_THROW( db.get_token( token_id ), not_found_exception );
      BOOST_CHECK_EQUAL( db.get_collection( token_kind::fuse_block ).counter, 1u );
      BOOST_CHECK_EQUAL( db.get_aura_dynamic_data().current_supply.value, 211 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( tokens_by_owner )
{
   try {
      ACTORS((alice)(bob));
      mint_aura( alice_id, 1000 );
      mint_aura( bob_id, 1000 );

      const address a1 = mint_fuse_block( alice_id, 100 );
      const address b1 = mint_fuse_block( bob_id, 100 );
      const address a2 = mint_item( alice_id, 100 );

      auto owned = db.get_tokens_by_owner( alice_id );
      BOOST_REQUIRE_EQUAL( owned.size(), 2u );
      BOOST_CHECK( owned[0]->token_address == a1 );
      BOOST_CHECK( owned[1]->token_address == a2 );

      owned = db.get_tokens_by_owner( bob_id );
      BOOST_REQUIRE_EQUAL( owned.size(), 1u );
      BOOST_CHECK( owned[0]->token_address == b1 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( frozen_store_does_not_block_token )
{
   try {
      ACTORS((alice)(bob));
      mint_aura( alice_id, 150 );
      mint_aura( bob_id, 40 );
      const address token_id = mint_fuse_block( alice_id, 100 );
      const address store = db.get_token( token_id ).balance_store;

      freeze( store );
      BOOST_CHECK( db.is_frozen( store ) );

      infuse_more( alice_id, token_id, 50 );
      BOOST_CHECK_EQUAL( get_infused( token_id ), 150 );

      aura_infuse_operation op;
      op.from = bob_id;
      op.target = token_id;
      op.amount = 40;
      push_op( op, bob_id );
      BOOST_CHECK_EQUAL( get_infused( token_id ), 190 );

      burn_and_extract( alice_id, token_id );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 190 );
      BOOST_CHECK( db.find_token( token_id ) == nullptr );
      BOOST_CHECK( db.find_balance_entry( store ) == nullptr );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( admin_burns_reclaimed_token )
{
   try {
      ACTORS((alice)(bob));
      mint_aura( alice_id, 211 );
      const address token_id = mint_fuse_block( alice_id, 100 );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 111 );
      BOOST_CHECK_EQUAL( get_infused( token_id ), 100 );
      BOOST_CHECK_EQUAL( db.get_collection( token_kind::fuse_block ).counter, 1u );

      qualify( token_id );
      elevated_transfer( token_id, bob_id );
      BOOST_CHECK( db.get_token( token_id ).owner == bob_id );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 111 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ), 0 );
      BOOST_CHECK_EQUAL( get_infused( token_id ), 100 );

      BOOST_TEST_MESSAGE( "The admin qualifies the token again and takes it back" );
      qualify( token_id );
      elevated_transfer( token_id, admin_id );
      BOOST_CHECK( db.get_token( token_id ).owner == admin_id );

      const int64_t admin_before = get_balance( admin_id );
      burn_and_extract( admin_id, token_id );
      BOOST_CHECK_EQUAL( get_balance( admin_id ), admin_before + 100 );
      BOOST_CHECK( db.find_token( token_id ) == nullptr );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 111 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
