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

BOOST_FIXTURE_TEST_SUITE( item_tests, database_fixture )

BOOST_AUTO_TEST_CASE( item_direct_mint )
{
   try {
      ACTORS((alice));
      mint_aura( alice_id, 500 );

      const address item_id = mint_item( alice_id, 120 );
      BOOST_CHECK( item_id == db.token_address_for( token_kind::item, 1 ) );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 380 );
      BOOST_CHECK_EQUAL( get_infused( item_id ), 120 );

      const infusable_token_object& item = db.get_token( item_id );
      BOOST_CHECK( item.kind == token_kind::item );
      BOOST_CHECK( item.owner == alice_id );
      BOOST_CHECK( !item.origin.valid() );
      BOOST_CHECK( !item.qualifies );
      BOOST_CHECK_EQUAL( item.name, "Item #1" );
      BOOST_CHECK( item.collection == db.get_collection( token_kind::item ).collection_address );

      BOOST_CHECK_EQUAL( db.get_collection( token_kind::item ).counter, 1u );
      BOOST_CHECK_EQUAL( db.get_collection( token_kind::fuse_block ).counter, 0u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( item_mint_from_fuse_block )
{
   try {
      ACTORS((alice)(bob));
      mint_aura( alice_id, 300 );
      mint_aura( bob_id, 300 );

      const address fuse_block_id = mint_fuse_block( alice_id, 100 );

      const address own_item = mint_item( alice_id, 100, fuse_block_id );
      BOOST_REQUIRE( db.get_token( own_item ).origin.valid() );
      BOOST_CHECK( *db.get_token( own_item ).origin == fuse_block_id );

      BOOST_TEST_MESSAGE( "The originating FuseBlock need not belong to the caller" );
      const address bob_item = mint_item( bob_id, 150, fuse_block_id );
      BOOST_CHECK( *db.get_token( bob_item ).origin == fuse_block_id );
      BOOST_CHECK( db.get_token( bob_item ).owner == bob_id );
      BOOST_CHECK_EQUAL( db.get_token( bob_item ).name, "Item #2" );

      BOOST_CHECK_EQUAL( get_balance( alice_id ), 100 );
      BOOST_CHECK_EQUAL( get_balance( bob_id ), 150 );
      BOOST_CHECK_EQUAL( get_infused( fuse_block_id ), 100 );
      BOOST_CHECK_EQUAL( db.get_collection( token_kind::item ).counter, 2u );
      BOOST_CHECK_EQUAL( db.get_collection( token_kind::fuse_block ).counter, 1u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( item_mint_from_unknown_origin )
{
   try {
      ACTORS((alice));
      mint_aura( alice_id, 500 );

      INFUSION_REQUIRE_THROW( mint_item( alice_id, 100, actor_address( "nothing" ) ), not_found_exception );

      BOOST_TEST_MESSAGE( "An Item cannot be the origin of another Item" );
      const address item_id = mint_item( alice_id, 100 );
      INFUSION_REQUIRE_THROW( mint_item( alice_id, 100, item_id ), not_found_exception );

      BOOST_TEST_MESSAGE( "A burned FuseBlock is no longer an origin" );
      const address fuse_block_id = mint_fuse_block( alice_id, 100 );
      burn_and_extract( alice_id, fuse_block_id );
      INFUSION_REQUIRE_THROW( mint_item( alice_id, 100, fuse_block_id ), not_found_exception );

      BOOST_CHECK_EQUAL( get_balance( alice_id ), 400 );
      BOOST_CHECK_EQUAL( db.get_collection( token_kind::item ).counter, 1u );

      item_mint_operation op;
      op.caller = alice_id;
      op.amount = 100;
      op.origin = address();
      INFUSION_REQUIRE_THROW( op.validate(), fc::exception );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( item_mint_checks )
{
   try {
      ACTORS((alice));
      mint_aura( alice_id, 150 );

      INFUSION_REQUIRE_THROW( mint_item( alice_id, 99 ), below_minimum_infusion_exception );
      INFUSION_REQUIRE_THROW( mint_item( alice_id, 151 ), insufficient_aura_exception );

      freeze( alice_id );
      INFUSION_REQUIRE_THROW( mint_item( alice_id, 100 ), account_frozen_exception );
      unfreeze( alice_id );

      BOOST_CHECK_EQUAL( get_balance( alice_id ), 150 );
      BOOST_CHECK_EQUAL( db.get_collection( token_kind::item ).counter, 0u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( item_lifecycle )
{
   try {
      INVOKE( item_mint_from_fuse_block );
      GET_ACTOR( alice );
      GET_ACTOR( bob );

      const address bob_item = db.token_address_for( token_kind::item, 2 );

      qualify( bob_item );
      elevated_transfer( bob_item, alice_id );
      BOOST_CHECK( db.get_token( bob_item ).owner == alice_id );

      infuse_more( alice_id, bob_item, 50 );
      BOOST_CHECK_EQUAL( get_infused( bob_item ), 200 );

      INFUSION_REQUIRE_THROW( burn_and_extract( bob_id, bob_item ), not_owner_exception );
      burn_and_extract( alice_id, bob_item );
      BOOST_CHECK_EQUAL( get_balance( alice_id ), 250 );
      BOOST_CHECK( db.find_token( bob_item ) == nullptr );

      BOOST_TEST_MESSAGE( "Burning an Item leaves its origin alone" );
      const address fuse_block_id = db.token_address_for( token_kind::fuse_block, 1 );
      BOOST_CHECK( db.find_token( fuse_block_id ) != nullptr );
      BOOST_CHECK_EQUAL( get_infused( fuse_block_id ), 100 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
