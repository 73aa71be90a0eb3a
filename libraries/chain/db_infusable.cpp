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
#include <infusion/chain/database.hpp>

#include <infusion/chain/account_balance_object.hpp>
#include <infusion/chain/exceptions.hpp>
#include <infusion/chain/infusable_object.hpp>

namespace infusion { namespace chain {

const collection_object& database::create_collection( const creator_signer& signer, token_kind kind,
                                                      const genesis_state_type::initial_collection_type& c )
{ try {
   FC_ASSERT( signer.get_address() == get_creator().creator, "Only the creator may create collections" );

   const auto& idx = get_index_type<collection_index>().indices().get<by_collection_kind>();
   FC_ASSERT( idx.find( kind ) == idx.end(), "A ${kind} collection already exists", ("kind",kind) );

   return create<collection_object>( [&]( collection_object& obj ) {
      obj.kind = kind;
      obj.name = c.name;
      obj.description = c.description;
      obj.uri = c.uri;
      obj.token_name_prefix = c.token_name_prefix;
      obj.collection_address = address::derive( signer.get_address(), c.name );
      obj.creator = signer.get_address();
      obj.counter = 0;
   });
} FC_CAPTURE_AND_RETHROW( (kind)(c.name) ) }

const infusable_token_object& database::mint_infusable_token( const creator_signer& signer, token_kind kind,
                                                              const address& caller, share_type amount,
                                                              const optional<address>& origin )
{ try {
   FC_ASSERT( signer.get_address() == get_creator().creator, "Only the creator may mint tokens" );

   const collection_object& collection = get_collection( kind );
   const uint64_t sequence = collection.counter + 1;
   const address token_address = token_address_for( kind, sequence );
   FC_ASSERT( find_token( token_address ) == nullptr, "Token ${t} already exists", ("t",token_address) );

   const infusable_token_object& token = create<infusable_token_object>( [&]( infusable_token_object& obj ) {
      obj.kind = kind;
      obj.token_address = token_address;
      obj.collection = collection.collection_address;
      obj.creator = signer.get_address();
      obj.owner = caller;
      obj.sequence = sequence;
      obj.name = collection.token_name( sequence );
      obj.uri = collection.token_uri( sequence );
      obj.description = collection.description;
      obj.balance_store = address::derive( token_address, INFUSION_TOKEN_STORE_SEED );
      obj.qualifies = false;
      obj.origin = origin;
      obj.capabilities = token_capabilities( token_address );
   });

   // Move the infusion from the caller into the token's store.  The store
   // belongs to the token, so its frozen flag never applies.
   deposit_aura( withdraw_aura( caller, amount ), token.balance_store, true );

   modify( collection, []( collection_object& c ) {
      c.counter += 1;
   });

   return token;
} FC_CAPTURE_AND_RETHROW( (kind)(caller)(amount)(origin) ) }

void database::qualify_token( const infusable_token_object& token )
{
   if( token.qualifies )
      return;
   modify( token, []( infusable_token_object& t ) {
      t.qualifies = true;
   });
}

void database::transfer_token( const infusable_token_object& token, const address& new_owner )
{ try {
   FC_ASSERT( token.capabilities.transfer_ref == token.token_address,
              "The transfer capability of ${name} is not bound to it", ("name",token.name) );
   FC_ASSERT( !new_owner.is_null(), "A token cannot be transferred to the null address" );

   modify( token, [&new_owner]( infusable_token_object& t ) {
      t.owner = new_owner;
   });
} FC_CAPTURE_AND_RETHROW( (token.token_address)(new_owner) ) }

share_type database::burn_token( const infusable_token_object& token )
{ try {
   FC_ASSERT( token.capabilities.is_bound_to( token.token_address ),
              "The capabilities of ${name} are not bound to it", ("name",token.name) );

   const address owner = token.owner;
   const address store = token.balance_store;

   INFUSION_ASSERT( !is_frozen( owner ), account_frozen_exception, "Account ${a} is frozen", ("a",owner) );

   // Drain the store to the owner
   const share_type extracted = get_balance( store );
   deposit_aura( withdraw_aura( store, extracted, true ), owner );

   const share_type remaining = get_balance( store );
   INFUSION_ASSERT( remaining == share_type(0), invariant_violation_exception,
                    "${name} still holds ${remaining} after extraction",
                    ("name",token.name)("remaining",remaining) );

   if( const account_balance_object* entry = find_balance_entry( store ) )
      remove( *entry );

   // The capabilities go with the token object
   remove( token );

   return extracted;
} FC_CAPTURE_AND_RETHROW( (token.token_address) ) }

address database::aura_receiver( const address& target )const
{
   const infusable_token_object* token = find_token( target );
   return ( token != nullptr ) ? token->balance_store : target;
}

void database::infuse_token( const address& from, const infusable_token_object& token, share_type amount,
                             bool ignore_freeze )
{ try {
   FC_ASSERT( token.capabilities.extend_ref == token.token_address,
              "The extend capability of ${name} is not bound to it", ("name",token.name) );
   deposit_aura( withdraw_aura( from, amount, ignore_freeze ), token.balance_store, true );
} FC_CAPTURE_AND_RETHROW( (from)(token.token_address)(amount)(ignore_freeze) ) }

} }
