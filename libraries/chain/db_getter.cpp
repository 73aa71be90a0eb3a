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
#include <infusion/chain/database.hpp>

#include <infusion/chain/asset_object.hpp>
#include <infusion/chain/creator_object.hpp>
#include <infusion/chain/exceptions.hpp>
#include <infusion/chain/global_property_object.hpp>
#include <infusion/chain/infusable_object.hpp>

#include <boost/tuple/tuple.hpp>

namespace infusion { namespace chain {

bool database::is_initialized()const
{
   return !get_index_type<global_property_index>().indices().empty();
}

const global_property_object& database::get_global_properties()const
{
   const auto& idx = get_index_type<global_property_index>().indices();
   INFUSION_ASSERT( !idx.empty(), database_query_exception, "Genesis has not been applied", ("index","global_properties") );
   return *idx.begin();
}

const creator_object& database::get_creator()const
{
   const auto& idx = get_index_type<creator_index>().indices();
   INFUSION_ASSERT( !idx.empty(), database_query_exception, "The creator has not been initialized", ("index","creator") );
   return *idx.begin();
}

const asset_object& database::get_aura()const
{
   const auto& idx = get_index_type<asset_index>().indices();
   INFUSION_ASSERT( !idx.empty(), database_query_exception, "The Aura asset has not been created", ("index","asset") );
   return *idx.begin();
}

const asset_dynamic_data_object& database::get_aura_dynamic_data()const
{
   return get_aura().dynamic_data( *this );
}

const collection_object& database::get_collection( token_kind kind )const
{
   const auto& idx = get_index_type<collection_index>().indices().get<by_collection_kind>();
   auto itr = idx.find( kind );
   INFUSION_ASSERT( itr != idx.end(), not_found_exception, "No ${kind} collection exists", ("kind",kind) );
   return *itr;
}

const infusable_token_object* database::find_token( const address& token )const
{
   const auto& idx = get_index_type<infusable_token_index>().indices().get<by_token_address>();
   auto itr = idx.find( token );
   if( itr == idx.end() ) return nullptr;
   return &*itr;
}

const infusable_token_object& database::get_token( const address& token )const
{
   const infusable_token_object* result = find_token( token );
   INFUSION_ASSERT( result != nullptr, not_found_exception, "Token ${token} does not exist", ("token",token) );
   return *result;
}

vector<const infusable_token_object*> database::get_tokens_by_owner( const address& owner )const
{
   vector<const infusable_token_object*> result;
   const auto& idx = get_index_type<infusable_token_index>().indices().get<by_token_owner>();
   auto range = idx.equal_range( boost::make_tuple( owner ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( &*itr );
   return result;
}

address database::token_address_for( token_kind kind, uint64_t sequence )const
{
   const collection_object& collection = get_collection( kind );
   return address::derive( collection.creator, collection.name + "::" + collection.token_name( sequence ) );
}

} }
