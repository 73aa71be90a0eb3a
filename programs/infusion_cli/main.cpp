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
#include <iostream>
#include <string>

#include <fc/exception/exception.hpp>
#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/variant_object.hpp>

#include <infusion/chain/account_balance_object.hpp>
#include <infusion/chain/asset_object.hpp>
#include <infusion/chain/database.hpp>
#include <infusion/chain/genesis_state.hpp>
#include <infusion/chain/infusable_object.hpp>
#include <infusion/protocol/transaction.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

using namespace infusion::chain;
using namespace std;
namespace bpo = boost::program_options;

namespace {

fc::variant collect_state( const database& db )
{
   fc::variants balances;
   for( const account_balance_object& b : db.get_index_type<account_balance_index>().indices() )
      balances.emplace_back( b, INFUSION_MAX_NESTED_OBJECTS );

   fc::variants tokens;
   for( const infusable_token_object& t : db.get_index_type<infusable_token_index>().indices() )
   {
      fc::mutable_variant_object token( fc::variant( t, INFUSION_MAX_NESTED_OBJECTS ).get_object() );
      token( "infused", db.get_balance( t.balance_store ) );
      tokens.emplace_back( token );
   }

   fc::variants collections;
   for( const collection_object& c : db.get_index_type<collection_index>().indices() )
      collections.emplace_back( c, INFUSION_MAX_NESTED_OBJECTS );

   fc::mutable_variant_object state;
   state( "global_properties", fc::variant( db.get_global_properties(), INFUSION_MAX_NESTED_OBJECTS ) )
        ( "creator", fc::variant( db.get_creator(), INFUSION_MAX_NESTED_OBJECTS ) )
        ( "aura", fc::variant( db.get_aura(), INFUSION_MAX_NESTED_OBJECTS ) )
        ( "supply", fc::variant( db.get_aura_dynamic_data(), INFUSION_MAX_NESTED_OBJECTS ) )
        ( "collections", collections )
        ( "balances", balances )
        ( "tokens", tokens );
   return fc::variant( state );
}

}

int main( int argc, char** argv )
{
   try
   {
      bpo::options_description cli_options("Infusion ledger");
      cli_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("genesis-json,g", bpo::value<boost::filesystem::path>(), "File to read genesis state from")
            ("admin,a", bpo::value<std::string>(), "Admin address for the example genesis, used when no genesis file is given")
            ("transactions-json,t", bpo::value<boost::filesystem::path>(), "File holding a JSON array of signed transactions to apply in order")
            ("print-state,p", "Print the ledger and the token registry as JSON after applying the transactions")
            ;

      bpo::variables_map options;
      try
      {
         boost::program_options::store( boost::program_options::parse_command_line(argc, argv, cli_options), options );
      }
      catch (const boost::program_options::error& e)
      {
         std::cerr << "infusion_cli:  error parsing command line: " << e.what() << "\n";
         return 1;
      }

      if( options.count("help") )
      {
         std::cout << cli_options << "\n";
         return 0;
      }

      genesis_state_type genesis;
      if( options.count("genesis-json") )
      {
         fc::path genesis_json_filename = options["genesis-json"].as<boost::filesystem::path>();
         ilog( "Reading genesis from file ${f}", ("f", genesis_json_filename.preferred_string()) );
         genesis = fc::json::from_file( genesis_json_filename ).as< genesis_state_type >( INFUSION_MAX_NESTED_OBJECTS );
      }
      else
      {
         if( !options.count("admin") )
         {
            std::cerr << "--admin is required when no --genesis-json is given\n";
            return 1;
         }
         ilog( "Using example genesis" );
         genesis = create_example_genesis( address( options["admin"].as<std::string>() ) );
      }

      database db;
      db.init_genesis( genesis );

      if( options.count("transactions-json") )
      {
         fc::path trx_filename = options["transactions-json"].as<boost::filesystem::path>();
         const auto transactions = fc::json::from_file( trx_filename )
                                      .as< vector<signed_transaction> >( INFUSION_MAX_NESTED_OBJECTS );

         uint32_t applied = 0;
         for( size_t i = 0; i < transactions.size(); ++i )
         {
            try
            {
               const processed_transaction ptrx = db.push_transaction( transactions[i] );
               ilog( "Applied transaction ${i}: ${r}", ("i",i)("r",ptrx.operation_results) );
               ++applied;
            }
            catch( const fc::exception& e )
            {
               // A rejected transaction leaves no trace, carry on with the next one
               elog( "Transaction ${i} rejected: ${e}", ("i",i)("e",e.to_detail_string()) );
            }
         }
         ilog( "Applied ${n} of ${t} transactions", ("n",applied)("t",transactions.size()) );
      }

      if( options.count("print-state") )
         std::cout << fc::json::to_pretty_string( collect_state( db ) ) << "\n";
   }
   catch ( const fc::exception& e )
   {
      std::cerr << e.to_detail_string() << "\n";
      return 1;
   }
   return 0;
}
