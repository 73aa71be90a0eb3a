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

#include <infusion/chain/account_balance_object.hpp>
#include <infusion/chain/asset_object.hpp>
#include <infusion/chain/exceptions.hpp>

#include <boost/tuple/tuple.hpp>

namespace infusion { namespace chain {

const account_balance_object* database::find_balance_entry( const address& owner )const
{
   const auto& index = get_index_type<account_balance_index>().indices().get<by_account_asset>();
   auto itr = index.find( boost::make_tuple( owner, get_aura().asset_address ) );
   if( itr == index.end() )
      return nullptr;
   return &*itr;
}

share_type database::get_balance( const address& owner )const
{
   const account_balance_object* entry = find_balance_entry( owner );
   if( entry == nullptr )
      return share_type(0);
   return entry->balance;
}

bool database::is_frozen( const address& owner )const
{
   const account_balance_object* entry = find_balance_entry( owner );
   return entry != nullptr && entry->frozen;
}

void database::adjust_balance( const address& owner, share_type delta )
{ try {

   if( delta == share_type(0) )
      return;

   const account_balance_object* entry = find_balance_entry( owner );

   if( entry == nullptr )
   {
      INFUSION_ASSERT( delta > 0, insufficient_balance_exception,
                       "Insufficient Balance: ${a}'s balance of 0 is less than required ${r}",
                       ("a",owner)("r",-delta) );
      const address asset_type = get_aura().asset_address;
      create<account_balance_object>( [&owner,&asset_type,&delta]( account_balance_object& b ) {
         b.owner = owner;
         b.asset_type = asset_type;
         b.balance = delta;
      });
   }
   else
   {
      if( delta < 0 )
         INFUSION_ASSERT( entry->balance >= -delta, insufficient_balance_exception,
                          "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                          ("a",owner)("b",entry->balance)("r",-delta) );
      modify( *entry, [&delta]( account_balance_object& b ) {
         b.balance += delta;
      });
   }

} FC_CAPTURE_AND_RETHROW( (owner)(delta) ) }

void database::set_frozen( const address& owner, bool frozen )
{ try {
   const account_balance_object* entry = find_balance_entry( owner );

   if( entry == nullptr )
   {
      if( !frozen )
         return;
      const address asset_type = get_aura().asset_address;
      create<account_balance_object>( [&owner,&asset_type]( account_balance_object& b ) {
         b.owner = owner;
         b.asset_type = asset_type;
         b.balance = 0;
         b.frozen = true;
      });
      return;
   }

   if( entry->frozen == frozen )
      return;
   modify( *entry, [frozen]( account_balance_object& b ) {
      b.frozen = frozen;
   });
} FC_CAPTURE_AND_RETHROW( (owner)(frozen) ) }

void database::issue_aura( const creator_signer& signer, const address& to, share_type amount )
{ try {
   const asset_object& aura = get_aura();
   FC_ASSERT( signer.get_address() == aura.issuer, "Only the issuer of ${symbol} may create new supply", ("symbol",aura.symbol) );
   FC_ASSERT( amount > 0, "The amount to issue should be positive" );
   INFUSION_ASSERT( aura.can_mint(), capability_disabled_exception,
                    "${symbol} does not allow new supply", ("symbol",aura.symbol) );

   const asset_dynamic_data_object& dyn = aura.dynamic_data( *this );
   if( aura.max_supply > 0 )
   {
      INFUSION_ASSERT( dyn.current_supply + amount <= aura.max_supply, max_supply_exceeded_exception,
                       "Issuing ${amount} would exceed the maximum supply of ${max}",
                       ("amount",amount)("max",aura.max_supply) );
   }

   modify( dyn, [&amount]( asset_dynamic_data_object& data ) {
      data.current_supply += amount;
      data.total_minted += amount;
   });
   adjust_balance( to, amount );
} FC_CAPTURE_AND_RETHROW( (to)(amount) ) }

void database::retire_aura( const address& from, share_type amount )
{ try {
   const asset_object& aura = get_aura();
   FC_ASSERT( amount > 0, "The amount to retire should be positive" );
   INFUSION_ASSERT( aura.can_burn(), capability_disabled_exception,
                    "${symbol} does not allow burning", ("symbol",aura.symbol) );

   adjust_balance( from, -amount );
   modify( aura.dynamic_data( *this ), [&amount]( asset_dynamic_data_object& data ) {
      data.current_supply -= amount;
      data.total_burned += amount;
   });
} FC_CAPTURE_AND_RETHROW( (from)(amount) ) }

aura_unit database::withdraw_aura( const address& from, share_type amount, bool ignore_freeze )
{ try {
   FC_ASSERT( amount >= 0, "Withdrawal amount should not be negative" );
   if( !ignore_freeze )
      INFUSION_ASSERT( !is_frozen( from ), account_frozen_exception, "Account ${a} is frozen", ("a",from) );

   adjust_balance( from, -amount );
   return aura_unit( get_aura().asset_address, amount );
} FC_CAPTURE_AND_RETHROW( (from)(amount)(ignore_freeze) ) }

void database::deposit_aura( aura_unit&& unit, const address& to, bool ignore_freeze )
{ try {
   FC_ASSERT( unit.asset_type() == get_aura().asset_address, "Only Aura can be deposited" );

   if( unit.amount() == share_type(0) )
   {
      destroy_zero( std::move( unit ) );
      return;
   }

   if( !ignore_freeze )
      INFUSION_ASSERT( !is_frozen( to ), account_frozen_exception, "Account ${a} is frozen", ("a",to) );

   adjust_balance( to, unit.extract() );
} FC_CAPTURE_AND_RETHROW( (to)(ignore_freeze) ) }

void database::destroy_zero( aura_unit&& unit )
{
   INFUSION_ASSERT( unit.amount() == share_type(0), invariant_violation_exception,
                    "Cannot destroy a unit still holding ${amount}", ("amount",unit.amount()) );
}

void database::transfer_aura( const address& from, const address& to, share_type amount, bool ignore_freeze )
{ try {
   // The receiver is checked before anything leaves the sender
   if( !ignore_freeze && amount != share_type(0) )
      INFUSION_ASSERT( !is_frozen( to ), account_frozen_exception, "Account ${a} is frozen", ("a",to) );

   deposit_aura( withdraw_aura( from, amount, ignore_freeze ), to, ignore_freeze );
} FC_CAPTURE_AND_RETHROW( (from)(to)(amount)(ignore_freeze) ) }

} }
