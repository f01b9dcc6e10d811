/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
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
#include <meridian/utilities/memory_token_ledger.hpp>

namespace meridian { namespace utilities {

amount_type memory_token_ledger::balance_of( const asset_id_type& asset, const account_id_type& account )const
{
   auto itr = _balances.find( balance_key( asset, account ) );
   if( itr == _balances.end() )
      return 0;
   return itr->second;
}

void memory_token_ledger::transfer( const asset_id_type& asset, const account_id_type& from,
                                    const account_id_type& to, const amount_type& amount )
{ try {
   if( amount == 0 || from == to )
      return;
   reduce_balance( balance_key( asset, from ), amount );
   add_balance( balance_key( asset, to ), amount );
} FC_CAPTURE_AND_RETHROW( (asset)(from)(to)(amount) ) }

void memory_token_ledger::issue( const asset_id_type& asset, const account_id_type& to, const amount_type& amount )
{ try {
   _supply[asset] = checked_add( _supply[asset], amount );
   add_balance( balance_key( asset, to ), amount );
} FC_CAPTURE_AND_RETHROW( (asset)(to)(amount) ) }

void memory_token_ledger::burn( const asset_id_type& asset, const account_id_type& from, const amount_type& amount )
{ try {
   reduce_balance( balance_key( asset, from ), amount );
   _supply[asset] -= amount;
} FC_CAPTURE_AND_RETHROW( (asset)(from)(amount) ) }

amount_type memory_token_ledger::total_supply( const asset_id_type& asset )const
{
   auto itr = _supply.find( asset );
   if( itr == _supply.end() )
      return 0;
   return itr->second;
}

void memory_token_ledger::add_balance( const balance_key& key, const amount_type& amount )
{
   auto& balance = _balances[key];
   balance = checked_add( balance, amount );
}

void memory_token_ledger::reduce_balance( const balance_key& key, const amount_type& amount )
{
   if( amount == 0 )
      return;
   auto itr = _balances.find( key );
   const amount_type held = ( itr == _balances.end() ? amount_type(0) : itr->second );
   FC_ASSERT( held >= amount, "Insufficient Balance: ${a}'s balance of ${b} ${t} is less than required ${r}",
              ("a",key.second)("b",held)("t",key.first)("r",amount) );
   itr->second -= amount;
   if( itr->second == 0 )
      _balances.erase( itr );
}

} } // meridian::utilities
