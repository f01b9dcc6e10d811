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
#include <meridian/pool/pool_database.hpp>

namespace meridian { namespace pool {

pool_database::pool_database( time_point_sec created )
{
   initialize_indexes();

   const auto& state = create<pool_state_object>( [created]( pool_state_object& s ) {
      s.last_accrual_time = created;
   });
   _pool_state_id = pool_state_id_type( state.id );
}

void pool_database::initialize_indexes()
{
   add_index<pool_state_index>();
   add_index<borrow_snapshot_index>();
   add_index<share_balance_index>();
}

const pool_state_object& pool_database::get_pool_state()const
{
   return get<pool_state_object>( object_id_type( _pool_state_id ) );
}

const borrow_snapshot_object* pool_database::find_borrow_snapshot( const account_id_type& account )const
{
   const auto& idx = get_index_type<borrow_snapshot_index>().indices().get<by_account>();
   auto itr = idx.find( account );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const borrow_snapshot_object& pool_database::get_or_create_borrow_snapshot( const account_id_type& account )
{
   const borrow_snapshot_object* snapshot = find_borrow_snapshot( account );
   if( snapshot != nullptr )
      return *snapshot;
   return create<borrow_snapshot_object>( [&account]( borrow_snapshot_object& s ) {
      s.borrower = account;
   });
}

amount_type pool_database::get_share_balance( const account_id_type& account )const
{
   const auto& idx = get_index_type<share_balance_index>().indices().get<by_account>();
   auto itr = idx.find( account );
   if( itr == idx.end() )
      return 0;
   return itr->balance;
}

void pool_database::add_shares( const account_id_type& account, const amount_type& amount )
{ try {
   if( amount == 0 )
      return;

   modify( get_pool_state(), [&amount]( pool_state_object& s ) {
      s.total_shares = checked_add( s.total_shares, amount );
   });

   const auto& idx = get_index_type<share_balance_index>().indices().get<by_account>();
   auto itr = idx.find( account );
   if( itr == idx.end() )
   {
      create<share_balance_object>( [&account,&amount]( share_balance_object& b ) {
         b.owner = account;
         b.balance = amount;
      });
   }
   else
   {
      modify( *itr, [&amount]( share_balance_object& b ) {
         b.balance = checked_add( b.balance, amount );
      });
   }
} FC_CAPTURE_AND_RETHROW( (account)(amount) ) }

void pool_database::remove_shares( const account_id_type& account, const amount_type& amount )
{ try {
   if( amount == 0 )
      return;

   const auto& idx = get_index_type<share_balance_index>().indices().get<by_account>();
   auto itr = idx.find( account );
   const amount_type held = ( itr == idx.end() ? amount_type(0) : itr->balance );
   MERIDIAN_ASSERT( held >= amount, insufficient_shares_exception,
                    "Account ${a} holds ${h} shares, ${n} required", ("a",account)("h",held)("n",amount) );

   if( held == amount )
      remove( *itr );
   else
      modify( *itr, [&amount]( share_balance_object& b ) {
         b.balance -= amount;
      });

   modify( get_pool_state(), [&amount]( pool_state_object& s ) {
      s.total_shares = checked_sub( s.total_shares, amount );
   });
} FC_CAPTURE_AND_RETHROW( (account)(amount) ) }

} } // meridian::pool
