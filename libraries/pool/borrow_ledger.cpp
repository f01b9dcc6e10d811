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
#include <meridian/pool/borrow_ledger.hpp>

#include <fc/log/logger.hpp>

namespace meridian { namespace pool {

borrow_ledger::borrow_ledger( pool_database& db, const strategy_adapter& strategy, reserve_minter& minter,
                              reward_hook& hook, const pool_parameters& params )
:_db(db),_strategy(strategy),_minter(minter),_hook(hook),_params(params)
{
}

optional<accrual_record> borrow_ledger::accrue( time_point_sec now )
{ try {
   const pool_state_object& state = _db.get_pool_state();

   MERIDIAN_ASSERT( now >= state.last_accrual_time, arithmetic_overflow_exception,
                    "Clock moved backwards from ${last} to ${now}", ("last",state.last_accrual_time)("now",now) );
   const uint32_t elapsed = now.sec_since_epoch() - state.last_accrual_time.sec_since_epoch();
   if( elapsed == 0 )
      return optional<accrual_record>();

   const amount_type cash = _strategy.balance();
   const amount_type borrows_before = state.total_borrows;
   const amount_type index_before = state.borrow_index;

   const amount_type rate = borrow_rate_per_second( _params.rates, cash, borrows_before );
   const amount_type interest_factor = checked_mul( rate, elapsed );
   const amount_type interest_accrued = mul_wad( interest_factor, borrows_before );

   const amount_type total_borrows = to_u96( checked_add( borrows_before, interest_accrued ) );
   const amount_type borrow_index = to_u96( checked_add( index_before, mul_wad( interest_factor, index_before ) ) );
   const amount_type borrow_rate = to_u80( rate );

   _db.modify( state, [&]( pool_state_object& s ) {
      s.total_borrows = total_borrows;
      s.borrow_index = borrow_index;
      s.borrow_rate = borrow_rate;
      s.last_accrual_time = now;
   });

   accrual_record record;
   record.cash = cash;
   record.total_borrows = total_borrows;
   record.interest_accrued = interest_accrued;
   record.new_reserves = _minter.mint( interest_accrued );
   record.timestamp = now;
   return record;
} FC_CAPTURE_AND_RETHROW( (now) ) }

borrow_balance borrow_ledger::live_debt( const account_id_type& account )const
{
   borrow_balance result{ 0, 0 };
   const borrow_snapshot_object* snapshot = _db.find_borrow_snapshot( account );
   if( snapshot == nullptr || !snapshot->has_debt() )
      return result;

   result.principal = snapshot->principal;
   result.current_owed = full_mul_div( snapshot->principal, _db.get_pool_state().borrow_index,
                                       snapshot->interest_index );
   return result;
}

amount_type borrow_ledger::apply_delta( const account_id_type& account, const amount_type& borrow_amount,
                                        const amount_type& repay_amount )
{ try {
   const amount_type owed = live_debt( account ).current_owed;
   if( borrow_amount == repay_amount )
      return owed;

   const pool_state_object& state = _db.get_pool_state();
   const amount_type index = state.borrow_index;
   amount_type new_owed;

   if( borrow_amount > repay_amount )
   {
      const amount_type increase = borrow_amount - repay_amount;
      new_owed = checked_add( owed, increase );
      const amount_type total_borrows = to_u96( checked_add( state.total_borrows, increase ) );
      _db.modify( state, [&total_borrows]( pool_state_object& s ) {
         s.total_borrows = total_borrows;
      });
      _db.modify( _db.get_or_create_borrow_snapshot( account ), [&new_owed,&index]( borrow_snapshot_object& b ) {
         b.principal = new_owed;
         b.interest_index = index;
      });
   }
   else
   {
      const amount_type decrease = repay_amount - borrow_amount;
      new_owed = saturating_sub( owed, decrease );
      const amount_type applied = owed - new_owed;
      _db.modify( state, [&applied]( pool_state_object& s ) {
         s.total_borrows = saturating_sub( s.total_borrows, applied );
      });
      const borrow_snapshot_object* snapshot = _db.find_borrow_snapshot( account );
      if( snapshot != nullptr )
      {
         _db.modify( *snapshot, [&new_owed,&index]( borrow_snapshot_object& b ) {
            b.principal = new_owed;
            b.interest_index = ( new_owed == 0 ? amount_type(0) : index );
         });
      }
   }

   _hook.notify( account, new_owed, position_tag::for_borrow( _params.collateral_pool ) );
   return new_owed;
} FC_CAPTURE_AND_RETHROW( (account)(borrow_amount)(repay_amount) ) }

} } // meridian::pool
