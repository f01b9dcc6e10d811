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
#include "../common/pool_fixture.hpp"

#include <boost/test/unit_test.hpp>

using namespace meridian::pool;
using namespace meridian::test;

namespace {

   /// 0.1% per second, so 1000 seconds double the index
   const amount_type one_permille_per_second = amount_type( MERIDIAN_WAD ) / 1000;

}

BOOST_FIXTURE_TEST_SUITE( borrow_ledger_tests, ledger_fixture )

BOOST_AUTO_TEST_CASE( initial_state )
{
   BOOST_CHECK_EQUAL( state().borrow_index, MERIDIAN_WAD );
   BOOST_CHECK_EQUAL( state().total_borrows, 0 );
   BOOST_CHECK_EQUAL( state().borrow_rate, 0 );
   BOOST_CHECK( state().last_accrual_time == clock.now() );

   const auto balance = ledger.live_debt( alice_id );
   BOOST_CHECK_EQUAL( balance.principal, 0 );
   BOOST_CHECK_EQUAL( balance.current_owed, 0 );
}

BOOST_AUTO_TEST_CASE( accrual_without_elapsed_time_is_a_noop )
{ try {
   params = flat_rate_parameters( one_permille_per_second );
   ledger.apply_delta( alice_id, 1000000, 0 );

   clock.advance( 10 );
   BOOST_REQUIRE( ledger.accrue( clock.now() ).valid() );
   const pool_state_object first = state();

   BOOST_CHECK( !ledger.accrue( clock.now() ).valid() );
   const pool_state_object& second = state();
   BOOST_CHECK_EQUAL( second.total_borrows, first.total_borrows );
   BOOST_CHECK_EQUAL( second.borrow_index, first.borrow_index );
   BOOST_CHECK_EQUAL( second.borrow_rate, first.borrow_rate );
   BOOST_CHECK_EQUAL( second.total_shares, first.total_shares );
   BOOST_CHECK( second.last_accrual_time == first.last_accrual_time );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( accrual_follows_linear_interest )
{ try {
   params = flat_rate_parameters( one_permille_per_second );
   ledger.apply_delta( alice_id, 1000000, 0 );

   clock.advance( 10 );
   const auto record = ledger.accrue( clock.now() );
   BOOST_REQUIRE( record.valid() );

   // factor = 0.1% * 10 = 1%
   BOOST_CHECK_EQUAL( record->interest_accrued, 10000 );
   BOOST_CHECK_EQUAL( record->total_borrows, 1010000 );
   BOOST_CHECK_EQUAL( record->cash, 0 );
   BOOST_CHECK( record->timestamp == clock.now() );
   BOOST_CHECK_EQUAL( state().borrow_index, amount_type( MERIDIAN_WAD ) + amount_type( MERIDIAN_WAD ) / 100 );
   BOOST_CHECK_EQUAL( state().borrow_rate, one_permille_per_second );

   // the debt grows with the index without touching the snapshot
   BOOST_CHECK_EQUAL( ledger.live_debt( alice_id ).principal, 1000000 );
   BOOST_CHECK_EQUAL( ledger.live_debt( alice_id ).current_owed, 1010000 );

   // 10% of the interest goes to reserves, priced 1:1 while there are no shares
   BOOST_CHECK_EQUAL( record->new_reserves, 1000 );
   BOOST_CHECK_EQUAL( db.get_share_balance( reserve_receiver ), 1000 );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( clock_running_backwards_is_rejected )
{
   clock.advance( 100 );
   ledger.accrue( clock.now() );
   MERIDIAN_REQUIRE_THROW( ledger.accrue( clock.now() - 1 ), arithmetic_overflow_exception );
}

BOOST_AUTO_TEST_CASE( borrow_index_never_decreases )
{ try {
   params = flat_rate_parameters( one_permille_per_second );
   amount_type previous = state().borrow_index;

   const uint32_t steps[] = { 0, 1, 7, 0, 60, 3600, 1, 86400 };
   uint32_t i = 0;
   for( uint32_t step : steps )
   {
      if( i % 2 == 0 )
         ledger.apply_delta( alice_id, 5000 + i, 0 );
      else
         ledger.apply_delta( alice_id, 0, 3000 );
      ++i;

      clock.advance( step );
      ledger.accrue( clock.now() );
      BOOST_CHECK( state().borrow_index >= previous );
      previous = state().borrow_index;
   }
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( equal_borrow_and_repay_leave_totals_unchanged )
{ try {
   ledger.apply_delta( alice_id, 400, 0 );
   const amount_type total = state().total_borrows;
   hook.discard();

   BOOST_CHECK_EQUAL( ledger.apply_delta( alice_id, 150, 150 ), 400 );
   BOOST_CHECK_EQUAL( ledger.apply_delta( bob_id, 150, 150 ), 0 );
   BOOST_CHECK_EQUAL( state().total_borrows, total );
   BOOST_CHECK( db.find_borrow_snapshot( bob_id ) == nullptr );
   BOOST_CHECK_EQUAL( hook.pending(), 0u );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( repaying_doubled_debt_closes_position )
{ try {
   params = flat_rate_parameters( one_permille_per_second );

   BOOST_CHECK_EQUAL( ledger.apply_delta( alice_id, 500, 0 ), 500 );
   clock.advance( 1000 );
   ledger.accrue( clock.now() );
   BOOST_REQUIRE_EQUAL( state().borrow_index, amount_type( MERIDIAN_WAD ) * 2 );
   BOOST_CHECK_EQUAL( ledger.live_debt( alice_id ).current_owed, 1000 );
   BOOST_CHECK_EQUAL( state().total_borrows, 1000 );

   BOOST_CHECK_EQUAL( ledger.apply_delta( alice_id, 0, 1000 ), 0 );

   const auto* snapshot = db.find_borrow_snapshot( alice_id );
   BOOST_REQUIRE( snapshot != nullptr );
   BOOST_CHECK_EQUAL( snapshot->interest_index, 0 );
   BOOST_CHECK( !snapshot->has_debt() );
   BOOST_CHECK_EQUAL( ledger.live_debt( alice_id ).principal, 0 );
   BOOST_CHECK_EQUAL( ledger.live_debt( alice_id ).current_owed, 0 );
   BOOST_CHECK_EQUAL( state().total_borrows, 0 );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( excess_repay_is_absorbed )
{ try {
   ledger.apply_delta( alice_id, 300, 0 );
   ledger.apply_delta( bob_id, 200, 0 );

   BOOST_CHECK_EQUAL( ledger.apply_delta( alice_id, 0, 1000 ), 0 );
   BOOST_CHECK_EQUAL( state().total_borrows, 200 );
   BOOST_CHECK_EQUAL( db.find_borrow_snapshot( alice_id )->interest_index, 0 );

   // a repay on an account that never borrowed changes nothing
   BOOST_CHECK_EQUAL( ledger.apply_delta( carol_id, 0, 50 ), 0 );
   BOOST_CHECK_EQUAL( state().total_borrows, 200 );

   // the closed position can be opened again at the current index
   BOOST_CHECK_EQUAL( ledger.apply_delta( alice_id, 70, 0 ), 70 );
   BOOST_CHECK_EQUAL( db.find_borrow_snapshot( alice_id )->interest_index, state().borrow_index );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( partial_repay_moves_snapshot_to_current_index )
{ try {
   params = flat_rate_parameters( one_permille_per_second );
   ledger.apply_delta( alice_id, 100000, 0 );
   clock.advance( 100 );   // +10%
   ledger.accrue( clock.now() );

   BOOST_CHECK_EQUAL( ledger.apply_delta( alice_id, 0, 10000 ), 100000 );
   const auto* snapshot = db.find_borrow_snapshot( alice_id );
   BOOST_CHECK_EQUAL( snapshot->principal, 100000 );
   BOOST_CHECK_EQUAL( snapshot->interest_index, state().borrow_index );
   BOOST_CHECK_EQUAL( state().total_borrows, 100000 );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( total_borrows_match_sum_of_debts )
{ try {
   params = flat_rate_parameters( one_permille_per_second );
   const account_id_type accounts[] = { alice_id, bob_id, carol_id };
   const uint32_t account_count = 3;

   auto check_conservation = [&]() {
      amount_type sum = 0;
      for( const auto& a : accounts )
         sum += ledger.live_debt( a ).current_owed;
      const amount_type total = state().total_borrows;
      const amount_type diff = total > sum ? total - sum : sum - total;
      BOOST_CHECK( diff <= account_count );
   };

   ledger.apply_delta( alice_id, 120000, 0 );
   ledger.apply_delta( bob_id, 80000, 0 );
   check_conservation();

   clock.advance( 10 );
   ledger.accrue( clock.now() );
   check_conservation();

   ledger.apply_delta( carol_id, 33333, 0 );
   ledger.apply_delta( alice_id, 0, 50000 );
   check_conservation();

   clock.advance( 37 );
   ledger.accrue( clock.now() );
   check_conservation();

   ledger.apply_delta( bob_id, 0, 1000000 );
   ledger.apply_delta( carol_id, 777, 100 );
   check_conservation();

   clock.advance( 5 );
   ledger.accrue( clock.now() );
   check_conservation();

   for( const auto& a : accounts )
      ledger.apply_delta( a, 0, ledger.live_debt( a ).current_owed );
   BOOST_CHECK( state().total_borrows <= account_count );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( deltas_queue_borrow_notifications )
{ try {
   ledger.apply_delta( alice_id, 900, 0 );
   ledger.apply_delta( alice_id, 0, 400 );
   BOOST_REQUIRE_EQUAL( hook.pending(), 2u );

   hook.flush();
   BOOST_REQUIRE_EQUAL( tracker.received.size(), 2u );
   BOOST_CHECK( tracker.received[0].account == alice_id );
   BOOST_CHECK_EQUAL( tracker.received[0].balance, 900 );
   BOOST_CHECK_EQUAL( tracker.received[1].balance, 500 );
   BOOST_CHECK( tracker.received[1].tag.kind == position_tag::borrow );
   BOOST_REQUIRE( tracker.received[1].tag.collateral.valid() );
   BOOST_CHECK( *tracker.received[1].tag.collateral == collateral_pool_id_type( 7 ) );
} catch (fc::exception& e) {
   edump((e.to_detail_string()));
   throw;
} }

BOOST_AUTO_TEST_CASE( total_borrows_are_range_checked )
{
   const amount_type max96 = ( amount_type(1) << 96 ) - 1;
   ledger.apply_delta( alice_id, max96, 0 );
   MERIDIAN_REQUIRE_THROW( ledger.apply_delta( bob_id, 1, 0 ), arithmetic_overflow_exception );
}

BOOST_AUTO_TEST_SUITE_END()
