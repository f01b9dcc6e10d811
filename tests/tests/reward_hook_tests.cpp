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

BOOST_FIXTURE_TEST_SUITE( reward_hook_tests, collaborators_fixture )

BOOST_AUTO_TEST_CASE( without_tracker_nothing_is_queued )
{
   reward_hook hook;
   BOOST_CHECK( !hook.has_tracker() );
   hook.notify( alice_id, 100, position_tag::for_lend() );
   BOOST_CHECK_EQUAL( hook.pending(), 0u );
   hook.flush();
}

BOOST_AUTO_TEST_CASE( notifications_are_delivered_on_flush )
{
   reward_hook hook( &tracker );
   hook.notify( alice_id, 100, position_tag::for_lend() );
   hook.notify( bob_id, 50, position_tag::for_borrow( collateral_pool_id_type( 9 ) ) );
   BOOST_CHECK_EQUAL( hook.pending(), 2u );
   BOOST_CHECK( tracker.received.empty() );

   hook.flush();
   BOOST_CHECK_EQUAL( hook.pending(), 0u );
   BOOST_REQUIRE_EQUAL( tracker.received.size(), 2u );

   BOOST_CHECK( tracker.received[0].account == alice_id );
   BOOST_CHECK_EQUAL( tracker.received[0].balance, 100 );
   BOOST_CHECK( tracker.received[0].tag.kind == position_tag::lend );
   BOOST_CHECK( !tracker.received[0].tag.collateral.valid() );

   BOOST_CHECK( tracker.received[1].account == bob_id );
   BOOST_CHECK( tracker.received[1].tag.kind == position_tag::borrow );
   BOOST_CHECK( *tracker.received[1].tag.collateral == collateral_pool_id_type( 9 ) );
}

BOOST_AUTO_TEST_CASE( borrow_tag_without_collateral_reference )
{
   const auto tag = position_tag::for_borrow( fc::optional<collateral_pool_id_type>() );
   BOOST_CHECK( tag.kind == position_tag::borrow );
   BOOST_CHECK( !tag.collateral.valid() );
}

BOOST_AUTO_TEST_CASE( discarded_notifications_are_never_delivered )
{
   reward_hook hook( &tracker );
   hook.notify( alice_id, 100, position_tag::for_lend() );
   hook.discard();
   hook.flush();
   BOOST_CHECK( tracker.received.empty() );
   BOOST_CHECK_EQUAL( tracker.attempts, 0u );
}

BOOST_AUTO_TEST_CASE( tracker_failures_are_contained )
{
   reward_hook hook( &tracker );

   tracker.mode = recording_reward_tracker::throw_fc_exception;
   hook.notify( alice_id, 1, position_tag::for_lend() );
   hook.notify( bob_id, 2, position_tag::for_lend() );
   BOOST_CHECK_NO_THROW( hook.flush() );
   BOOST_CHECK_EQUAL( tracker.attempts, 2u );

   tracker.mode = recording_reward_tracker::throw_std_exception;
   hook.notify( alice_id, 3, position_tag::for_lend() );
   BOOST_CHECK_NO_THROW( hook.flush() );
   BOOST_CHECK_EQUAL( tracker.attempts, 3u );
   BOOST_CHECK( tracker.received.empty() );
}

BOOST_AUTO_TEST_CASE( release_hands_over_the_queue )
{
   reward_hook hook( &tracker );
   hook.notify( carol_id, 10, position_tag::for_lend() );
   const auto released = hook.release();
   BOOST_CHECK_EQUAL( released.size(), 1u );
   BOOST_CHECK_EQUAL( hook.pending(), 0u );

   reward_hook::deliver( hook.tracker(), released );
   BOOST_REQUIRE_EQUAL( tracker.received.size(), 1u );
   BOOST_CHECK( tracker.received[0].account == carol_id );
}

BOOST_AUTO_TEST_SUITE_END()
