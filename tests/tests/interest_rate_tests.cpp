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

#include <meridian/protocol/exceptions.hpp>
#include <meridian/protocol/fixed_point.hpp>
#include <meridian/protocol/interest_rate.hpp>

#include <boost/test/unit_test.hpp>

using namespace meridian::protocol;
using namespace meridian::test;

namespace {

   interest_rate_parameters make_curve()
   {
      interest_rate_parameters p;
      p.base_rate_per_second       = 1000;
      p.multiplier_per_second      = 2000000;
      p.jump_multiplier_per_second = 90000000;
      p.kink                       = amount_type( MERIDIAN_WAD ) * 8 / 10;
      p.reserve_factor             = amount_type( MERIDIAN_WAD ) / 10;
      return p;
   }

}

BOOST_AUTO_TEST_SUITE( interest_rate_tests )

BOOST_AUTO_TEST_CASE( utilization )
{
   BOOST_CHECK_EQUAL( utilization_rate( 0, 0 ), 0 );
   BOOST_CHECK_EQUAL( utilization_rate( 100, 0 ), 0 );
   BOOST_CHECK_EQUAL( utilization_rate( 0, 100 ), MERIDIAN_WAD );
   BOOST_CHECK_EQUAL( utilization_rate( wad(4), wad(1) ), amount_type( MERIDIAN_WAD ) / 5 );
}

BOOST_AUTO_TEST_CASE( rate_below_and_above_kink )
{
   const auto p = make_curve();

   // no borrows, only the base rate
   BOOST_CHECK_EQUAL( borrow_rate_per_second( p, 0, 0 ), p.base_rate_per_second );

   // 20% utilization
   const amount_type low = borrow_rate_per_second( p, wad(4), wad(1) );
   BOOST_CHECK_EQUAL( low, mul_wad( amount_type( MERIDIAN_WAD ) / 5, p.multiplier_per_second ) + p.base_rate_per_second );

   // 90% utilization, 10% above the kink
   const amount_type high = borrow_rate_per_second( p, wad(1), wad(9) );
   const amount_type normal = mul_wad( p.kink, p.multiplier_per_second ) + p.base_rate_per_second;
   const amount_type excess = utilization_rate( wad(1), wad(9) ) - p.kink;
   BOOST_CHECK_EQUAL( high, mul_wad( excess, p.jump_multiplier_per_second ) + normal );
   BOOST_CHECK( high > low );

   // fully utilized
   BOOST_CHECK_EQUAL( borrow_rate_per_second( p, 0, wad(1) ),
                      mul_wad( MERIDIAN_WAD - p.kink, p.jump_multiplier_per_second ) + normal );
}

BOOST_AUTO_TEST_CASE( rate_is_continuous_at_kink )
{
   const auto p = make_curve();

   // 80 borrowed out of 100 is exactly at the kink
   const amount_type at_kink = borrow_rate_per_second( p, wad(20), wad(80) );
   const amount_type sub_kink_branch = mul_wad( p.kink, p.multiplier_per_second ) + p.base_rate_per_second;
   const amount_type super_kink_branch = mul_wad( 0, p.jump_multiplier_per_second ) + sub_kink_branch;
   BOOST_CHECK_EQUAL( at_kink, sub_kink_branch );
   BOOST_CHECK_EQUAL( at_kink, super_kink_branch );

   // one unit past the kink only moves the rate by rounding
   const amount_type just_above = borrow_rate_per_second( p, wad(20) - 1, wad(80) + 1 );
   BOOST_CHECK( just_above >= at_kink );
   BOOST_CHECK( just_above - at_kink <= 1 );
}

BOOST_AUTO_TEST_CASE( rate_is_monotonic_in_utilization )
{
   const auto p = make_curve();
   amount_type previous = 0;
   for( uint64_t borrowed = 0; borrowed <= 100; borrowed += 5 )
   {
      const amount_type rate = borrow_rate_per_second( p, wad( 100 - borrowed ), wad( borrowed ) );
      BOOST_CHECK( rate >= previous );
      previous = rate;
   }
}

BOOST_AUTO_TEST_CASE( supply_rate_takes_reserve_cut )
{
   const auto p = make_curve();
   const amount_type util = utilization_rate( wad(1), wad(1) );
   const amount_type borrow_rate = borrow_rate_per_second( p, wad(1), wad(1) );
   BOOST_CHECK_EQUAL( supply_rate_per_second( p, wad(1), wad(1) ),
                      mul_wad( mul_wad( util, borrow_rate ), MERIDIAN_WAD - p.reserve_factor ) );
   BOOST_CHECK_EQUAL( supply_rate_per_second( p, wad(1), 0 ), 0 );
}

BOOST_AUTO_TEST_CASE( parameter_validation )
{
   auto p = make_curve();
   p.validate();

   p.kink = MERIDIAN_WAD;
   p.validate();
   p.kink = amount_type( MERIDIAN_WAD ) + 1;
   MERIDIAN_CHECK_THROW( p.validate(), invalid_parameters_exception );

   p = make_curve();
   p.reserve_factor = amount_type( MERIDIAN_WAD ) + 1;
   MERIDIAN_CHECK_THROW( p.validate(), invalid_parameters_exception );

   p = make_curve();
   p.jump_multiplier_per_second = amount_type(1) << 100;
   MERIDIAN_CHECK_THROW( p.validate(), arithmetic_overflow_exception );
}

BOOST_AUTO_TEST_CASE( annual_rates_are_divided_by_seconds_per_year )
{
   annual_interest_rates annual;
   annual.base_rate_per_year       = amount_type( MERIDIAN_WAD ) / 100;
   annual.multiplier_per_year      = amount_type( MERIDIAN_WAD ) / 10;
   annual.jump_multiplier_per_year = amount_type( MERIDIAN_WAD ) * 2;
   annual.kink                     = amount_type( MERIDIAN_WAD ) / 2;
   annual.reserve_factor           = amount_type( MERIDIAN_WAD ) / 20;

   const auto p = interest_rate_parameters::from_annual( annual );
   BOOST_CHECK_EQUAL( p.base_rate_per_second, amount_type( 317097919 ) );
   BOOST_CHECK_EQUAL( p.multiplier_per_second, amount_type( 3170979198ULL ) );
   BOOST_CHECK_EQUAL( p.jump_multiplier_per_second, amount_type( 63419583967ULL ) );
   BOOST_CHECK_EQUAL( p.kink, annual.kink );
   BOOST_CHECK_EQUAL( p.reserve_factor, annual.reserve_factor );
}

BOOST_AUTO_TEST_SUITE_END()
