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

#include <boost/test/unit_test.hpp>

using namespace meridian::protocol;
using namespace meridian::test;

BOOST_AUTO_TEST_SUITE( fixed_point_tests )

BOOST_AUTO_TEST_CASE( wad_multiplication_and_division )
{
   const amount_type one = MERIDIAN_WAD;
   const amount_type half = one / 2;

   BOOST_CHECK_EQUAL( mul_wad( one, one ), one );
   BOOST_CHECK_EQUAL( mul_wad( wad(3), half ), wad(3) / 2 );
   BOOST_CHECK_EQUAL( mul_wad( 1, half ), 0 );               // rounds down
   BOOST_CHECK_EQUAL( mul_wad( 3, half ), 1 );

   BOOST_CHECK_EQUAL( div_wad( wad(1), wad(4) ), one / 4 );
   BOOST_CHECK_EQUAL( div_wad( 1, 3 ), amount_type( 333333333333333333ULL ) );
   MERIDIAN_CHECK_THROW( div_wad( 1, 0 ), divide_by_zero_exception );
}

BOOST_AUTO_TEST_CASE( full_mul_div_keeps_intermediate_precision )
{
   // a * n overflows 128 bits but the quotient fits
   const amount_type big = max_amount() / 3;
   BOOST_CHECK_EQUAL( full_mul_div( big, 6, 6 ), big );
   BOOST_CHECK_EQUAL( full_mul_div( big, MERIDIAN_WAD, MERIDIAN_WAD ), big );

   BOOST_CHECK_EQUAL( full_mul_div( 10, 10, 3 ), 33 );
   BOOST_CHECK_EQUAL( full_mul_div_up( 10, 10, 3 ), 34 );
   BOOST_CHECK_EQUAL( full_mul_div_up( 10, 9, 3 ), 30 );     // exact results are not rounded up
   BOOST_CHECK_EQUAL( full_mul_div_up( 0, 9, 3 ), 0 );

   MERIDIAN_CHECK_THROW( full_mul_div( 1, 1, 0 ), divide_by_zero_exception );
   MERIDIAN_CHECK_THROW( full_mul_div_up( 1, 1, 0 ), divide_by_zero_exception );
   MERIDIAN_CHECK_THROW( full_mul_div( max_amount(), 2, 1 ), arithmetic_overflow_exception );
   MERIDIAN_CHECK_THROW( full_mul_div_up( max_amount(), 3, 2 ), arithmetic_overflow_exception );
}

BOOST_AUTO_TEST_CASE( checked_arithmetic )
{
   BOOST_CHECK_EQUAL( checked_add( 2, 3 ), 5 );
   BOOST_CHECK_EQUAL( checked_add( max_amount() - 1, 1 ), max_amount() );
   MERIDIAN_CHECK_THROW( checked_add( max_amount(), 1 ), arithmetic_overflow_exception );

   BOOST_CHECK_EQUAL( checked_sub( 5, 5 ), 0 );
   MERIDIAN_CHECK_THROW( checked_sub( 4, 5 ), arithmetic_overflow_exception );

   BOOST_CHECK_EQUAL( checked_mul( amount_type(1) << 63, 2 ), amount_type(1) << 64 );
   MERIDIAN_CHECK_THROW( checked_mul( amount_type(1) << 64, amount_type(1) << 64 ), arithmetic_overflow_exception );

   BOOST_CHECK_EQUAL( saturating_sub( 5, 7 ), 0 );
   BOOST_CHECK_EQUAL( saturating_sub( 7, 5 ), 2 );
}

BOOST_AUTO_TEST_CASE( narrowing_casts )
{
   const amount_type max96 = ( amount_type(1) << 96 ) - 1;
   BOOST_CHECK_EQUAL( to_u96( max96 ), max96 );
   MERIDIAN_CHECK_THROW( to_u96( max96 + 1 ), arithmetic_overflow_exception );

   const amount_type max80 = ( amount_type(1) << 80 ) - 1;
   BOOST_CHECK_EQUAL( to_u80( max80 ), max80 );
   MERIDIAN_CHECK_THROW( to_u80( max80 + 1 ), arithmetic_overflow_exception );

   BOOST_CHECK_EQUAL( to_u48( 0xffffffffffffULL ), 0xffffffffffffULL );
   MERIDIAN_CHECK_THROW( to_u48( amount_type(1) << 48 ), arithmetic_overflow_exception );

   BOOST_CHECK_EQUAL( to_u32( 0xffffffffU ), 0xffffffffU );
   MERIDIAN_CHECK_THROW( to_u32( amount_type(1) << 32 ), arithmetic_overflow_exception );
}

BOOST_AUTO_TEST_CASE( arithmetic_errors_are_lending_exceptions )
{
   MERIDIAN_CHECK_THROW( div_wad( 1, 0 ), lending_exception );
   MERIDIAN_CHECK_THROW( to_u32( amount_type(1) << 40 ), lending_exception );
   try {
      to_u96( max_amount() );
      BOOST_FAIL( "expected an overflow" );
   } catch( const fc::exception& e ) {
      BOOST_CHECK_EQUAL( e.code(), 5010000 );
   }
}

BOOST_AUTO_TEST_SUITE_END()
