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
#include <meridian/protocol/fixed_point.hpp>
#include <meridian/protocol/exceptions.hpp>

#include <boost/multiprecision/cpp_int.hpp>

namespace meridian { namespace protocol {

using boost::multiprecision::uint256_t;

namespace {

   amount_type narrow_to_128( const uint256_t& v )
   {
      MERIDIAN_ASSERT( v <= uint256_t( max_amount() ), arithmetic_overflow_exception,
                       "Result ${v} does not fit 128 bits", ("v",v.str()) );
      return static_cast<amount_type>( v );
   }

   amount_type check_width( const amount_type& v, uint32_t bits )
   {
      MERIDIAN_ASSERT( ( v >> bits ) == 0, arithmetic_overflow_exception,
                       "Value out of range for ${bits} bits", ("bits",bits) );
      return v;
   }

}

amount_type max_amount()
{
   return ~amount_type(0);
}

amount_type mul_wad( const amount_type& a, const amount_type& b )
{
   return full_mul_div( a, b, MERIDIAN_WAD );
}

amount_type div_wad( const amount_type& a, const amount_type& b )
{
   return full_mul_div( a, MERIDIAN_WAD, b );
}

amount_type full_mul_div( const amount_type& a, const amount_type& n, const amount_type& d )
{
   MERIDIAN_ASSERT( d != 0, divide_by_zero_exception, "Division of ${a} * ${n} by zero", ("a",a)("n",n) );
   const uint256_t product = uint256_t( a ) * uint256_t( n );
   return narrow_to_128( product / uint256_t( d ) );
}

amount_type full_mul_div_up( const amount_type& a, const amount_type& n, const amount_type& d )
{
   MERIDIAN_ASSERT( d != 0, divide_by_zero_exception, "Division of ${a} * ${n} by zero", ("a",a)("n",n) );
   const uint256_t product = uint256_t( a ) * uint256_t( n );
   const uint256_t denom( d );
   uint256_t result = product / denom;
   if( product % denom != 0 )
      ++result;
   return narrow_to_128( result );
}

amount_type checked_add( const amount_type& a, const amount_type& b )
{
   MERIDIAN_ASSERT( max_amount() - a >= b, arithmetic_overflow_exception, "Addition overflow: ${a} + ${b}", ("a",a)("b",b) );
   return a + b;
}

amount_type checked_sub( const amount_type& a, const amount_type& b )
{
   MERIDIAN_ASSERT( a >= b, arithmetic_overflow_exception, "Subtraction underflow: ${a} - ${b}", ("a",a)("b",b) );
   return a - b;
}

amount_type checked_mul( const amount_type& a, const amount_type& b )
{
   return narrow_to_128( uint256_t( a ) * uint256_t( b ) );
}

amount_type saturating_sub( const amount_type& a, const amount_type& b )
{
   return a > b ? a - b : amount_type(0);
}

amount_type to_u96( const amount_type& v )
{
   return check_width( v, 96 );
}

amount_type to_u80( const amount_type& v )
{
   return check_width( v, 80 );
}

uint64_t to_u48( const amount_type& v )
{
   return static_cast<uint64_t>( check_width( v, 48 ) );
}

uint32_t to_u32( const amount_type& v )
{
   return static_cast<uint32_t>( check_width( v, 32 ) );
}

} } // meridian::protocol
