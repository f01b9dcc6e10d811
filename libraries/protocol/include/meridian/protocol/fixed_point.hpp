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
#pragma once

#include <meridian/protocol/types.hpp>

namespace meridian { namespace protocol {

   /**
    *  Fixed-point helpers on 1e18 scaled ("wad") values.  Every operation either returns
    *  an exact, correctly rounded result or throws arithmetic_overflow_exception or
    *  divide_by_zero_exception; nothing wraps silently.
    */

   /// Largest value representable by @ref amount_type
   amount_type max_amount();

   /// floor( a * b / 1e18 )
   amount_type mul_wad( const amount_type& a, const amount_type& b );
   /// floor( a * 1e18 / b )
   amount_type div_wad( const amount_type& a, const amount_type& b );

   /// floor( a * n / d ), computed with a 256-bit intermediate product
   amount_type full_mul_div( const amount_type& a, const amount_type& n, const amount_type& d );
   /// ceil( a * n / d ), computed with a 256-bit intermediate product
   amount_type full_mul_div_up( const amount_type& a, const amount_type& n, const amount_type& d );

   amount_type checked_add( const amount_type& a, const amount_type& b );
   amount_type checked_sub( const amount_type& a, const amount_type& b );
   amount_type checked_mul( const amount_type& a, const amount_type& b );
   /// max( a - b, 0 )
   amount_type saturating_sub( const amount_type& a, const amount_type& b );

   /// Narrowing casts, throwing when the value does not fit the target width
   /// @{
   amount_type to_u96( const amount_type& v );
   amount_type to_u80( const amount_type& v );
   uint64_t    to_u48( const amount_type& v );
   uint32_t    to_u32( const amount_type& v );
   /// @}

} } // meridian::protocol
