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

#include <fc/exception/exception.hpp>

#define MERIDIAN_ASSERT( expr, exc_type, FORMAT, ... )                \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

namespace meridian { namespace protocol {

   FC_DECLARE_EXCEPTION( lending_exception, 5000000 )

   /// A fixed-point operation or narrowing cast exceeded the representable range
   FC_DECLARE_DERIVED_EXCEPTION( arithmetic_overflow_exception,    lending_exception, 5010000 )
   FC_DECLARE_DERIVED_EXCEPTION( divide_by_zero_exception,         lending_exception, 5020000 )
   /// A privileged operation was invoked by an account without the role
   FC_DECLARE_DERIVED_EXCEPTION( unauthorized_exception,           lending_exception, 5030000 )
   /// The underlying or the strategy asset was given where a foreign token was expected
   FC_DECLARE_DERIVED_EXCEPTION( invalid_asset_exception,          lending_exception, 5040000 )
   /// The yield vault or the token ledger failed or returned an unusable result
   FC_DECLARE_DERIVED_EXCEPTION( external_call_failure_exception,  lending_exception, 5050000 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_liquidity_exception, lending_exception, 5060000 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_shares_exception,    lending_exception, 5070000 )
   FC_DECLARE_DERIVED_EXCEPTION( reentrancy_exception,             lending_exception, 5080000 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_parameters_exception,     lending_exception, 5090000 )

} } // meridian::protocol
