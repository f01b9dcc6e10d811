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
#include <meridian/protocol/exceptions.hpp>

namespace meridian { namespace protocol {

   FC_IMPLEMENT_EXCEPTION( lending_exception, 5000000, "lending pool exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( arithmetic_overflow_exception,    lending_exception, 5010000,
                                   "arithmetic overflow" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( divide_by_zero_exception,         lending_exception, 5020000,
                                   "divide by zero" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( unauthorized_exception,           lending_exception, 5030000,
                                   "unauthorized" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_asset_exception,          lending_exception, 5040000,
                                   "invalid asset" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( external_call_failure_exception,  lending_exception, 5050000,
                                   "external call failure" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_liquidity_exception, lending_exception, 5060000,
                                   "insufficient liquidity" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_shares_exception,    lending_exception, 5070000,
                                   "insufficient shares" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( reentrancy_exception,             lending_exception, 5080000,
                                   "reentrant call" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_parameters_exception,     lending_exception, 5090000,
                                   "invalid parameters" )

} } // meridian::protocol
