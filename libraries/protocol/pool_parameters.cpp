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
#include <meridian/protocol/pool_parameters.hpp>
#include <meridian/protocol/exceptions.hpp>

namespace meridian { namespace protocol {

void pool_parameters::validate()const
{ try {
   MERIDIAN_ASSERT( underlying_asset != strategy_asset, invalid_parameters_exception,
                    "Underlying and strategy asset must differ, both are ${a}", ("a",underlying_asset) );
   MERIDIAN_ASSERT( pool_account != reserve_receiver, invalid_parameters_exception,
                    "The pool account ${p} can not receive its own reserves", ("p",pool_account) );
   rates.validate();
} FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // meridian::protocol
