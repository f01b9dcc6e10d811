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
#include <meridian/protocol/exceptions.hpp>
#include <meridian/protocol/fixed_point.hpp>
#include <meridian/protocol/pool_parameters.hpp>
#include <meridian/protocol/records.hpp>

namespace meridian { namespace pool {

using namespace meridian::protocol;

enum impl_object_type
{
   impl_pool_state_object_type,
   impl_borrow_snapshot_object_type,
   impl_share_balance_object_type
};

class pool_state_object;
class borrow_snapshot_object;
class share_balance_object;

using pool_state_id_type       = object_id< implementation_ids, impl_pool_state_object_type >;
using borrow_snapshot_id_type  = object_id< implementation_ids, impl_borrow_snapshot_object_type >;
using share_balance_id_type    = object_id< implementation_ids, impl_share_balance_object_type >;

/// Rounding direction of share and asset conversions
enum class rounding
{
   down,
   up
};

} } // meridian::pool

FC_REFLECT_ENUM( meridian::pool::impl_object_type,
                 (impl_pool_state_object_type)(impl_borrow_snapshot_object_type)(impl_share_balance_object_type) )
