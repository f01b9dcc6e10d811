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

#include <cstdint>
#include <string>
#include <vector>

#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/time.hpp>
#include <fc/uint128.hpp>

#include <meridian/db/object_id.hpp>
#include <meridian/protocol/config.hpp>

namespace meridian { namespace protocol {
using namespace meridian::db;

using std::string;
using std::vector;

using fc::optional;
using fc::time_point_sec;
using fc::variant;

/// Monetary amounts, fixed-point rates and indexes
using amount_type = fc::uint128_t;

enum object_space_type
{
   relative_protocol_ids = 0,
   protocol_ids          = 1,
   implementation_ids    = 2
};

/**
 *  Identities owned by the surrounding system.  The core never creates these objects,
 *  it only uses their ids as keys.
 */
enum protocol_object_type
{
   null_object_type,
   account_object_type,
   asset_object_type,
   collateral_pool_object_type,
   PROTOCOL_OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
};

using account_id_type         = object_id< protocol_ids, account_object_type >;
using asset_id_type           = object_id< protocol_ids, asset_object_type >;
using collateral_pool_id_type = object_id< protocol_ids, collateral_pool_object_type >;

} } // meridian::protocol

FC_REFLECT_ENUM( meridian::protocol::object_space_type,
                 (relative_protocol_ids)(protocol_ids)(implementation_ids) )
FC_REFLECT_ENUM( meridian::protocol::protocol_object_type,
                 (null_object_type)(account_object_type)(asset_object_type)(collateral_pool_object_type)
                 (PROTOCOL_OBJECT_TYPE_COUNT) )
