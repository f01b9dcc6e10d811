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

   /// Emitted once per accrual that advanced the clock
   struct accrual_record
   {
      amount_type      cash;
      amount_type      total_borrows;
      amount_type      interest_accrued;
      amount_type      new_reserves;
      time_point_sec   timestamp;
   };

   /// Emitted when stray tokens held by the pool are swept to the reserve receiver
   struct reserve_harvest_record
   {
      account_id_type          caller;
      vector<asset_id_type>    tokens;
      vector<amount_type>      amounts;
      time_point_sec           timestamp;
   };

   /// Principal recorded at the last touch and the amount owed now
   struct borrow_balance
   {
      amount_type principal;
      amount_type current_owed;
   };

} } // meridian::protocol

FC_REFLECT( meridian::protocol::accrual_record,
            (cash)(total_borrows)(interest_accrued)(new_reserves)(timestamp) )
FC_REFLECT( meridian::protocol::reserve_harvest_record,
            (caller)(tokens)(amounts)(timestamp) )
FC_REFLECT( meridian::protocol::borrow_balance,
            (principal)(current_owed) )
