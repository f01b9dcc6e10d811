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

#include <meridian/pool/types.hpp>
#include <meridian/db/generic_index.hpp>

namespace meridian { namespace pool {

/**
 *  @brief Aggregate borrow accounting of a pool
 *
 *  There is exactly one of these per pool database, created with the pool.  The borrow index only
 *  ever grows and only inside accrual; total borrows grows with accrual and moves with borrow and
 *  repay deltas.
 */
class pool_state_object : public abstract_object<pool_state_object>
{
   public:
      static constexpr uint8_t space_id = implementation_ids;
      static constexpr uint8_t type_id  = impl_pool_state_object_type;

      amount_type      total_borrows = 0;                             ///< Principal plus accrued interest, 96 bits
      amount_type      borrow_index = MERIDIAN_INITIAL_BORROW_INDEX;  ///< Wad, 96 bits
      amount_type      borrow_rate = 0;                               ///< Last per-second rate, 80 bits
      time_point_sec   last_accrual_time;
      amount_type      total_shares = 0;                              ///< Supply of pool shares
};

/**
 *  @brief Borrow position of one account as of its last balance-changing action
 *
 *  An interest_index of zero marks an account without debt.
 */
class borrow_snapshot_object : public abstract_object<borrow_snapshot_object>
{
   public:
      static constexpr uint8_t space_id = implementation_ids;
      static constexpr uint8_t type_id  = impl_borrow_snapshot_object_type;

      account_id_type  borrower;
      amount_type      principal = 0;
      amount_type      interest_index = 0;

      bool has_debt()const { return interest_index != 0; }
};

/// Pool shares held by one account
class share_balance_object : public abstract_object<share_balance_object>
{
   public:
      static constexpr uint8_t space_id = implementation_ids;
      static constexpr uint8_t type_id  = impl_share_balance_object_type;

      account_id_type  owner;
      amount_type      balance = 0;
};

struct by_account;

using pool_state_multi_index_type = multi_index_container<
   pool_state_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
   >
>;
using pool_state_index = generic_index<pool_state_object, pool_state_multi_index_type>;

using borrow_snapshot_multi_index_type = multi_index_container<
   borrow_snapshot_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_account>,
         member< borrow_snapshot_object, account_id_type, &borrow_snapshot_object::borrower > >
   >
>;
using borrow_snapshot_index = generic_index<borrow_snapshot_object, borrow_snapshot_multi_index_type>;

using share_balance_multi_index_type = multi_index_container<
   share_balance_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_account>,
         member< share_balance_object, account_id_type, &share_balance_object::owner > >
   >
>;
using share_balance_index = generic_index<share_balance_object, share_balance_multi_index_type>;

} } // meridian::pool

FC_REFLECT_DERIVED( meridian::pool::pool_state_object, (meridian::db::object),
                    (total_borrows)(borrow_index)(borrow_rate)(last_accrual_time)(total_shares) )
FC_REFLECT_DERIVED( meridian::pool::borrow_snapshot_object, (meridian::db::object),
                    (borrower)(principal)(interest_index) )
FC_REFLECT_DERIVED( meridian::pool::share_balance_object, (meridian::db::object),
                    (owner)(balance) )
