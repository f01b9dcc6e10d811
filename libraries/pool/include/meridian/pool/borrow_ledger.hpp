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

#include <meridian/pool/reserve_minter.hpp>
#include <meridian/pool/reward_hook.hpp>

namespace meridian { namespace pool {

   /**
    *  @brief Global interest accrual and per-account borrow snapshots
    *
    *  Interest is captured by the shared borrow index: an account's debt is its principal scaled by
    *  the growth of the index since its snapshot was written, so accrual never touches per-account
    *  state.
    */
   class borrow_ledger
   {
      public:
         borrow_ledger( pool_database& db, const strategy_adapter& strategy, reserve_minter& minter,
                        reward_hook& hook, const pool_parameters& params );

         /**
          *  Brings the pool state forward to @p now.  Interest grows linearly with the elapsed time
          *  at the rate implied by the utilization before the accrual.
          *
          *  @return the accrual record, or nothing when no time has passed since the last accrual
          *  @throws arithmetic_overflow_exception when @p now is before the last accrual
          */
         optional<accrual_record> accrue( time_point_sec now );

         /// Principal and current debt of @p account, (0,0) for an account without debt
         borrow_balance live_debt( const account_id_type& account )const;

         /**
          *  Applies a borrow and a repay amount to the position of @p account.  A decrease larger
          *  than the debt closes the position and the excess is ignored.
          *
          *  @return the amount owed after the change
          */
         amount_type apply_delta( const account_id_type& account, const amount_type& borrow_amount,
                                  const amount_type& repay_amount );

      private:
         pool_database&           _db;
         const strategy_adapter&  _strategy;
         reserve_minter&          _minter;
         reward_hook&             _hook;
         const pool_parameters&   _params;
   };

} } // meridian::pool
