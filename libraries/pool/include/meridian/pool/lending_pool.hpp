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

#include <meridian/pool/borrow_ledger.hpp>
#include <meridian/pool/time_source.hpp>
#include <meridian/pool/token_ledger.hpp>

#include <fc/signals.hpp>

#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/shared_mutex.hpp>

#include <atomic>
#include <thread>

namespace meridian { namespace pool {

   /**
    *  @class lending_pool
    *  @brief Entry points of a single lending pool
    *
    *  Every mutating call holds the pool lock exclusively, accrues interest up to the clock and
    *  runs inside one undo session: if anything throws, every pool object change of the call is
    *  discarded together with its queued reward notifications.  Records and reward notifications
    *  are delivered after the call committed and the lock was released, one call at a time and in
    *  commit order.
    *
    *  Token and vault movements happen on the external collaborators, which keep their own
    *  bookkeeping.  Underlying pulled from a payer is handed back when the vault refuses it, and
    *  underlying left over from a vault redemption is swept into the vault by the next call that
    *  deposits.  A collaborator calling back into the pool while a call is in progress gets a
    *  reentrancy_exception, and so does a reward tracker or record observer calling a mutating
    *  entry point; both may read.
    */
   class lending_pool
   {
      public:
         lending_pool( const pool_parameters& params, token_ledger& tokens, yield_vault& vault,
                       const time_source& clock, reward_tracker* tracker = nullptr );

         /// Accrues interest up to now
         optional<accrual_record> accrue_interest();

         /// Supplies @p assets of the underlying and returns the shares minted to @p account
         amount_type deposit( const account_id_type& account, const amount_type& assets );
         /// Mints exactly @p shares to @p account and returns the underlying taken, rounded up
         amount_type mint( const account_id_type& account, const amount_type& shares );
         /// Pays out exactly @p assets and returns the shares burned, rounded up
         amount_type withdraw( const account_id_type& account, const amount_type& assets );
         /// Burns exactly @p shares and returns the underlying paid out, rounded down
         amount_type redeem( const account_id_type& account, const amount_type& shares );

         /// Lends @p amount to @p account and returns its debt afterwards
         amount_type borrow( const account_id_type& account, const amount_type& amount );
         /**
          *  Repays up to @p amount of the debt of @p borrower out of the funds of @p payer.  Only the
          *  amount owed is taken from the payer.
          *  @return the debt of @p borrower afterwards
          */
         amount_type repay( const account_id_type& payer, const account_id_type& borrower,
                            const amount_type& amount );
         /**
          *  Debt side of a liquidation: @p liquidator repays @p repay_amount of the debt of
          *  @p borrower, which must not exceed the debt.  Collateral seizure happens elsewhere.
          *  @return the debt of @p borrower afterwards
          */
         amount_type liquidate( const account_id_type& liquidator, const account_id_type& borrower,
                                const amount_type& repay_amount );

         /// Sweeps the pool's balance of each of @p tokens to the reserve receiver, harvester only
         reserve_harvest_record harvest_reserves( const account_id_type& caller,
                                                  const vector<asset_id_type>& tokens );

         /// Accrues with the current curve and installs @p rates, admin only
         optional<accrual_record> update_interest_rate_parameters( const account_id_type& caller,
                                                                   const interest_rate_parameters& rates );

         /// @name Reads
         /// Reflect the last committed call; nothing is accrued.
         /// @{
         amount_type         get_total_borrows()const;
         amount_type         get_borrow_index()const;
         amount_type         get_borrow_rate()const;
         time_point_sec      get_last_accrual_time()const;
         amount_type         utilization_rate()const;
         amount_type         supply_rate()const;
         borrow_balance      get_borrow_balance( const account_id_type& account )const;
         amount_type         exchange_rate()const;
         amount_type         total_assets()const;
         amount_type         total_shares()const;
         amount_type         share_balance( const account_id_type& account )const;
         pool_parameters     get_parameters()const;
         /// @}

         void set_reward_tracker( reward_tracker* tracker );

         /**
          *  Emitted after a committed call that accrued interest
          */
         fc::signal<void(const accrual_record&)>            accrued;
         /**
          *  Emitted after a committed reserve harvest
          */
         fc::signal<void(const reserve_harvest_record&)>    reserves_harvested;

      private:
         template<typename Operation>
         auto apply( const char* name, Operation&& op ) -> decltype( op() );

         void check_not_reentrant( const char* name )const;
         void accrue_locked();
         void notify_share_balance( const account_id_type& account );
         void pull_into_strategy( const account_id_type& payer, const amount_type& amount );
         void pay_out_of_strategy( const account_id_type& receiver, const amount_type& amount );
         amount_type repay_locked( const account_id_type& payer, const account_id_type& borrower,
                                   const amount_type& amount, bool exact );

         pool_parameters                       _params;
         token_ledger&                         _tokens;
         const time_source&                    _clock;

         pool_database                         _db;
         strategy_adapter                      _strategy;
         reward_hook                           _hook;
         reserve_minter                        _minter;
         borrow_ledger                         _ledger;

         mutable boost::shared_mutex           _mutex;
         std::atomic<std::thread::id>          _writer;
         std::atomic<std::thread::id>          _deliverer;

         /// Commit order of the calls, guarded by _mutex
         uint64_t                              _next_ticket = 0;
         /// Ticket whose records are delivered next, guarded by _delivery_mutex
         uint64_t                              _serving = 0;
         boost::mutex                          _delivery_mutex;
         boost::condition_variable             _delivery_turn;

         vector<accrual_record>                _pending_accruals;
         vector<reserve_harvest_record>        _pending_harvests;
   };

} } // meridian::pool
