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
#include <meridian/pool/lending_pool.hpp>

#include <fc/log/logger.hpp>

#include <algorithm>

namespace meridian { namespace pool {

namespace {

   /// Marks the calling thread as the writer for the lifetime of a mutating call
   class writer_scope
   {
      public:
         explicit writer_scope( std::atomic<std::thread::id>& writer ) : _writer(writer)
         {
            _writer.store( std::this_thread::get_id() );
         }
         ~writer_scope()
         {
            _writer.store( std::thread::id() );
         }

      private:
         std::atomic<std::thread::id>& _writer;
   };

   /// Holds the delivery turn of one committed call, in the order the calls committed
   class delivery_turn
   {
      public:
         delivery_turn( boost::mutex& mutex, boost::condition_variable& turn, uint64_t& serving,
                        uint64_t ticket, std::atomic<std::thread::id>& deliverer )
         :_mutex(mutex),_turn(turn),_serving(serving),_deliverer(deliverer)
         {
            boost::unique_lock<boost::mutex> lock( _mutex );
            _turn.wait( lock, [this,ticket]() { return _serving == ticket; } );
            _deliverer.store( std::this_thread::get_id() );
         }
         ~delivery_turn()
         {
            _deliverer.store( std::thread::id() );
            {
               boost::unique_lock<boost::mutex> lock( _mutex );
               ++_serving;
            }
            _turn.notify_all();
         }

      private:
         boost::mutex&                  _mutex;
         boost::condition_variable&     _turn;
         uint64_t&                      _serving;
         std::atomic<std::thread::id>&  _deliverer;
   };

   void require_positive( const amount_type& amount, const char* what )
   {
      MERIDIAN_ASSERT( amount != 0, invalid_parameters_exception, "${what} must be positive", ("what",what) );
   }

}

lending_pool::lending_pool( const pool_parameters& params, token_ledger& tokens, yield_vault& vault,
                            const time_source& clock, reward_tracker* tracker )
:_params(params),
 _tokens(tokens),
 _clock(clock),
 _db(clock.now()),
 _strategy(vault, params.pool_account),
 _hook(tracker),
 _minter(_db, _strategy, _params),
 _ledger(_db, _strategy, _minter, _hook, _params),
 _writer(std::thread::id()),
 _deliverer(std::thread::id())
{
   _params.validate();
   MERIDIAN_ASSERT( vault.asset() == _params.underlying_asset, invalid_parameters_exception,
                    "Vault accepts ${v}, pool underlying is ${u}",
                    ("v",vault.asset())("u",_params.underlying_asset) );
   ilog( "Lending pool ${p} created at ${t}", ("p",_params.pool_account)("t",clock.now()) );
}

void lending_pool::check_not_reentrant( const char* name )const
{
   MERIDIAN_ASSERT( _writer.load() != std::this_thread::get_id(), reentrancy_exception,
                    "${name} called while the pool is being modified by the same thread", ("name",name) );
}

template<typename Operation>
auto lending_pool::apply( const char* name, Operation&& op ) -> decltype( op() )
{
   check_not_reentrant( name );
   MERIDIAN_ASSERT( _deliverer.load() != std::this_thread::get_id(), reentrancy_exception,
                    "${name} called while the pool delivers the records of a committed call", ("name",name) );

   decltype( op() ) result;
   vector<accrual_record> accruals;
   vector<reserve_harvest_record> harvests;
   vector<reward_notification> notifications;
   reward_tracker* tracker = nullptr;
   uint64_t ticket = 0;
   {
      boost::unique_lock<boost::shared_mutex> lock( _mutex );
      writer_scope writer( _writer );

      auto session = _db.start_undo_session();
      try {
         result = op();
         session.commit();
      } catch( const fc::exception& e ) {
         wlog( "${name} rolled back: ${e}", ("name",name)("e",e.to_string()) );
         _pending_accruals.clear();
         _pending_harvests.clear();
         _hook.discard();
         throw;
      } catch( const std::exception& e ) {
         wlog( "${name} rolled back: ${e}", ("name",name)("e",e.what()) );
         _pending_accruals.clear();
         _pending_harvests.clear();
         _hook.discard();
         throw;
      }

      accruals.swap( _pending_accruals );
      harvests.swap( _pending_harvests );
      notifications = _hook.release();
      tracker = _hook.tracker();
      ticket = _next_ticket++;
   }

   delivery_turn turn( _delivery_mutex, _delivery_turn, _serving, ticket, _deliverer );
   try {
      for( const auto& record : accruals )
         accrued( record );
      for( const auto& record : harvests )
         reserves_harvested( record );
   } catch( const fc::exception& e ) {
      elog( "Record observer of ${name} failed: ${e}", ("name",name)("e",e.to_detail_string()) );
   } catch( const std::exception& e ) {
      elog( "Record observer of ${name} failed: ${e}", ("name",name)("e",e.what()) );
   }
   reward_hook::deliver( tracker, notifications );

   return result;
}

void lending_pool::accrue_locked()
{
   optional<accrual_record> record = _ledger.accrue( _clock.now() );
   if( !record.valid() )
      return;

   dlog( "Accrued ${r}", ("r",*record) );
   if( record->new_reserves != 0 )
      notify_share_balance( _params.reserve_receiver );
   _pending_accruals.push_back( *record );
}

void lending_pool::notify_share_balance( const account_id_type& account )
{
   _hook.notify( account, _db.get_share_balance( account ), position_tag::for_lend() );
}

void lending_pool::pull_into_strategy( const account_id_type& payer, const amount_type& amount )
{
   _tokens.transfer( _params.underlying_asset, payer, _params.pool_account, amount );
   try {
      // also sweeps underlying left over from earlier vault redemptions
      _strategy.on_deposit( _tokens.balance_of( _params.underlying_asset, _params.pool_account ) );
   } catch( const fc::exception& e ) {
      wlog( "Returning ${a} to ${p}: ${e}", ("a",amount)("p",payer)("e",e.to_string()) );
      _tokens.transfer( _params.underlying_asset, _params.pool_account, payer, amount );
      throw;
   } catch( const std::exception& e ) {
      wlog( "Returning ${a} to ${p}: ${e}", ("a",amount)("p",payer)("e",e.what()) );
      _tokens.transfer( _params.underlying_asset, _params.pool_account, payer, amount );
      throw;
   }
}

void lending_pool::pay_out_of_strategy( const account_id_type& receiver, const amount_type& amount )
{
   const amount_type received = _strategy.on_withdraw( amount );
   if( received > amount )
      dlog( "Holding ${d} of redeemed underlying until the next deposit", ("d",received - amount) );
   _tokens.transfer( _params.underlying_asset, _params.pool_account, receiver, amount );
}

optional<accrual_record> lending_pool::accrue_interest()
{
   return apply( "accrue_interest", [this]() -> optional<accrual_record> {
      accrue_locked();
      if( _pending_accruals.empty() )
         return optional<accrual_record>();
      return _pending_accruals.back();
   });
}

amount_type lending_pool::deposit( const account_id_type& account, const amount_type& assets )
{
   return apply( "deposit", [&]() -> amount_type {
      require_positive( assets, "Deposit" );
      accrue_locked();

      const amount_type shares = _minter.convert_to_shares( assets, rounding::down );
      MERIDIAN_ASSERT( shares != 0, insufficient_shares_exception,
                       "A deposit of ${a} is worth no shares", ("a",assets) );
      _db.add_shares( account, shares );
      notify_share_balance( account );

      pull_into_strategy( account, assets );
      return shares;
   });
}

amount_type lending_pool::mint( const account_id_type& account, const amount_type& shares )
{
   return apply( "mint", [&]() -> amount_type {
      require_positive( shares, "Mint" );
      accrue_locked();

      const amount_type assets = _minter.convert_to_assets( shares, rounding::up );
      require_positive( assets, "Mint price" );
      _db.add_shares( account, shares );
      notify_share_balance( account );

      pull_into_strategy( account, assets );
      return assets;
   });
}

amount_type lending_pool::withdraw( const account_id_type& account, const amount_type& assets )
{
   return apply( "withdraw", [&]() -> amount_type {
      require_positive( assets, "Withdrawal" );
      accrue_locked();

      const amount_type shares = _minter.convert_to_shares( assets, rounding::up );
      _db.remove_shares( account, shares );
      notify_share_balance( account );

      pay_out_of_strategy( account, assets );
      return shares;
   });
}

amount_type lending_pool::redeem( const account_id_type& account, const amount_type& shares )
{
   return apply( "redeem", [&]() -> amount_type {
      require_positive( shares, "Redemption" );
      accrue_locked();

      const amount_type assets = _minter.convert_to_assets( shares, rounding::down );
      require_positive( assets, "Redeemed amount" );
      _db.remove_shares( account, shares );
      notify_share_balance( account );

      pay_out_of_strategy( account, assets );
      return assets;
   });
}

amount_type lending_pool::borrow( const account_id_type& account, const amount_type& amount )
{
   return apply( "borrow", [&]() -> amount_type {
      require_positive( amount, "Borrow amount" );
      accrue_locked();

      const amount_type cash = _strategy.balance();
      MERIDIAN_ASSERT( amount <= cash, insufficient_liquidity_exception,
                       "Borrowing ${a} exceeds the pool cash of ${c}", ("a",amount)("c",cash) );

      const amount_type owed = _ledger.apply_delta( account, amount, 0 );

      pay_out_of_strategy( account, amount );
      return owed;
   });
}

amount_type lending_pool::repay_locked( const account_id_type& payer, const account_id_type& borrower,
                                        const amount_type& amount, bool exact )
{
   accrue_locked();

   const amount_type owed = _ledger.live_debt( borrower ).current_owed;
   if( exact )
      MERIDIAN_ASSERT( amount <= owed, invalid_parameters_exception,
                       "Repaying ${a} exceeds the debt of ${o}", ("a",amount)("o",owed) );
   const amount_type moved = std::min( amount, owed );

   const amount_type new_owed = _ledger.apply_delta( borrower, 0, amount );

   if( moved != 0 )
      pull_into_strategy( payer, moved );
   return new_owed;
}

amount_type lending_pool::repay( const account_id_type& payer, const account_id_type& borrower,
                                 const amount_type& amount )
{
   return apply( "repay", [&]() -> amount_type {
      require_positive( amount, "Repay amount" );
      return repay_locked( payer, borrower, amount, false );
   });
}

amount_type lending_pool::liquidate( const account_id_type& liquidator, const account_id_type& borrower,
                                     const amount_type& repay_amount )
{
   return apply( "liquidate", [&]() -> amount_type {
      require_positive( repay_amount, "Liquidation amount" );
      return repay_locked( liquidator, borrower, repay_amount, true );
   });
}

reserve_harvest_record lending_pool::harvest_reserves( const account_id_type& caller,
                                                       const vector<asset_id_type>& tokens )
{
   return apply( "harvest_reserves", [&]() -> reserve_harvest_record {
      MERIDIAN_ASSERT( caller == _params.reserve_harvester, unauthorized_exception,
                       "${c} is not the reserve harvester", ("c",caller) );
      for( const auto& token : tokens )
         MERIDIAN_ASSERT( token != _params.underlying_asset && token != _params.strategy_asset,
                          invalid_asset_exception, "Pool asset ${t} can not be harvested", ("t",token) );

      reserve_harvest_record record;
      record.caller = caller;
      record.timestamp = _clock.now();
      for( const auto& token : tokens )
      {
         const amount_type amount = _tokens.balance_of( token, _params.pool_account );
         if( amount != 0 )
            _tokens.transfer( token, _params.pool_account, _params.reserve_receiver, amount );
         record.tokens.push_back( token );
         record.amounts.push_back( amount );
      }

      ilog( "Harvested reserves ${r}", ("r",record) );
      _pending_harvests.push_back( record );
      return record;
   });
}

optional<accrual_record> lending_pool::update_interest_rate_parameters( const account_id_type& caller,
                                                                        const interest_rate_parameters& rates )
{
   return apply( "update_interest_rate_parameters", [&]() -> optional<accrual_record> {
      MERIDIAN_ASSERT( caller == _params.admin, unauthorized_exception,
                       "${c} is not the pool admin", ("c",caller) );
      rates.validate();

      accrue_locked();
      optional<accrual_record> result;
      if( !_pending_accruals.empty() )
         result = _pending_accruals.back();

      _params.rates = rates;
      ilog( "Interest rate parameters of pool ${p} set to ${r}", ("p",_params.pool_account)("r",rates) );
      return result;
   });
}

amount_type lending_pool::get_total_borrows()const
{
   check_not_reentrant( "get_total_borrows" );
   boost::shared_lock<boost::shared_mutex> lock( _mutex );
   return _db.get_pool_state().total_borrows;
}

amount_type lending_pool::get_borrow_index()const
{
   check_not_reentrant( "get_borrow_index" );
   boost::shared_lock<boost::shared_mutex> lock( _mutex );
   return _db.get_pool_state().borrow_index;
}

amount_type lending_pool::get_borrow_rate()const
{
   check_not_reentrant( "get_borrow_rate" );
   boost::shared_lock<boost::shared_mutex> lock( _mutex );
   return _db.get_pool_state().borrow_rate;
}

time_point_sec lending_pool::get_last_accrual_time()const
{
   check_not_reentrant( "get_last_accrual_time" );
   boost::shared_lock<boost::shared_mutex> lock( _mutex );
   return _db.get_pool_state().last_accrual_time;
}

amount_type lending_pool::utilization_rate()const
{
   check_not_reentrant( "utilization_rate" );
   boost::shared_lock<boost::shared_mutex> lock( _mutex );
   return protocol::utilization_rate( _strategy.balance(), _db.get_pool_state().total_borrows );
}

amount_type lending_pool::supply_rate()const
{
   check_not_reentrant( "supply_rate" );
   boost::shared_lock<boost::shared_mutex> lock( _mutex );
   return supply_rate_per_second( _params.rates, _strategy.balance(), _db.get_pool_state().total_borrows );
}

borrow_balance lending_pool::get_borrow_balance( const account_id_type& account )const
{
   check_not_reentrant( "get_borrow_balance" );
   boost::shared_lock<boost::shared_mutex> lock( _mutex );
   return _ledger.live_debt( account );
}

amount_type lending_pool::exchange_rate()const
{
   check_not_reentrant( "exchange_rate" );
   boost::shared_lock<boost::shared_mutex> lock( _mutex );
   return _minter.exchange_rate();
}

amount_type lending_pool::total_assets()const
{
   check_not_reentrant( "total_assets" );
   boost::shared_lock<boost::shared_mutex> lock( _mutex );
   return _minter.total_assets();
}

amount_type lending_pool::total_shares()const
{
   check_not_reentrant( "total_shares" );
   boost::shared_lock<boost::shared_mutex> lock( _mutex );
   return _db.get_pool_state().total_shares;
}

amount_type lending_pool::share_balance( const account_id_type& account )const
{
   check_not_reentrant( "share_balance" );
   boost::shared_lock<boost::shared_mutex> lock( _mutex );
   return _db.get_share_balance( account );
}

pool_parameters lending_pool::get_parameters()const
{
   check_not_reentrant( "get_parameters" );
   boost::shared_lock<boost::shared_mutex> lock( _mutex );
   return _params;
}

void lending_pool::set_reward_tracker( reward_tracker* tracker )
{
   check_not_reentrant( "set_reward_tracker" );
   boost::unique_lock<boost::shared_mutex> lock( _mutex );
   _hook.set_tracker( tracker );
}

} } // meridian::pool
