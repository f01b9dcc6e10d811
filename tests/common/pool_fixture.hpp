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

#include <fc/io/json.hpp>

#include <boost/test/unit_test.hpp>

#include <meridian/pool/lending_pool.hpp>
#include <meridian/utilities/manual_time_source.hpp>
#include <meridian/utilities/memory_token_ledger.hpp>
#include <meridian/utilities/memory_yield_vault.hpp>

#include <iostream>
#include <memory>

#define MERIDIAN_REQUIRE_THROW( expr, exc_type )          \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "MERIDIAN_REQUIRE_THROW begin "        \
         << req_throw_info << std::endl;                  \
   BOOST_REQUIRE_THROW( expr, exc_type );                 \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "MERIDIAN_REQUIRE_THROW end "          \
         << req_throw_info << std::endl;                  \
}

#define MERIDIAN_CHECK_THROW( expr, exc_type )            \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "MERIDIAN_CHECK_THROW begin "          \
         << req_throw_info << std::endl;                  \
   BOOST_CHECK_THROW( expr, exc_type );                   \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "MERIDIAN_CHECK_THROW end "            \
         << req_throw_info << std::endl;                  \
}

// Boost.Test can not stream 128-bit integers on its own
namespace boost { namespace test_tools { namespace tt_detail {
template<>
struct print_log_value<fc::uint128_t>
{
   void operator()( std::ostream& os, const fc::uint128_t& v )
   {
      os << fc::variant( v, 1 ).as_string();
   }
};
} } }

namespace meridian { namespace test {

using namespace meridian::pool;
using namespace meridian::utilities;

extern const uint32_t TESTING_START_TIMESTAMP;

/// @p whole units of a token with 18 decimals
amount_type wad( uint64_t whole );

/// Records every notification, optionally failing on each of them
class recording_reward_tracker : public reward_tracker
{
   public:
      enum failure_mode
      {
         never_fail,
         throw_fc_exception,
         throw_std_exception
      };

      void track_rewards( const account_id_type& account, const amount_type& balance,
                          const position_tag& tag ) override;

      failure_mode                      mode = never_fail;
      vector<reward_notification>       received;
      uint32_t                          attempts = 0;
};

/**
 *  Collaborators shared by all pool level tests: a token ledger, a yield vault over it, a manual
 *  clock and a set of well known accounts and assets.
 */
struct collaborators_fixture
{
   collaborators_fixture();
   virtual ~collaborators_fixture() = default;

   /// Credits @p amount of the underlying to @p account
   void fund( const account_id_type& account, const amount_type& amount );

   static pool_parameters default_parameters();

   const account_id_type   pool_account      = account_id_type( 1 );
   const account_id_type   reserve_receiver  = account_id_type( 2 );
   const account_id_type   harvester         = account_id_type( 3 );
   const account_id_type   admin             = account_id_type( 4 );
   const account_id_type   alice_id          = account_id_type( 10 );
   const account_id_type   bob_id            = account_id_type( 11 );
   const account_id_type   carol_id          = account_id_type( 12 );
   const account_id_type   dan_id            = account_id_type( 13 );
   const account_id_type   custody_account   = account_id_type( 100 );

   const asset_id_type     underlying        = asset_id_type( 1 );
   const asset_id_type     strategy_share    = asset_id_type( 2 );
   const asset_id_type     foreign_token     = asset_id_type( 3 );

   pool_parameters                   params;
   manual_time_source                clock;
   memory_token_ledger               tokens;
   memory_yield_vault                vault;
   recording_reward_tracker          tracker;
};

/**
 *  The accounting components wired by hand, without the lending_pool facade, so that tests can
 *  reach into the pool database.
 */
struct ledger_fixture : collaborators_fixture
{
   ledger_fixture();

   /// Per-second base rate only, so the borrow rate does not depend on utilization
   static pool_parameters flat_rate_parameters( const amount_type& rate_per_second );

   const pool_state_object& state()const { return db.get_pool_state(); }

   pool_database       db;
   strategy_adapter    strategy;
   reward_hook         hook;
   reserve_minter      minter;
   borrow_ledger       ledger;
};

/// A complete lending pool over the shared collaborators
struct pool_fixture : collaborators_fixture
{
   pool_fixture();

   /// Recreates the pool with @p p, dropping all pool state
   void reset_pool( const pool_parameters& p, reward_tracker* t = nullptr );

   std::unique_ptr<lending_pool>        pool;
   vector<accrual_record>               accruals;
   vector<reserve_harvest_record>       harvests;
};

} } // meridian::test
