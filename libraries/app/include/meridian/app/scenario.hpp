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

#include <meridian/pool/lending_pool.hpp>
#include <meridian/utilities/manual_time_source.hpp>
#include <meridian/utilities/memory_token_ledger.hpp>
#include <meridian/utilities/memory_yield_vault.hpp>

#include <fc/filesystem.hpp>

namespace meridian { namespace app {

   using namespace meridian::pool;

   /**
    *  @brief One call of a simulated pool scenario
    *
    *  Fields that an action does not use are ignored.
    */
   struct scenario_step
   {
      enum action_type
      {
         issue,       ///< credit @ref amount of @ref asset to @ref account
         advance,     ///< move the clock forward by @ref seconds
         accrue,
         vault_yield, ///< grow the yield vault by @ref amount
         deposit,
         mint,
         withdraw,
         redeem,
         borrow,
         repay,       ///< @ref account pays for @ref counterparty
         liquidate,   ///< @ref account liquidates @ref counterparty
         harvest,
         set_rates
      };

      action_type                         action = advance;
      account_id_type                     account;
      optional<account_id_type>           counterparty;
      optional<asset_id_type>             asset;
      amount_type                         amount = 0;
      uint32_t                            seconds = 0;
      vector<asset_id_type>               tokens;
      optional<annual_interest_rates>     rates;
   };

   struct scenario
   {
      vector<scenario_step> steps;
   };

   /// Outcome of one step; failures are reported, not thrown
   struct step_result
   {
      uint32_t                 index = 0;
      scenario_step::action_type action = scenario_step::advance;
      variant                  result;
      optional<string>         error;
   };

   scenario load_scenario( const fc::path& scenario_file );

   /**
    *  @brief A pool wired to in-memory collaborators, driven by scenarios
    */
   class pool_simulation
   {
      public:
         pool_simulation( const pool_parameters& params, fc::time_point_sec start );

         step_result           run_step( uint32_t index, const scenario_step& step );
         vector<step_result>   run( const scenario& s );

         lending_pool&                         pool()   { return _pool; }
         utilities::memory_token_ledger&       tokens() { return _tokens; }
         utilities::memory_yield_vault&        vault()  { return _vault; }
         utilities::manual_time_source&        clock()  { return _clock; }

      private:
         variant apply( const scenario_step& step );

         pool_parameters                    _params;
         utilities::manual_time_source      _clock;
         utilities::memory_token_ledger     _tokens;
         utilities::memory_yield_vault      _vault;
         lending_pool                       _pool;
   };

} } // meridian::app

FC_REFLECT_ENUM( meridian::app::scenario_step::action_type,
                 (issue)(advance)(accrue)(vault_yield)(deposit)(mint)(withdraw)(redeem)(borrow)(repay)
                 (liquidate)(harvest)(set_rates) )
FC_REFLECT( meridian::app::scenario_step,
            (action)(account)(counterparty)(asset)(amount)(seconds)(tokens)(rates) )
FC_REFLECT( meridian::app::scenario, (steps) )
FC_REFLECT( meridian::app::step_result, (index)(action)(result)(error) )
