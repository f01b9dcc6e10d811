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
#include <meridian/app/scenario.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

namespace meridian { namespace app {

namespace {

   /// Account holding the yield vault's underlying
   const account_id_type vault_custody_account( 0xffffffff );

   template<typename T>
   variant to_result( const T& value )
   {
      return variant( value, MERIDIAN_MAX_NESTED_OBJECTS );
   }

}

scenario load_scenario( const fc::path& scenario_file )
{ try {
   FC_ASSERT( fc::exists( scenario_file ), "Scenario ${f} does not exist", ("f",scenario_file) );
   return fc::json::from_file( scenario_file ).as<scenario>( MERIDIAN_MAX_NESTED_OBJECTS );
} FC_CAPTURE_AND_RETHROW( (scenario_file) ) }

pool_simulation::pool_simulation( const pool_parameters& params, fc::time_point_sec start )
:_params(params),
 _clock(start),
 _vault(_tokens, params.underlying_asset, params.strategy_asset, vault_custody_account),
 _pool(params, _tokens, _vault, _clock)
{
}

vector<step_result> pool_simulation::run( const scenario& s )
{
   vector<step_result> results;
   results.reserve( s.steps.size() );
   for( uint32_t i = 0; i < s.steps.size(); ++i )
      results.push_back( run_step( i, s.steps[i] ) );
   return results;
}

step_result pool_simulation::run_step( uint32_t index, const scenario_step& step )
{
   step_result result;
   result.index = index;
   result.action = step.action;
   try {
      result.result = apply( step );
   } catch( const fc::exception& e ) {
      wlog( "Step ${i} failed: ${e}", ("i",index)("e",e.to_detail_string()) );
      result.error = e.to_string();
   }
   return result;
}

variant pool_simulation::apply( const scenario_step& step )
{
   const account_id_type other = step.counterparty.valid() ? *step.counterparty : step.account;

   switch( step.action )
   {
      case scenario_step::issue:
         _tokens.issue( step.asset.valid() ? *step.asset : _params.underlying_asset, step.account, step.amount );
         return to_result( step.amount );
      case scenario_step::advance:
         _clock.advance( step.seconds );
         return to_result( _clock.now() );
      case scenario_step::accrue:
         return to_result( _pool.accrue_interest() );
      case scenario_step::vault_yield:
         _vault.accrue_yield( step.amount );
         return to_result( _vault.total_assets() );
      case scenario_step::deposit:
         return to_result( _pool.deposit( step.account, step.amount ) );
      case scenario_step::mint:
         return to_result( _pool.mint( step.account, step.amount ) );
      case scenario_step::withdraw:
         return to_result( _pool.withdraw( step.account, step.amount ) );
      case scenario_step::redeem:
         return to_result( _pool.redeem( step.account, step.amount ) );
      case scenario_step::borrow:
         return to_result( _pool.borrow( step.account, step.amount ) );
      case scenario_step::repay:
         return to_result( _pool.repay( step.account, other, step.amount ) );
      case scenario_step::liquidate:
         return to_result( _pool.liquidate( step.account, other, step.amount ) );
      case scenario_step::harvest:
         return to_result( _pool.harvest_reserves( step.account, step.tokens ) );
      case scenario_step::set_rates:
         FC_ASSERT( step.rates.valid(), "set_rates needs rates" );
         return to_result( _pool.update_interest_rate_parameters( step.account,
                               interest_rate_parameters::from_annual( *step.rates ) ) );
   }
   FC_THROW( "Unknown scenario action ${a}", ("a",static_cast<int>(step.action)) );
}

} } // meridian::app
