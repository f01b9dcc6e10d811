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
#include "pool_fixture.hpp"

#include <stdexcept>

namespace meridian { namespace test {

const uint32_t TESTING_START_TIMESTAMP = 1600000000;

amount_type wad( uint64_t whole )
{
   return amount_type( whole ) * MERIDIAN_WAD;
}

void recording_reward_tracker::track_rewards( const account_id_type& account, const amount_type& balance,
                                              const position_tag& tag )
{
   ++attempts;
   if( mode == throw_fc_exception )
      FC_THROW( "Reward tracker is down" );
   if( mode == throw_std_exception )
      throw std::runtime_error( "Reward tracker is down" );
   received.push_back( reward_notification{ account, balance, tag } );
}

collaborators_fixture::collaborators_fixture()
:params( default_parameters() ),
 clock( fc::time_point_sec( TESTING_START_TIMESTAMP ) ),
 vault( tokens, underlying, strategy_share, custody_account )
{
}

void collaborators_fixture::fund( const account_id_type& account, const amount_type& amount )
{
   tokens.issue( underlying, account, amount );
}

pool_parameters collaborators_fixture::default_parameters()
{
   pool_parameters p;
   p.pool_account      = account_id_type( 1 );
   p.reserve_receiver  = account_id_type( 2 );
   p.reserve_harvester = account_id_type( 3 );
   p.admin             = account_id_type( 4 );
   p.underlying_asset  = asset_id_type( 1 );
   p.strategy_asset    = asset_id_type( 2 );
   p.collateral_pool   = collateral_pool_id_type( 7 );

   annual_interest_rates rates;
   rates.base_rate_per_year       = amount_type( MERIDIAN_WAD ) / 50;      // 2%
   rates.multiplier_per_year      = amount_type( MERIDIAN_WAD ) / 10;      // 10%
   rates.jump_multiplier_per_year = amount_type( MERIDIAN_WAD ) * 3;       // 300%
   rates.kink                     = amount_type( MERIDIAN_WAD ) * 8 / 10;
   rates.reserve_factor           = amount_type( MERIDIAN_WAD ) / 10;
   p.rates = interest_rate_parameters::from_annual( rates );
   return p;
}

pool_parameters ledger_fixture::flat_rate_parameters( const amount_type& rate_per_second )
{
   pool_parameters p = default_parameters();
   p.rates.base_rate_per_second = rate_per_second;
   p.rates.multiplier_per_second = 0;
   p.rates.jump_multiplier_per_second = 0;
   return p;
}

ledger_fixture::ledger_fixture()
:db( clock.now() ),
 strategy( vault, pool_account ),
 hook( &tracker ),
 minter( db, strategy, params ),
 ledger( db, strategy, minter, hook, params )
{
}

pool_fixture::pool_fixture()
{
   reset_pool( params, &tracker );
}

void pool_fixture::reset_pool( const pool_parameters& p, reward_tracker* t )
{
   params = p;
   accruals.clear();
   harvests.clear();
   pool.reset( new lending_pool( params, tokens, vault, clock, t ) );
   pool->accrued.connect( [this]( const accrual_record& r ) { accruals.push_back( r ); } );
   pool->reserves_harvested.connect( [this]( const reserve_harvest_record& r ) { harvests.push_back( r ); } );
}

} } // meridian::test
