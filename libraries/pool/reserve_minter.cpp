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
#include <meridian/pool/reserve_minter.hpp>

#include <fc/log/logger.hpp>

namespace meridian { namespace pool {

namespace {

   amount_type mul_div( const amount_type& a, const amount_type& n, const amount_type& d, rounding r )
   {
      return r == rounding::up ? full_mul_div_up( a, n, d ) : full_mul_div( a, n, d );
   }

}

reserve_minter::reserve_minter( pool_database& db, const strategy_adapter& strategy, const pool_parameters& params )
:_db(db),_strategy(strategy),_params(params)
{
}

amount_type reserve_minter::mint( const amount_type& interest_accrued )
{ try {
   const amount_type reserve_amount = mul_wad( interest_accrued, _params.rates.reserve_factor );
   if( reserve_amount == 0 )
      return 0;
   const amount_type new_shares = convert_to_shares( reserve_amount, rounding::down );
   if( new_shares == 0 )
      return 0;

   _db.add_shares( _params.reserve_receiver, new_shares );
   dlog( "Minted ${s} reserve shares worth ${r} to ${a}",
         ("s",new_shares)("r",reserve_amount)("a",_params.reserve_receiver) );
   return new_shares;
} FC_CAPTURE_AND_RETHROW( (interest_accrued) ) }

amount_type reserve_minter::total_assets()const
{
   return checked_add( _strategy.balance(), _db.get_pool_state().total_borrows );
}

amount_type reserve_minter::exchange_rate()const
{
   const amount_type supply = _db.get_pool_state().total_shares;
   if( supply == 0 )
      return MERIDIAN_WAD;
   return full_mul_div( total_assets(), MERIDIAN_WAD, supply );
}

amount_type reserve_minter::convert_to_shares( const amount_type& assets, rounding r )const
{
   const amount_type supply = _db.get_pool_state().total_shares;
   if( supply == 0 )
      return assets;
   const amount_type backing = total_assets();
   MERIDIAN_ASSERT( backing != 0, divide_by_zero_exception,
                    "${s} pool shares are backed by no assets", ("s",supply) );
   return mul_div( assets, supply, backing, r );
}

amount_type reserve_minter::convert_to_assets( const amount_type& shares, rounding r )const
{
   const amount_type supply = _db.get_pool_state().total_shares;
   if( supply == 0 )
      return shares;
   return mul_div( shares, total_assets(), supply, r );
}

} } // meridian::pool
