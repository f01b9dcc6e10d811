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
#include <meridian/protocol/interest_rate.hpp>
#include <meridian/protocol/exceptions.hpp>
#include <meridian/protocol/fixed_point.hpp>

namespace meridian { namespace protocol {

interest_rate_parameters interest_rate_parameters::from_annual( const annual_interest_rates& rates )
{
   interest_rate_parameters result;
   result.base_rate_per_second       = rates.base_rate_per_year / MERIDIAN_SECONDS_PER_YEAR;
   result.multiplier_per_second      = rates.multiplier_per_year / MERIDIAN_SECONDS_PER_YEAR;
   result.jump_multiplier_per_second = rates.jump_multiplier_per_year / MERIDIAN_SECONDS_PER_YEAR;
   result.kink                       = rates.kink;
   result.reserve_factor             = rates.reserve_factor;
   return result;
}

void interest_rate_parameters::validate()const
{
   MERIDIAN_ASSERT( kink <= MERIDIAN_WAD, invalid_parameters_exception,
                    "Kink ${k} exceeds 100%", ("k",kink) );
   MERIDIAN_ASSERT( reserve_factor <= MERIDIAN_WAD, invalid_parameters_exception,
                    "Reserve factor ${r} exceeds 100%", ("r",reserve_factor) );
   // The steepest point of the curve must still fit the cached rate field
   to_u80( checked_add( checked_add( mul_wad( kink, multiplier_per_second ), base_rate_per_second ),
                        mul_wad( MERIDIAN_WAD - kink, jump_multiplier_per_second ) ) );
}

amount_type utilization_rate( const amount_type& cash, const amount_type& borrows )
{
   if( borrows == 0 )
      return 0;
   return div_wad( borrows, checked_add( cash, borrows ) );
}

amount_type borrow_rate_per_second( const interest_rate_parameters& params,
                                    const amount_type& cash, const amount_type& borrows )
{ try {
   const amount_type util = utilization_rate( cash, borrows );

   if( util <= params.kink )
      return checked_add( mul_wad( util, params.multiplier_per_second ), params.base_rate_per_second );

   const amount_type normal_rate = checked_add( mul_wad( params.kink, params.multiplier_per_second ),
                                                params.base_rate_per_second );
   const amount_type excess_util = util - params.kink;
   return checked_add( mul_wad( excess_util, params.jump_multiplier_per_second ), normal_rate );
} FC_CAPTURE_AND_RETHROW( (cash)(borrows) ) }

amount_type supply_rate_per_second( const interest_rate_parameters& params,
                                    const amount_type& cash, const amount_type& borrows )
{
   const amount_type util = utilization_rate( cash, borrows );
   const amount_type rate = borrow_rate_per_second( params, cash, borrows );
   return mul_wad( mul_wad( util, rate ), MERIDIAN_WAD - params.reserve_factor );
}

} } // meridian::protocol
