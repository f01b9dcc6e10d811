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

#include <meridian/protocol/types.hpp>

namespace meridian { namespace protocol {

   /**
    *  @brief Rates of the kinked borrow-rate curve expressed per year, all 1e18 fixed-point.
    *
    *  This is the human-facing form found in configuration files.
    */
   struct annual_interest_rates
   {
      amount_type base_rate_per_year;
      amount_type multiplier_per_year;
      amount_type jump_multiplier_per_year;
      amount_type kink;
      amount_type reserve_factor;
   };

   /**
    *  @brief Parameters of the kinked linear borrow-rate curve, all 1e18 fixed-point.
    *
    *  Below the kink utilization the rate grows with @ref multiplier_per_second, above it the
    *  excess utilization is charged at @ref jump_multiplier_per_second.
    */
   struct interest_rate_parameters
   {
      amount_type base_rate_per_second;
      amount_type multiplier_per_second;
      amount_type jump_multiplier_per_second;
      amount_type kink;
      amount_type reserve_factor;

      /// Converts per-year rates by dividing by the number of seconds per year, rounding down
      static interest_rate_parameters from_annual( const annual_interest_rates& rates );

      void validate()const;
   };

   /// borrows / ( cash + borrows ) in wad, 0 when nothing is borrowed
   amount_type utilization_rate( const amount_type& cash, const amount_type& borrows );

   /// Per-second borrow rate in wad for the given pool cash and outstanding borrows
   amount_type borrow_rate_per_second( const interest_rate_parameters& params,
                                       const amount_type& cash, const amount_type& borrows );

   /// Per-second rate earned by suppliers after the reserve cut
   amount_type supply_rate_per_second( const interest_rate_parameters& params,
                                       const amount_type& cash, const amount_type& borrows );

} } // meridian::protocol

FC_REFLECT( meridian::protocol::annual_interest_rates,
            (base_rate_per_year)(multiplier_per_year)(jump_multiplier_per_year)(kink)(reserve_factor) )
FC_REFLECT( meridian::protocol::interest_rate_parameters,
            (base_rate_per_second)(multiplier_per_second)(jump_multiplier_per_second)(kink)(reserve_factor) )
