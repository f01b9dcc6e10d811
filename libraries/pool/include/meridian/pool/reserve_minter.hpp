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

#include <meridian/pool/pool_database.hpp>
#include <meridian/pool/strategy_adapter.hpp>

namespace meridian { namespace pool {

   /**
    *  @brief Share pricing of the pool and minting of protocol reserves
    *
    *  Total assets are the vault-held cash plus outstanding borrows.  A pool without shares prices
    *  them 1:1 with the underlying.
    */
   class reserve_minter
   {
      public:
         reserve_minter( pool_database& db, const strategy_adapter& strategy, const pool_parameters& params );

         /**
          *  Mints the reserve factor's cut of @p interest_accrued as shares to the reserve receiver,
          *  priced at the exchange rate before the mint.
          *  @return the number of shares minted
          */
         amount_type mint( const amount_type& interest_accrued );

         amount_type total_assets()const;
         /// Assets per share in wad
         amount_type exchange_rate()const;

         amount_type convert_to_shares( const amount_type& assets, rounding r )const;
         amount_type convert_to_assets( const amount_type& shares, rounding r )const;

      private:
         pool_database&            _db;
         const strategy_adapter&   _strategy;
         const pool_parameters&    _params;
   };

} } // meridian::pool
