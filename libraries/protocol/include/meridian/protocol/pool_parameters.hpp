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

#include <meridian/protocol/interest_rate.hpp>

namespace meridian { namespace protocol {

   /**
    *  @brief Identities and rate curve a lending pool is set up with.
    *
    *  The accounts and assets are owned by the surrounding registry; the pool only uses them as keys
    *  when moving tokens and checking roles.
    */
   struct pool_parameters
   {
      /// Account holding the pool's underlying and vault shares
      account_id_type                    pool_account;
      /// Receives newly minted reserve shares and harvested stray tokens
      account_id_type                    reserve_receiver;
      /// The only account allowed to harvest reserves
      account_id_type                    reserve_harvester;
      /// The only account allowed to update the rate curve
      account_id_type                    admin;

      asset_id_type                      underlying_asset;
      /// Share token of the external yield vault
      asset_id_type                      strategy_asset;

      /// Collateral reference forwarded to the reward tracker with borrow positions
      optional<collateral_pool_id_type>  collateral_pool;

      interest_rate_parameters           rates;

      void validate()const;
   };

} } // meridian::protocol

FC_REFLECT( meridian::protocol::pool_parameters,
            (pool_account)(reserve_receiver)(reserve_harvester)(admin)
            (underlying_asset)(strategy_asset)(collateral_pool)(rates) )
