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

#include <meridian/pool/yield_vault.hpp>

namespace meridian { namespace pool {

   /**
    *  @brief Moves the pool's idle underlying into and out of the yield vault
    *
    *  No balance is kept locally; the pool's cash is always derived from its vault share balance.
    *  Rounding always favors the pool: balances round down, share amounts to redeem round up.
    *  Failures of the vault other than lending exceptions surface as external_call_failure_exception.
    */
   class strategy_adapter
   {
      public:
         strategy_adapter( yield_vault& vault, const account_id_type& pool_account );

         /// Underlying value of the pool's vault shares, rounded down
         amount_type balance()const;

         /// Deposits @p amount of underlying held by the pool account
         void        on_deposit( const amount_type& amount );

         /**
          *  Redeems enough vault shares to receive at least @p amount of underlying
          *  @return the underlying actually received, never less than @p amount
          */
         amount_type on_withdraw( const amount_type& amount );

         const yield_vault& vault()const { return _vault; }

      private:
         yield_vault&     _vault;
         account_id_type  _pool_account;
   };

} } // meridian::pool
