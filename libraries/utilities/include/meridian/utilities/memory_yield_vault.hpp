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
#include <meridian/utilities/memory_token_ledger.hpp>

namespace meridian { namespace utilities {

   /**
    *  @brief ERC-4626 style vault over a memory_token_ledger
    *
    *  The vault's assets are the underlying held by its custody account, so yield is simulated by
    *  issuing underlying to that account.  Deposits are taken from the receiver of the shares.
    */
   class memory_yield_vault : public yield_vault
   {
      public:
         memory_yield_vault( memory_token_ledger& tokens, const asset_id_type& underlying,
                             const asset_id_type& share_asset, const account_id_type& custody );

         amount_type deposit( const amount_type& assets, const account_id_type& receiver ) override;
         amount_type redeem( const amount_type& shares, const account_id_type& receiver,
                             const account_id_type& owner ) override;

         amount_type convert_to_assets( const amount_type& shares )const override;
         amount_type convert_to_shares( const amount_type& assets )const override;
         amount_type total_assets()const override;
         amount_type total_supply()const override;
         amount_type balance_of( const account_id_type& account )const override;
         asset_id_type asset()const override { return _underlying; }

         /// Adds @p amount of underlying to the vault without minting shares
         void accrue_yield( const amount_type& amount );

         const account_id_type& custody_account()const { return _custody; }

      private:
         memory_token_ledger&  _tokens;
         asset_id_type         _underlying;
         asset_id_type         _share_asset;
         account_id_type       _custody;
   };

} } // meridian::utilities
