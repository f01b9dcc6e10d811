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

#include <meridian/pool/types.hpp>

namespace meridian { namespace pool {

   /**
    *  @brief ERC-4626 style vault the pool parks its idle underlying in
    *
    *  Conversions round down in favor of the vault.  Implementations report failures by throwing.
    */
   class yield_vault
   {
      public:
         virtual ~yield_vault() = default;

         /// Takes @p assets of the underlying and credits the minted vault shares to @p receiver
         virtual amount_type deposit( const amount_type& assets, const account_id_type& receiver ) = 0;
         /// Burns @p shares owned by @p owner and pays the underlying out to @p receiver
         virtual amount_type redeem( const amount_type& shares, const account_id_type& receiver,
                                     const account_id_type& owner ) = 0;

         virtual amount_type convert_to_assets( const amount_type& shares )const = 0;
         virtual amount_type convert_to_shares( const amount_type& assets )const = 0;
         virtual amount_type total_assets()const = 0;
         virtual amount_type total_supply()const = 0;
         virtual amount_type balance_of( const account_id_type& account )const = 0;

         /// The underlying asset accepted by the vault
         virtual asset_id_type asset()const = 0;
   };

} } // meridian::pool
