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

#include <meridian/pool/token_ledger.hpp>

#include <map>
#include <utility>

namespace meridian { namespace utilities {

   using namespace meridian::pool;

   /**
    *  @brief Token balances kept in memory
    *
    *  Used by the simulator and the tests in place of a real token system.
    */
   class memory_token_ledger : public token_ledger
   {
      public:
         amount_type balance_of( const asset_id_type& asset, const account_id_type& account )const override;
         void        transfer( const asset_id_type& asset, const account_id_type& from,
                               const account_id_type& to, const amount_type& amount ) override;

         /// Creates @p amount out of thin air
         void        issue( const asset_id_type& asset, const account_id_type& to, const amount_type& amount );
         /// Destroys @p amount held by @p from
         void        burn( const asset_id_type& asset, const account_id_type& from, const amount_type& amount );

         amount_type total_supply( const asset_id_type& asset )const;

      private:
         using balance_key = std::pair<asset_id_type, account_id_type>;

         void        add_balance( const balance_key& key, const amount_type& amount );
         void        reduce_balance( const balance_key& key, const amount_type& amount );

         std::map<balance_key, amount_type>    _balances;
         std::map<asset_id_type, amount_type>  _supply;
   };

} } // meridian::utilities
