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
#include <meridian/utilities/memory_yield_vault.hpp>

namespace meridian { namespace utilities {

memory_yield_vault::memory_yield_vault( memory_token_ledger& tokens, const asset_id_type& underlying,
                                        const asset_id_type& share_asset, const account_id_type& custody )
:_tokens(tokens),_underlying(underlying),_share_asset(share_asset),_custody(custody)
{
   FC_ASSERT( underlying != share_asset, "Vault shares must not be the underlying asset" );
}

amount_type memory_yield_vault::deposit( const amount_type& assets, const account_id_type& receiver )
{ try {
   const amount_type shares = convert_to_shares( assets );
   _tokens.transfer( _underlying, receiver, _custody, assets );
   _tokens.issue( _share_asset, receiver, shares );
   return shares;
} FC_CAPTURE_AND_RETHROW( (assets)(receiver) ) }

amount_type memory_yield_vault::redeem( const amount_type& shares, const account_id_type& receiver,
                                        const account_id_type& owner )
{ try {
   const amount_type assets = convert_to_assets( shares );
   _tokens.burn( _share_asset, owner, shares );
   _tokens.transfer( _underlying, _custody, receiver, assets );
   return assets;
} FC_CAPTURE_AND_RETHROW( (shares)(receiver)(owner) ) }

amount_type memory_yield_vault::convert_to_assets( const amount_type& shares )const
{
   const amount_type supply = total_supply();
   if( supply == 0 )
      return shares;
   return full_mul_div( shares, total_assets(), supply );
}

amount_type memory_yield_vault::convert_to_shares( const amount_type& assets )const
{
   const amount_type supply = total_supply();
   if( supply == 0 )
      return assets;
   return full_mul_div( assets, supply, total_assets() );
}

amount_type memory_yield_vault::total_assets()const
{
   return _tokens.balance_of( _underlying, _custody );
}

amount_type memory_yield_vault::total_supply()const
{
   return _tokens.total_supply( _share_asset );
}

amount_type memory_yield_vault::balance_of( const account_id_type& account )const
{
   return _tokens.balance_of( _share_asset, account );
}

void memory_yield_vault::accrue_yield( const amount_type& amount )
{
   _tokens.issue( _underlying, _custody, amount );
}

} } // meridian::utilities
