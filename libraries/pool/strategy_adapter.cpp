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
#include <meridian/pool/strategy_adapter.hpp>

#include <fc/log/logger.hpp>

namespace meridian { namespace pool {

namespace {

   /// Runs a vault call, turning foreign failures into external_call_failure_exception
   template<typename Call>
   auto call_vault( const char* what, Call&& call ) -> decltype( call() )
   {
      try {
         return call();
      } catch( const lending_exception& ) {
         throw;
      } catch( const fc::exception& e ) {
         FC_THROW_EXCEPTION( external_call_failure_exception, "Yield vault ${what} failed: ${e}",
                             ("what",what)("e",e.to_detail_string()) );
      } catch( const std::exception& e ) {
         FC_THROW_EXCEPTION( external_call_failure_exception, "Yield vault ${what} failed: ${e}",
                             ("what",what)("e",e.what()) );
      }
   }

}

strategy_adapter::strategy_adapter( yield_vault& vault, const account_id_type& pool_account )
:_vault(vault),_pool_account(pool_account)
{
}

amount_type strategy_adapter::balance()const
{
   return call_vault( "balance", [this]() -> amount_type {
      const amount_type supply = _vault.total_supply();
      MERIDIAN_ASSERT( supply == 0 || _vault.total_assets() != 0, divide_by_zero_exception,
                       "Vault reports ${s} shares backed by no assets", ("s",supply) );
      return _vault.convert_to_assets( _vault.balance_of( _pool_account ) );
   });
}

void strategy_adapter::on_deposit( const amount_type& amount )
{ try {
   if( amount == 0 )
      return;

   const amount_type shares = call_vault( "deposit", [this,&amount]() {
      return _vault.deposit( amount, _pool_account );
   });
   MERIDIAN_ASSERT( shares != 0, external_call_failure_exception,
                    "Vault minted no shares for a deposit of ${a}", ("a",amount) );
   dlog( "Deposited ${a} into the yield vault for ${s} shares", ("a",amount)("s",shares) );
} FC_CAPTURE_AND_RETHROW( (amount) ) }

amount_type strategy_adapter::on_withdraw( const amount_type& amount )
{ try {
   if( amount == 0 )
      return 0;

   const amount_type supply = call_vault( "total_supply", [this]() { return _vault.total_supply(); } );
   const amount_type assets = call_vault( "total_assets", [this]() { return _vault.total_assets(); } );
   MERIDIAN_ASSERT( supply != 0, insufficient_liquidity_exception,
                    "Vault has no shares outstanding, can not withdraw ${a}", ("a",amount) );
   MERIDIAN_ASSERT( assets != 0, divide_by_zero_exception,
                    "Vault reports ${s} shares backed by no assets", ("s",supply) );

   const amount_type shares = full_mul_div_up( amount, supply, assets );
   const amount_type held = call_vault( "balance_of", [this]() { return _vault.balance_of( _pool_account ); } );
   MERIDIAN_ASSERT( shares <= held, insufficient_liquidity_exception,
                    "Withdrawing ${a} needs ${s} vault shares, the pool holds ${h}",
                    ("a",amount)("s",shares)("h",held) );

   const amount_type received = call_vault( "redeem", [this,&shares]() {
      return _vault.redeem( shares, _pool_account, _pool_account );
   });
   MERIDIAN_ASSERT( received >= amount, external_call_failure_exception,
                    "Vault paid ${r} for ${s} shares, ${a} expected", ("r",received)("s",shares)("a",amount) );

   dlog( "Redeemed ${s} vault shares for ${r}", ("s",shares)("r",received) );
   return received;
} FC_CAPTURE_AND_RETHROW( (amount) ) }

} } // meridian::pool
