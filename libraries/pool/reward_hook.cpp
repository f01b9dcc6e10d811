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
#include <meridian/pool/reward_hook.hpp>

#include <fc/log/logger.hpp>

namespace meridian { namespace pool {

void reward_hook::notify( const account_id_type& account, const amount_type& balance, const position_tag& tag )
{
   if( _tracker == nullptr )
      return;
   _pending.push_back( reward_notification{ account, balance, tag } );
}

std::vector<reward_notification> reward_hook::release()
{
   std::vector<reward_notification> result;
   result.swap( _pending );
   return result;
}

void reward_hook::discard()
{
   if( !_pending.empty() )
      dlog( "Dropping ${n} reward notifications", ("n",_pending.size()) );
   _pending.clear();
}

void reward_hook::deliver( reward_tracker* tracker, const std::vector<reward_notification>& notifications )
{
   if( tracker == nullptr )
      return;

   for( const auto& n : notifications )
   {
      try {
         tracker->track_rewards( n.account, n.balance, n.tag );
      } catch( const fc::exception& e ) {
         elog( "Reward tracker failed for account ${a}: ${e}", ("a",n.account)("e",e.to_detail_string()) );
      } catch( const std::exception& e ) {
         elog( "Reward tracker failed for account ${a}: ${e}", ("a",n.account)("e",e.what()) );
      }
   }
}

} } // meridian::pool
