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

#include <meridian/pool/reward_tracker.hpp>

#include <vector>

namespace meridian { namespace pool {

   struct reward_notification
   {
      account_id_type  account;
      amount_type      balance;
      position_tag     tag;
   };

   /**
    *  @brief Best-effort forwarding of balance changes to an optional reward tracker
    *
    *  Notifications are queued while an operation runs and delivered only once it has committed.
    *  A failing tracker is logged and ignored, it never aborts pool accounting.
    */
   class reward_hook
   {
      public:
         explicit reward_hook( reward_tracker* tracker = nullptr ) : _tracker(tracker) {}

         void set_tracker( reward_tracker* tracker ) { _tracker = tracker; }
         bool has_tracker()const { return _tracker != nullptr; }
         reward_tracker* tracker()const { return _tracker; }

         /// Queues a notification, no-op without a tracker
         void notify( const account_id_type& account, const amount_type& balance, const position_tag& tag );

         /// Hands out the queued notifications and clears the queue
         std::vector<reward_notification> release();
         /// Drops the queued notifications of a rolled back operation
         void discard();

         /**
          *  Forwards @p notifications to @p tracker in order, logging failures.  The caller
          *  reads the tracker together with the notifications it released.
          */
         static void deliver( reward_tracker* tracker, const std::vector<reward_notification>& notifications );
         void flush() { deliver( _tracker, release() ); }

         size_t pending()const { return _pending.size(); }

      private:
         reward_tracker*                   _tracker = nullptr;
         std::vector<reward_notification>  _pending;
   };

} } // meridian::pool

FC_REFLECT( meridian::pool::reward_notification, (account)(balance)(tag) )
