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
    *  @brief Kind of position a reward notification refers to
    *
    *  A lend position has no collateral reference, a borrow position carries whatever collateral
    *  reference the pool was configured with.  The pool does not interpret the reference.
    */
   struct position_tag
   {
      enum kind_type
      {
         lend,
         borrow
      };

      kind_type                          kind = lend;
      optional<collateral_pool_id_type>  collateral;

      static position_tag for_lend() { return position_tag(); }
      static position_tag for_borrow( const optional<collateral_pool_id_type>& collateral )
      {
         position_tag tag;
         tag.kind = borrow;
         tag.collateral = collateral;
         return tag;
      }
   };

   /// Optional external rewards distributor told about every tracked balance change
   class reward_tracker
   {
      public:
         virtual ~reward_tracker() = default;

         virtual void track_rewards( const account_id_type& account, const amount_type& balance,
                                     const position_tag& tag ) = 0;
   };

} } // meridian::pool

FC_REFLECT_ENUM( meridian::pool::position_tag::kind_type, (lend)(borrow) )
FC_REFLECT( meridian::pool::position_tag, (kind)(collateral) )
