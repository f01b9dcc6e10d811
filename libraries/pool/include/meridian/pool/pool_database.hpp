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

#include <meridian/pool/pool_objects.hpp>
#include <meridian/db/object_database.hpp>

namespace meridian { namespace pool {

   /**
    *  @class pool_database
    *  @brief Object store of a single lending pool
    *
    *  Holds the pool state singleton, the borrow snapshots and the share balances.  Every change
    *  goes through the object_database mutators so that an undo session can discard it.
    */
   class pool_database : public db::object_database
   {
      public:
         /// Registers the indexes and creates the pool state with its clock at @p created
         explicit pool_database( time_point_sec created );

         const pool_state_object&       get_pool_state()const;

         /// @return nullptr when the account never borrowed
         const borrow_snapshot_object*  find_borrow_snapshot( const account_id_type& account )const;
         /// Creates the snapshot on first use
         const borrow_snapshot_object&  get_or_create_borrow_snapshot( const account_id_type& account );

         amount_type get_share_balance( const account_id_type& account )const;
         void        add_shares( const account_id_type& account, const amount_type& amount );
         void        remove_shares( const account_id_type& account, const amount_type& amount );

      private:
         void initialize_indexes();

         pool_state_id_type _pool_state_id;
   };

} } // meridian::pool
