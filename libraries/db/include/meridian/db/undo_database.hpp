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
#include <meridian/db/object.hpp>

#include <fc/log/logger.hpp>

#include <deque>
#include <map>
#include <set>

namespace meridian { namespace db {

   class object_database;

   /// What one session has to put back when it is undone
   struct undo_state
   {
      std::map< object_id_type, unique_ptr<object> >  old_values;   ///< first seen value of modified objects
      std::map< object_id_type, unique_ptr<object> >  removed;
      std::set< object_id_type >                      new_ids;
      std::map< uint16_t, uint64_t >                  old_next_instances; ///< keyed by space and type
   };

   /**
    * @class undo_database
    * @brief Stack of open sessions over an object_database
    *
    * Changes made while no session is open are permanent.  Sessions nest: committing an inner
    * session hands its history to the enclosing one, committing the outermost session forgets it.
    * A session destroyed without commit() is undone.
    */
   class undo_database
   {
      public:
         explicit undo_database( object_database& db ) : _db(db) {}

         class session
         {
            public:
               session( session&& other ) : _undo_db(other._undo_db), _active(other._active)
               {
                  other._active = false;
               }
               session( const session& ) = delete;
               session& operator = ( const session& ) = delete;
               ~session();

               void commit();
               void undo();

            private:
               friend class undo_database;
               explicit session( undo_database& db ) : _undo_db(db) {}

               undo_database& _undo_db;
               bool           _active = true;
         };

         session start_undo_session();

         /// Called after @p obj was created
         void on_create( const object& obj );
         /// Called before @p obj is changed.  Only the value from before the first change is kept.
         void on_modify( const object& obj );
         /// Called before @p obj is removed
         void on_remove( const object& obj );

         /// Number of open sessions
         size_t size()const { return _stack.size(); }

      private:
         void undo();
         void commit();

         std::deque<undo_state>  _stack;
         object_database&        _db;
   };

} } // meridian::db
