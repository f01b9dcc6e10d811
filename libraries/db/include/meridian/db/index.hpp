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

#include <functional>

namespace meridian { namespace db {

   /**
    *  @class index
    *  @brief Storage of all objects of one space and type
    *
    *  Indexes do not record undo history themselves.  object_database reports every change to
    *  its undo_database before forwarding it here, and the undo_database restores state through
    *  set_next_instance(), modify(), remove() and restore().
    */
   class index
   {
      public:
         virtual ~index() = default;

         virtual uint8_t  space_id()const = 0;
         virtual uint8_t  type_id()const = 0;

         /// Instance number of the next object created in this index
         virtual uint64_t next_instance()const = 0;
         virtual void     set_next_instance( uint64_t instance ) = 0;

         virtual const object& create( const std::function<void(object&)>& constructor ) = 0;
         virtual void          modify( const object& obj, const std::function<void(object&)>& m ) = 0;
         virtual void          remove( const object& obj ) = 0;
         /// Inserts a copy of a previously removed object under its original id
         virtual void          restore( const object& obj ) = 0;

         virtual const object* find( const object_id_type& id )const = 0;
         virtual size_t        size()const = 0;

         const object& get( const object_id_type& id )const
         {
            const object* result = find( id );
            FC_ASSERT( result != nullptr, "Object ${id} does not exist", ("id",id) );
            return *result;
         }
   };

} } // meridian::db
