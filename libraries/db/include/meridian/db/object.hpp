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
#include <meridian/db/object_id.hpp>

#include <fc/reflect/variant.hpp>

#include <memory>

namespace meridian { namespace db {

   using std::unique_ptr;

   /**
    *  @brief Base of everything stored in an object_database
    *
    *  Objects are copied by the undo database before their first change inside a session, so every
    *  derived type must be copyable and must derive from abstract_object to get clone() and
    *  move_from().  A static_cast between object and the derived type must be valid, so no
    *  multiple inheritance.
    */
   class object
   {
      public:
         virtual ~object() = default;

         static constexpr uint8_t space_id = 0;
         static constexpr uint8_t type_id  = 0;

         object_id_type id;

         virtual unique_ptr<object> clone()const = 0;
         virtual void               move_from( object& other ) = 0;
   };

   template<typename DerivedClass>
   class abstract_object : public object
   {
      public:
         unique_ptr<object> clone()const override
         {
            return unique_ptr<object>( new DerivedClass( static_cast<const DerivedClass&>( *this ) ) );
         }

         void move_from( object& other ) override
         {
            static_cast<DerivedClass&>( *this ) = std::move( static_cast<DerivedClass&>( other ) );
         }
   };

} } // meridian::db

FC_REFLECT( meridian::db::object, (id) )
