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
#include <meridian/db/index.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/mem_fun.hpp>

namespace meridian { namespace db {

   using boost::multi_index_container;
   using namespace boost::multi_index;

   struct by_id;

   /**
    *  @brief index over a boost::multi_index_container
    *
    *  The first index of @p MultiIndexType must be ordered_unique on object::id.  Further indexes
    *  are reached through indices().
    */
   template<typename ObjectType, typename MultiIndexType>
   class generic_index : public index
   {
      public:
         using object_type = ObjectType;
         using index_type  = MultiIndexType;

         uint8_t space_id()const override { return ObjectType::space_id; }
         uint8_t type_id()const override  { return ObjectType::type_id; }

         uint64_t next_instance()const override                 { return _next_instance; }
         void     set_next_instance( uint64_t instance )override { _next_instance = instance; }

         const object& create( const std::function<void(object&)>& constructor )override
         {
            const object_id_type new_id( ObjectType::space_id, ObjectType::type_id, _next_instance );
            ObjectType item;
            item.id = new_id;
            constructor( item );
            auto result = _indices.insert( std::move( item ) );
            FC_ASSERT( result.second, "Creating ${id} violates a uniqueness constraint", ("id",new_id) );
            ++_next_instance;
            return *result.first;
         }

         void modify( const object& obj, const std::function<void(object&)>& m )override
         {
            const object_id_type id = obj.id;
            const bool ok = _indices.modify( _indices.iterator_to( static_cast<const ObjectType&>( obj ) ),
                                             [&m]( ObjectType& o ) { m( o ); } );
            FC_ASSERT( ok, "Modifying ${id} violates a uniqueness constraint", ("id",id) );
         }

         void remove( const object& obj )override
         {
            _indices.erase( _indices.iterator_to( static_cast<const ObjectType&>( obj ) ) );
         }

         void restore( const object& obj )override
         {
            auto result = _indices.insert( static_cast<const ObjectType&>( obj ) );
            FC_ASSERT( result.second, "Object ${id} can not be restored", ("id",obj.id) );
         }

         const object* find( const object_id_type& id )const override
         {
            auto itr = _indices.find( id );
            if( itr == _indices.end() )
               return nullptr;
            return &*itr;
         }

         size_t size()const override { return _indices.size(); }

         const index_type& indices()const { return _indices; }

      private:
         index_type  _indices;
         uint64_t    _next_instance = 0;
   };

} } // meridian::db
