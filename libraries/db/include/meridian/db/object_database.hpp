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
#include <meridian/db/undo_database.hpp>

#include <map>

namespace meridian { namespace db {

   /**
    *   @class object_database
    *   @brief Indexed objects with rollback support
    *
    *   Every object type gets one index, registered with add_index().  Changes must go through
    *   create(), modify() and remove(), which tell the undo database about the prior state before
    *   touching the index.
    */
   class object_database
   {
      public:
         object_database();
         virtual ~object_database() = default;

         template<typename IndexType>
         IndexType& add_index()
         {
            using object_type = typename IndexType::object_type;
            const uint8_t space_id = object_type::space_id;
            const uint8_t type_id = object_type::type_id;
            const uint16_t key = index_key( space_id, type_id );
            FC_ASSERT( _indexes.find( key ) == _indexes.end(), "Index ${s}.${t} is already registered",
                       ("s",space_id)("t",type_id) );
            IndexType* result = new IndexType();
            _indexes[key].reset( result );
            return *result;
         }

         template<typename IndexType>
         const IndexType& get_index_type()const
         {
            using object_type = typename IndexType::object_type;
            return static_cast<const IndexType&>( get_index( object_type::space_id, object_type::type_id ) );
         }

         template<typename T, typename Constructor>
         const T& create( Constructor&& constructor )
         {
            const object& result = get_mutable_index( T::space_id, T::type_id ).create(
               [&constructor]( object& o ) { constructor( static_cast<T&>( o ) ); } );
            _undo_db.on_create( result );
            return static_cast<const T&>( result );
         }

         template<typename T, typename Modifier>
         void modify( const T& obj, const Modifier& m )
         {
            _undo_db.on_modify( obj );
            get_mutable_index( obj.id ).modify( obj, [&m]( object& o ) { m( static_cast<T&>( o ) ); } );
         }

         void remove( const object& obj );

         const object& get_object( const object_id_type& id )const;
         const object* find_object( const object_id_type& id )const;

         template<typename T>
         const T& get( const object_id_type& id )const
         {
            return static_cast<const T&>( get_object( id ) );
         }

         undo_database::session start_undo_session() { return _undo_db.start_undo_session(); }
         const undo_database&   get_undo_db()const    { return _undo_db; }

      private:
         friend class undo_database;

         static uint16_t index_key( uint8_t space_id, uint8_t type_id )
         {
            return uint16_t( uint16_t( space_id ) << 8 ) | type_id;
         }

         const index& get_index( uint8_t space_id, uint8_t type_id )const;
         index&       get_mutable_index( uint8_t space_id, uint8_t type_id );
         index&       get_mutable_index( const object_id_type& id ) { return get_mutable_index( id.space(), id.type() ); }

         std::map< uint16_t, std::unique_ptr<index> >  _indexes;
         undo_database                                 _undo_db;
   };

} } // meridian::db
