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
#include <fc/exception/exception.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/string.hpp>
#include <fc/variant.hpp>

#include <cstdint>
#include <string>

namespace meridian { namespace db {

   /**
    *  @brief Untyped object id
    *
    *  Packs an 8 bit space, an 8 bit type and a 48 bit instance into one integer and is written
    *  as "space.type.instance".
    */
   struct object_id_type
   {
      static constexpr uint8_t  instance_bits = 48;
      static constexpr uint64_t max_instance  = ( uint64_t(1) << instance_bits ) - 1;

      object_id_type() = default;
      object_id_type( uint8_t s, uint8_t t, uint64_t i )
      {
         FC_ASSERT( i <= max_instance, "Instance ${i} does not fit in 48 bits", ("i",i) );
         number = ( uint64_t(s) << 56 ) | ( uint64_t(t) << instance_bits ) | i;
      }

      uint8_t  space()const      { return uint8_t( number >> 56 ); }
      uint8_t  type()const       { return uint8_t( number >> instance_bits ); }
      uint16_t space_type()const { return uint16_t( number >> instance_bits ); }
      uint64_t instance()const   { return number & max_instance; }

      friend bool operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool operator <  ( const object_id_type& a, const object_id_type& b ) { return a.number < b.number; }

      explicit operator std::string()const
      {
         return fc::to_string( space() ) + "." + fc::to_string( type() ) + "." + fc::to_string( instance() );
      }

      uint64_t number = 0;
   };

   /**
    *  A typed identifier.  Accounts and assets are identified by their instance number inside a
    *  fixed space and type, so that an account id can never be passed where an asset id is expected.
    */
   template<uint8_t SpaceID, uint8_t TypeID>
   struct object_id
   {
      static constexpr uint8_t space_id = SpaceID;
      static constexpr uint8_t type_id  = TypeID;

      object_id() = default;
      explicit object_id( uint64_t i ) : instance(i)
      {
         FC_ASSERT( i <= object_id_type::max_instance, "Instance ${i} is out of range", ("i",i) );
      }
      explicit object_id( const object_id_type& id ) : instance( id.instance() )
      {
         FC_ASSERT( id.space() == SpaceID && id.type() == TypeID, "${id} is not a ${s}.${t} id",
                    ("id",std::string( id ))("s",SpaceID)("t",TypeID) );
      }

      explicit operator object_id_type()const { return object_id_type( SpaceID, TypeID, instance ); }

      friend bool operator == ( const object_id& a, const object_id& b ) { return a.instance == b.instance; }
      friend bool operator != ( const object_id& a, const object_id& b ) { return a.instance != b.instance; }
      friend bool operator <  ( const object_id& a, const object_id& b ) { return a.instance < b.instance; }

      explicit operator std::string()const { return std::string( object_id_type( *this ) ); }

      uint64_t instance = 0;
   };

   /// Parses "space.type.instance"
   inline object_id_type parse_object_id( const std::string& s )
   { try {
      const auto first = s.find( '.' );
      FC_ASSERT( first != std::string::npos && first != 0, "Malformed object id" );
      const auto second = s.find( '.', first + 1 );
      FC_ASSERT( second != std::string::npos && second != first + 1 && second + 1 < s.size(),
                 "Malformed object id" );

      const uint64_t space = fc::to_uint64( s.substr( 0, first ) );
      const uint64_t type = fc::to_uint64( s.substr( first + 1, second - first - 1 ) );
      FC_ASSERT( space <= 0xff && type <= 0xff, "Space or type out of range" );
      return object_id_type( uint8_t( space ), uint8_t( type ), fc::to_uint64( s.substr( second + 1 ) ) );
   } FC_CAPTURE_AND_RETHROW( (s) ) }

} } // meridian::db

FC_REFLECT( meridian::db::object_id_type, (number) )

namespace fc {

   inline void to_variant( const meridian::db::object_id_type& var, fc::variant& vo, uint32_t max_depth = 1 )
   {
      vo = std::string( var );
   }

   inline void from_variant( const fc::variant& var, meridian::db::object_id_type& vo, uint32_t max_depth = 1 )
   {
      vo = meridian::db::parse_object_id( var.get_string() );
   }

   template<uint8_t SpaceID, uint8_t TypeID>
   void to_variant( const meridian::db::object_id<SpaceID,TypeID>& var, fc::variant& vo, uint32_t max_depth = 1 )
   {
      vo = std::string( var );
   }

   template<uint8_t SpaceID, uint8_t TypeID>
   void from_variant( const fc::variant& var, meridian::db::object_id<SpaceID,TypeID>& vo, uint32_t max_depth = 1 )
   {
      vo = meridian::db::object_id<SpaceID,TypeID>( meridian::db::parse_object_id( var.get_string() ) );
   }

} // fc
