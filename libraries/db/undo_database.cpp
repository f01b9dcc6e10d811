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
#include <meridian/db/object_database.hpp>
#include <meridian/db/undo_database.hpp>

namespace meridian { namespace db {

undo_database::session::~session()
{
   if( !_active )
      return;
   try {
      _undo_db.undo();
   } catch( const fc::exception& e ) {
      // the database is left half restored
      elog( "Undo failed: ${e}", ("e",e.to_detail_string()) );
      throw;
   }
}

void undo_database::session::commit()
{
   if( _active )
      _undo_db.commit();
   _active = false;
}

void undo_database::session::undo()
{
   if( _active )
      _undo_db.undo();
   _active = false;
}

undo_database::session undo_database::start_undo_session()
{
   _stack.emplace_back();
   return session( *this );
}

void undo_database::on_create( const object& obj )
{
   if( _stack.empty() )
      return;

   undo_state& state = _stack.back();
   // the first id handed out in this session is where the index restarts on undo
   state.old_next_instances.emplace( obj.id.space_type(), obj.id.instance() );
   state.new_ids.insert( obj.id );
}

void undo_database::on_modify( const object& obj )
{
   if( _stack.empty() )
      return;

   undo_state& state = _stack.back();
   if( state.new_ids.count( obj.id ) != 0 || state.old_values.count( obj.id ) != 0 )
      return;
   state.old_values[obj.id] = obj.clone();
}

void undo_database::on_remove( const object& obj )
{
   if( _stack.empty() )
      return;

   undo_state& state = _stack.back();
   if( state.new_ids.erase( obj.id ) != 0 )
      return;

   auto itr = state.old_values.find( obj.id );
   if( itr != state.old_values.end() )
   {
      state.removed[obj.id] = std::move( itr->second );
      state.old_values.erase( itr );
      return;
   }
   if( state.removed.count( obj.id ) == 0 )
      state.removed[obj.id] = obj.clone();
}

void undo_database::undo()
{ try {
   FC_ASSERT( !_stack.empty(), "No undo session is open" );
   undo_state& state = _stack.back();

   for( auto& item : state.old_values )
   {
      unique_ptr<object>& old_value = item.second;
      _db.get_mutable_index( item.first ).modify( _db.get_object( item.first ),
                                                  [&old_value]( object& o ) { o.move_from( *old_value ); } );
   }

   for( const object_id_type& id : state.new_ids )
   {
      index& idx = _db.get_mutable_index( id );
      idx.remove( idx.get( id ) );
   }

   for( const auto& item : state.old_next_instances )
      _db.get_mutable_index( uint8_t( item.first >> 8 ), uint8_t( item.first & 0xff ) )
         .set_next_instance( item.second );

   for( const auto& item : state.removed )
      _db.get_mutable_index( item.first ).restore( *item.second );

   _stack.pop_back();
} FC_CAPTURE_AND_RETHROW() }

void undo_database::commit()
{ try {
   FC_ASSERT( !_stack.empty(), "No undo session is open" );
   if( _stack.size() == 1 )
   {
      _stack.pop_back();
      return;
   }

   undo_state child = std::move( _stack.back() );
   _stack.pop_back();
   undo_state& parent = _stack.back();

   for( auto& item : child.old_values )
   {
      if( parent.new_ids.count( item.first ) != 0 )
         continue;
      if( parent.old_values.count( item.first ) == 0 )
         parent.old_values[item.first] = std::move( item.second );
   }

   for( const object_id_type& id : child.new_ids )
      parent.new_ids.insert( id );

   for( const auto& item : child.old_next_instances )
      parent.old_next_instances.emplace( item.first, item.second );

   for( auto& item : child.removed )
   {
      if( parent.new_ids.erase( item.first ) != 0 )
         continue;
      // keep the value from before the parent's own changes
      auto itr = parent.old_values.find( item.first );
      if( itr != parent.old_values.end() )
      {
         parent.removed[item.first] = std::move( itr->second );
         parent.old_values.erase( itr );
         continue;
      }
      parent.removed.emplace( item.first, std::move( item.second ) );
   }
} FC_CAPTURE_AND_RETHROW() }

} } // meridian::db
