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
#include <boxoffice/db/object_database.hpp>
#include <boxoffice/db/undo_database.hpp>

namespace boxoffice { namespace db {

undo_database::session::~session()
{
   if( !_active )
      return;
   try {
      _db.undo();
   } catch( const fc::exception& e ) {
      elog( "Unable to revert an abandoned undo session: ${e}", ("e",e.to_detail_string()) );
   } catch( const std::exception& e ) {
      elog( "Unable to revert an abandoned undo session: ${e}", ("e",e.what()) );
   }
}

void undo_database::session::commit()
{
   if( !_active )
      return;
   _active = false;
   _db.commit();
}

void undo_database::session::undo()
{
   if( !_active )
      return;
   _active = false;
   _db.undo();
}

undo_database::session undo_database::start_undo_session()
{
   FC_ASSERT( !_restoring, "Can not open a session while undoing" );
   _stack.emplace_back();
   return session( *this, true );
}

undo_state* undo_database::current_state()
{
   if( _restoring || _stack.empty() )
      return nullptr;
   return &_stack.back();
}

void undo_database::on_create( const object& obj )
{
   if( auto state = current_state() )
      state->new_ids.insert( obj.id );
}

void undo_database::on_modify( const object& obj )
{
   auto state = current_state();
   if( state == nullptr || state->new_ids.count( obj.id ) || state->old_values.count( obj.id ) )
      return;
   state->old_values[obj.id] = obj.clone();
}

void undo_database::on_remove( const object& obj )
{
   auto state = current_state();
   if( state == nullptr )
      return;
   if( state->new_ids.erase( obj.id ) )
      return;
   auto old = state->old_values.find( obj.id );
   if( old != state->old_values.end() )
   {
      // restore the value from before the session, not the modified one
      state->removed[obj.id] = std::move( old->second );
      state->old_values.erase( old );
      return;
   }
   state->removed[obj.id] = obj.clone();
}

void undo_database::undo()
{ try {
   FC_ASSERT( !_stack.empty(), "No undo session is open" );
   undo_state state = std::move( _stack.back() );
   _stack.pop_back();

   _restoring = true;
   try {
      for( auto& item : state.old_values )
      {
         const object* current = _db.find_object( item.first );
         FC_ASSERT( current != nullptr, "Modified object ${id} is missing", ("id",std::string(item.first)) );
         _db.mutable_index( item.first ).modify( *current, [&item]( object& o ) { o.move_from( *item.second ); } );
      }
      for( const auto& id : state.new_ids )
      {
         const object* created = _db.find_object( id );
         FC_ASSERT( created != nullptr, "Created object ${id} is missing", ("id",std::string(id)) );
         _db.mutable_index( id ).remove( *created );
      }
      for( auto& item : state.removed )
         _db.mutable_index( item.first ).insert( std::move( *item.second ) );
   } catch( ... ) {
      _restoring = false;
      throw;
   }
   _restoring = false;
} FC_CAPTURE_AND_RETHROW() }

void undo_database::commit()
{
   FC_ASSERT( !_stack.empty(), "No undo session is open" );
   if( _stack.size() == 1 )
   {
      _stack.pop_back();
      return;
   }

   undo_state state = std::move( _stack.back() );
   _stack.pop_back();
   undo_state& parent = _stack.back();

   for( auto& item : state.old_values )
   {
      if( !parent.new_ids.count( item.first ) && !parent.old_values.count( item.first ) )
         parent.old_values[item.first] = std::move( item.second );
   }
   for( const auto& id : state.new_ids )
      parent.new_ids.insert( id );
   for( auto& item : state.removed )
   {
      if( parent.new_ids.erase( item.first ) )
         continue;
      auto old = parent.old_values.find( item.first );
      if( old != parent.old_values.end() )
      {
         parent.removed[item.first] = std::move( old->second );
         parent.old_values.erase( old );
      }
      else
         parent.removed[item.first] = std::move( item.second );
   }
}

} } // boxoffice::db
