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

namespace boxoffice { namespace db {

object_database::object_database()
:_undo_db(*this)
{
}

const index& object_database::get_index( uint8_t space_id, uint8_t type_id )const
{
   auto itr = _indexes.find( std::make_pair( space_id, type_id ) );
   FC_ASSERT( itr != _indexes.end(), "No index for objects of type ${s}.${t}", ("s",space_id)("t",type_id) );
   return *itr->second;
}

index& object_database::mutable_index( object_id_type id )
{
   auto itr = _indexes.find( std::make_pair( id.space(), id.type() ) );
   FC_ASSERT( itr != _indexes.end(), "No index for object ${id}", ("id",std::string(id)) );
   return *itr->second;
}

const object* object_database::find_object( object_id_type id )const
{
   return get_index( id.space(), id.type() ).find( id );
}

void object_database::inspect_all_objects( const std::function<void(const object&)>& inspector )const
{
   for( const auto& item : _indexes )
      item.second->inspect_all_objects( inspector );
}

} } // boxoffice::db
