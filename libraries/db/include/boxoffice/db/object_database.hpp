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
#include <boxoffice/db/object.hpp>
#include <boxoffice/db/index.hpp>
#include <boxoffice/db/undo_database.hpp>

#include <fc/log/logger.hpp>

#include <map>
#include <memory>
#include <utility>

namespace boxoffice { namespace db {

   template<typename ObjectType, typename MultiIndexType>
   class generic_index;

   /**
    *   @class object_database
    *   @brief a set of indexes, one per object space and type, whose changes can be undone
    *
    *   Every mutation goes through create, modify or remove so that an open undo session sees it.
    */
   class object_database
   {
      public:
         object_database();
         virtual ~object_database() = default;

         template<typename IndexType>
         IndexType* add_index()
         {
            using ObjectType = typename IndexType::object_type;
            auto& slot = _indexes[ std::make_pair( ObjectType::space_id, ObjectType::type_id ) ];
            FC_ASSERT( !slot, "Index ${s}.${t} already exists", ("s",ObjectType::space_id)("t",ObjectType::type_id) );
            slot = std::make_unique<IndexType>( *this );
            return static_cast<IndexType*>( slot.get() );
         }

         template<typename IndexType>
         const IndexType& get_index_type()const
         {
            using ObjectType = typename IndexType::object_type;
            return static_cast<const IndexType&>( get_index( ObjectType::space_id, ObjectType::type_id ) );
         }

         /// Stores a new T under @p id, which the caller allocated
         template<typename T, typename F>
         const T& create( object_id_type id, F&& constructor )
         {
            auto& idx = mutable_index( object_id_type( T::space_id, T::type_id, 0 ) );
            return static_cast<const T&>( idx.create( id, [&constructor]( object& o ) {
               constructor( static_cast<T&>(o) );
            }));
         }

         template<typename T, typename Lambda>
         void modify( const T& obj, const Lambda& m )
         {
            mutable_index( obj.id ).modify( obj, [&m]( object& o ) { m( static_cast<T&>(o) ); } );
         }

         void remove( const object& obj ) { mutable_index( obj.id ).remove( obj ); }

         template<uint8_t SpaceID, uint8_t TypeID>
         const object_downcast_t<object_id<SpaceID,TypeID>>* find( object_id<SpaceID,TypeID> id )const
         {
            return static_cast<const object_downcast_t<object_id<SpaceID,TypeID>>*>( find_object( object_id_type( id ) ) );
         }

         /// Visits every stored object, ordered by space, type and id
         void inspect_all_objects( const std::function<void(const object&)>& inspector )const;

         undo_database::session start_undo_session() { return _undo_db.start_undo_session(); }
         const undo_database&   get_undo_db()const   { return _undo_db; }

      private:
         template<typename ObjectType, typename MultiIndexType>
         friend class generic_index;
         friend class undo_database;

         const index&  get_index( uint8_t space_id, uint8_t type_id )const;
         index&        mutable_index( object_id_type id );
         const object* find_object( object_id_type id )const;

         void save_undo( const object& obj )        { _undo_db.on_modify( obj ); }
         void save_undo_add( const object& obj )    { _undo_db.on_create( obj ); }
         void save_undo_remove( const object& obj ) { _undo_db.on_remove( obj ); }

         std::map< std::pair<uint8_t,uint8_t>, std::unique_ptr<index> > _indexes;
         undo_database                                                   _undo_db;
   };

} } // boxoffice::db
