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

#include <fc/log/logger.hpp>

#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace boxoffice { namespace db {

   class object_database;

   /// What one session changed: snapshots of modified and removed objects, ids of new ones
   struct undo_state
   {
      std::unordered_map<object_id_type, unique_ptr<object> > old_values;
      std::unordered_set<object_id_type>                      new_ids;
      std::unordered_map<object_id_type, unique_ptr<object> > removed;
   };

   /**
    * @class undo_database
    * @brief a stack of nested sessions over an object_database
    *
    * Changes are only recorded while a session is open.  Committing the outermost session
    * makes its changes permanent, committing an inner one hands them to its parent.
    */
   class undo_database
   {
      public:
         explicit undo_database( object_database& db ):_db(db){}

         /// One level of the stack; reverted on destruction unless it was committed
         class session
         {
            public:
               session( session&& other ):_db(other._db),_active(other._active) { other._active = false; }
               session( const session& ) = delete;
               session& operator = ( const session& ) = delete;
               ~session();

               void commit();
               void undo();

            private:
               friend class undo_database;
               session( undo_database& db, bool active ):_db(db),_active(active){}

               undo_database& _db;
               bool           _active;
         };

         session start_undo_session();

         /// Called after @p obj was stored
         void on_create( const object& obj );
         /// Called before @p obj changes; objects created in the same session are not snapshotted
         void on_modify( const object& obj );
         /// Called before @p obj is erased
         void on_remove( const object& obj );

         /// Number of open sessions
         size_t depth()const { return _stack.size(); }

      private:
         void undo();
         void commit();
         undo_state* current_state();

         std::vector<undo_state> _stack;
         bool                    _restoring = false;
         object_database&        _db;
   };

} } // boxoffice::db
