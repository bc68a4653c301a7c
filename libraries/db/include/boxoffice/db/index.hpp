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

#include <functional>

namespace boxoffice { namespace db {

   /**
    *  @class index
    *  @brief storage for the objects of one space and type
    *
    *  Callers go through object_database, which records undo state before an index changes.
    */
   class index
   {
      public:
         virtual ~index(){}

         /// Stores an object that already carries its id, used to bring back removed objects
         virtual const object&  insert( object&& obj ) = 0;

         /**
          *  Builds a new object with the given id, passes it to the constructor to
          *  initialize the remaining fields and then stores it.
          */
         virtual const object&  create( object_id_type id, const std::function<void(object&)>& constructor ) = 0;

         /// @return nullptr if no object with this id is stored
         virtual const object*  find( object_id_type id )const = 0;

         virtual void           modify( const object& obj, const std::function<void(object&)>& m ) = 0;
         virtual void           remove( const object& obj ) = 0;

         virtual void           inspect_all_objects( const std::function<void(const object&)>& inspector )const = 0;
   };

} } // boxoffice::db
