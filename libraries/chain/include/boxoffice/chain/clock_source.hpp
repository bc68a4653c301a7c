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

#include <boxoffice/chain/types.hpp>

namespace boxoffice { namespace chain {

   /**
    * Supplies the logical height operations are applied at.  Heights never decrease.
    */
   class clock_source
   {
      public:
         virtual ~clock_source(){}
         virtual height_type current_height()const = 0;
   };

   /// A clock that only moves when told to
   class manual_clock : public clock_source
   {
      public:
         explicit manual_clock( height_type initial_height = 0 ):_height(initial_height){}

         virtual height_type current_height()const override { return _height; }

         void set_height( height_type height );
         void advance( uint32_t blocks = 1 );

      private:
         height_type _height;
   };

} } // boxoffice::chain
