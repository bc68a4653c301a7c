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
#include <boxoffice/protocol/base.hpp>

namespace boxoffice { namespace protocol {

   /// Checks that an account name is usable as a ledger participant
   void validate_account_name( const account_name_type& name );

   /**
    * @brief Creates a new event with a fixed ticket supply and base price
    * @ingroup operations
    *
    * The event starts active with every ticket available.  event_height must lie in the
    * future of the height the operation is applied at.
    */
   struct event_create_operation : public base_operation
   {
      account_name_type creator;        ///< The account who creates the event
      string            name;
      string            description;
      string            venue;
      string            event_type;     ///< Free form category, e.g. "concert"
      height_type       event_height = 0; ///< The logical height at which the event takes place
      uint32_t          total_tickets = 0;
      share_type        base_price;     ///< Price of a ticket before any demand uplift

      void validate()const;
   };

} } // boxoffice::protocol

FC_REFLECT( boxoffice::protocol::event_create_operation,
            (creator)(name)(description)(venue)(event_type)(event_height)(total_tickets)(base_price) )
