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
#include <boxoffice/protocol/event.hpp>
#include <boxoffice/protocol/ticket.hpp>

namespace boxoffice { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef fc::static_variant<
            /* 0 */ event_create_operation,
            /* 1 */ ticket_purchase_operation,
            /* 2 */ ticket_batch_purchase_operation,
            /* 3 */ ticket_transfer_operation
         > operation;

   /// What an applied operation produced: nothing, the id of a new object or a batch summary
   typedef fc::static_variant<
            void_result,
            object_id_type,
            batch_purchase_result
         > operation_result;

   /// @} // operations group

   /// Runs the stateless checks of whichever operation @p op holds
   void operation_validate( const operation& op );

} } // boxoffice::protocol

FC_REFLECT_TYPENAME( boxoffice::protocol::operation )
FC_REFLECT_TYPENAME( boxoffice::protocol::operation_result )
