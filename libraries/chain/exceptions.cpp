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
#include <boxoffice/chain/exceptions.hpp>

namespace boxoffice { namespace chain {

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "ledger exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_validate_exception,   chain_exception, 3040000, "operation validation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_evaluate_exception,   chain_exception, 3050000, "operation evaluation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( internal_exception,             chain_exception, 3990000, "internal exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_parameters_exception,   operation_validate_exception, 3040001, "invalid price or parameters" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( object_not_found_exception,     operation_evaluate_exception, 3050001, "object not found" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( event_expired_exception,        operation_evaluate_exception, 3050002, "event already expired" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( event_not_active_exception,     operation_evaluate_exception, 3050003, "event not active" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( sold_out_exception,             operation_evaluate_exception, 3050004, "sold out" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_payment_exception, operation_evaluate_exception, 3050005, "insufficient payment" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( payment_failed_exception,       insufficient_payment_exception, 3050006, "payment failed" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_ticket_owner_exception,     operation_evaluate_exception, 3050007, "not ticket owner" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( transfer_not_allowed_exception, operation_evaluate_exception, 3050008, "transfer not allowed" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( corrupted_event_exception,      internal_exception, 3990001, "corrupted event" )

   ledger_error classify_exception( const fc::exception& e )
   {
      switch( e.code() )
      {
         case invalid_parameters_exception::code_value:
            return invalid_parameters;
         case object_not_found_exception::code_value:
            return not_found;
         case event_expired_exception::code_value:
            return event_expired;
         case event_not_active_exception::code_value:
            return event_not_active;
         case sold_out_exception::code_value:
            return sold_out;
         case insufficient_payment_exception::code_value:
         case payment_failed_exception::code_value:
            return insufficient_payment;
         case not_ticket_owner_exception::code_value:
            return not_ticket_owner;
         case transfer_not_allowed_exception::code_value:
            return transfer_not_allowed;
         default:
            return internal_error;
      }
   }

} } // boxoffice::chain
