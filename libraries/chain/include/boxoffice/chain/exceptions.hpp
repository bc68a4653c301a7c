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

#include <fc/exception/exception.hpp>
#include <boxoffice/protocol/exceptions.hpp>
#include <boxoffice/chain/types.hpp>

#include <fc/log/logger.hpp>

#include <exception>

#define BOXOFFICE_TRY_NOTIFY( signal, ... )                                   \
   try                                                                        \
   {                                                                          \
      signal( __VA_ARGS__ );                                                  \
   }                                                                          \
   catch( const fc::exception& e )                                            \
   {                                                                          \
      elog( "Caught exception in ${s} handler: ${e}",                         \
            ("s", #signal)("e", e.to_detail_string()) );                      \
   }                                                                          \
   catch( const std::exception& e )                                           \
   {                                                                          \
      elog( "Caught exception in ${s} handler: ${e}",                         \
            ("s", #signal)("e", e.what()) );                                  \
   }                                                                          \
   catch( ... )                                                               \
   {                                                                          \
      elog( "Caught unexpected exception in ${s} handler", ("s", #signal) );  \
   }

namespace boxoffice { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( operation_validate_exception,   chain_exception, 3040000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception,   chain_exception, 3050000 )
   FC_DECLARE_DERIVED_EXCEPTION( internal_exception,             chain_exception, 3990000 )

   FC_DECLARE_DERIVED_EXCEPTION( invalid_parameters_exception,   operation_validate_exception, 3040001 )

   FC_DECLARE_DERIVED_EXCEPTION( object_not_found_exception,     operation_evaluate_exception, 3050001 )
   FC_DECLARE_DERIVED_EXCEPTION( event_expired_exception,        operation_evaluate_exception, 3050002 )
   FC_DECLARE_DERIVED_EXCEPTION( event_not_active_exception,     operation_evaluate_exception, 3050003 )
   FC_DECLARE_DERIVED_EXCEPTION( sold_out_exception,             operation_evaluate_exception, 3050004 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_payment_exception, operation_evaluate_exception, 3050005 )
   FC_DECLARE_DERIVED_EXCEPTION( payment_failed_exception,       insufficient_payment_exception, 3050006 )
   FC_DECLARE_DERIVED_EXCEPTION( not_ticket_owner_exception,     operation_evaluate_exception, 3050007 )
   FC_DECLARE_DERIVED_EXCEPTION( transfer_not_allowed_exception, operation_evaluate_exception, 3050008 )

   FC_DECLARE_DERIVED_EXCEPTION( corrupted_event_exception,      internal_exception, 3990001 )

   /**
    * The kinds of failure a ledger operation can report back to its caller.
    * Everything that is not part of the normal rejection taxonomy is internal_error.
    */
   enum ledger_error
   {
      no_error,
      not_found,
      invalid_parameters,
      event_expired,
      event_not_active,
      sold_out,
      insufficient_payment,
      not_ticket_owner,
      transfer_not_allowed,
      internal_error
   };

   /// Maps an exception raised while applying an operation to the kind reported to callers
   ledger_error classify_exception( const fc::exception& e );

} } // boxoffice::chain

FC_REFLECT_ENUM( boxoffice::chain::ledger_error,
                 (no_error)
                 (not_found)
                 (invalid_parameters)
                 (event_expired)
                 (event_not_active)
                 (sold_out)
                 (insufficient_payment)
                 (not_ticket_owner)
                 (transfer_not_allowed)
                 (internal_error) )
