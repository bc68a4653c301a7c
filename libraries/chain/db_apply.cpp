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
#include <boxoffice/chain/database.hpp>

#include <boxoffice/chain/exceptions.hpp>
#include <boxoffice/chain/operation_evaluation_state.hpp>

namespace boxoffice { namespace chain {

operation_result database::apply_operation( const operation& op )
{ try {
   const height_type height = _clock->current_height();
   FC_ASSERT( height >= head_height(), "The clock moved backwards",
              ("height",height)("head_height",head_height()) );

   try {
      operation_validate( op );
   } catch( const fc::assert_exception& e ) {
      throw invalid_parameters_exception( e.get_log() );
   }

   const auto which = op.which();
   FC_ASSERT( which >= 0 && static_cast<size_t>(which) < _operation_evaluators.size()
              && _operation_evaluators[which], "No registered evaluator for this operation" );

   auto session = start_undo_session();
   modify( get_ledger_properties(), [height]( ledger_property_object& p ) {
      p.head_height = height;
   });
   // the evaluator collects the payment as its last step, nothing may fail after it
   operation_evaluation_state eval_state( this, height );
   auto result = _operation_evaluators[which]->evaluate( eval_state, op, true );
   session.commit();
   dlog( "Applied ${op} at height ${h}", ("op",op)("h",height) );

   BOXOFFICE_TRY_NOTIFY( applied_operation, op, result )
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

operation_outcome database::push_operation( const operation& op )
{
   operation_outcome outcome;
   try
   {
      outcome.result = apply_operation( op );
   }
   catch( const fc::exception& e )
   {
      outcome.error = classify_exception( e );
      outcome.message = e.to_string();
      wlog( "Rejected operation ${op}: ${e}", ("op",op)("e",e.to_detail_string()) );
   }
   return outcome;
}

} }
