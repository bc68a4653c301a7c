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
#include <boxoffice/chain/evaluator.hpp>
#include <boxoffice/chain/exceptions.hpp>
#include <boxoffice/chain/operation_evaluation_state.hpp>

namespace boxoffice { namespace chain {
database& generic_evaluator::db()const { return trx_state->db(); }
height_type generic_evaluator::now()const { return trx_state->height(); }

   operation_result generic_evaluator::start_evaluate( operation_evaluation_state& eval_state, const operation& op, bool apply )
   { try {
      trx_state   = &eval_state;
      auto result = evaluate( op );

      if( apply ) result = this->apply( op );
      return result;
   } FC_CAPTURE_AND_RETHROW() }

   void generic_evaluator::prepare_payment( const account_name_type& payer, share_type amount )
   {
      FC_ASSERT( amount >= 0 );
      const share_type balance = db().get_payment_gateway().get_balance( payer );
      BOXOFFICE_ASSERT( balance >= amount, insufficient_payment_exception,
                        "Account ${a} has ${b} available but ${r} is required",
                        ("a",payer)("b",balance)("r",amount) );
      payment_payer = payer;
      payment_due = amount;
   }

   void generic_evaluator::collect_payment()
   { try {
      if( payment_due == 0 )
         return;
      const auto& treasury = db().get_ledger_properties().treasury;
      BOXOFFICE_ASSERT( db().get_payment_gateway().transfer( payment_due, payment_payer, treasury ),
                        payment_failed_exception,
                        "Payment of ${r} from ${a} to ${t} was refused",
                        ("r",payment_due)("a",payment_payer)("t",treasury) );
   } FC_CAPTURE_AND_RETHROW( (payment_payer)(payment_due) ) }
} }
