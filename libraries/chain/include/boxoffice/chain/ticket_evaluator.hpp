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
#include <boxoffice/chain/evaluator.hpp>
#include <boxoffice/chain/pricing.hpp>

#include <boxoffice/protocol/ticket.hpp>

namespace boxoffice { namespace chain {

   class event_object;
   class ticket_object;

   class ticket_purchase_evaluator : public evaluator<ticket_purchase_evaluator>
   {
      public:
         typedef ticket_purchase_operation operation_type;

         void_result do_evaluate( const ticket_purchase_operation& op );
         object_id_type do_apply( const ticket_purchase_operation& op );

         const event_object* _event = nullptr;
         price_quote         _quote;
   };

   class ticket_batch_purchase_evaluator : public evaluator<ticket_batch_purchase_evaluator>
   {
      public:
         typedef ticket_batch_purchase_operation operation_type;

         void_result do_evaluate( const ticket_batch_purchase_operation& op );
         batch_purchase_result do_apply( const ticket_batch_purchase_operation& op );

         const event_object* _event = nullptr;
         batch_quote         _quote;
   };

   class ticket_transfer_evaluator : public evaluator<ticket_transfer_evaluator>
   {
      public:
         typedef ticket_transfer_operation operation_type;

         void_result do_evaluate( const ticket_transfer_operation& op );
         void_result do_apply( const ticket_transfer_operation& op );

         const ticket_object* _ticket = nullptr;
   };

} } // boxoffice::chain
