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
#include <boxoffice/chain/ticket_object.hpp>

#include <boxoffice/chain/ticket_evaluator.hpp>

#include <boxoffice/chain/database.hpp>
#include <boxoffice/chain/event_object.hpp>
#include <boxoffice/chain/exceptions.hpp>

namespace boxoffice { namespace chain {

namespace {

   /// Tells a sold out event apart from one that is inactive or already past
   void check_purchasable( const event_object& e, height_type now )
   {
      if( is_purchasable( e, now ) )
         return;
      BOXOFFICE_ASSERT( e.available_supply > 0, sold_out_exception,
                        "Event ${id} is sold out", ("id",e.id) );
      FC_THROW_EXCEPTION( event_not_active_exception,
                          "Event ${id} is not open for sale at height ${h}",
                          ("id",e.id)("active",e.active)("event_height",e.event_height)("h",now) );
   }

}

void_result ticket_purchase_evaluator::do_evaluate( const ticket_purchase_operation& op )
{ try {
   const database& d = db();

   _event = d.find_event( op.event );
   BOXOFFICE_ASSERT( _event != nullptr, object_not_found_exception,
                     "Event ${id} does not exist", ("id",op.event) );

   _quote = quote_ticket( *_event );
   check_purchasable( *_event, now() );
   prepare_payment( op.buyer, _quote.total );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type ticket_purchase_evaluator::do_apply( const ticket_purchase_operation& op )
{ try {
   database& d = db();
   const height_type height = now();

   const ticket_id_type new_id = d.allocate_ticket_ids( 1 );
   const auto& new_ticket = d.create<ticket_object>( object_id_type( new_id ), [&op,this,height]( ticket_object& t ) {
      t.event           = op.event;
      t.owner           = op.buyer;
      t.price_paid      = _quote.unit_price;
      t.purchase_height = height;
      t.used            = false;
      t.transferable    = true;
      t.seat_info       = op.seat_info;
   });

   d.modify( *_event, []( event_object& e ) {
      e.available_supply -= 1;
   });
   d.accrue_platform_fee( _quote.fee );

   dlog( "Sold ticket ${t} of event ${e} to ${b} for ${p} plus ${f} fee",
         ("t",new_ticket.id)("e",op.event)("b",op.buyer)("p",_quote.unit_price)("f",_quote.fee) );
   return new_ticket.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result ticket_batch_purchase_evaluator::do_evaluate( const ticket_batch_purchase_operation& op )
{ try {
   const database& d = db();

   _event = d.find_event( op.event );
   BOXOFFICE_ASSERT( _event != nullptr, object_not_found_exception,
                     "Event ${id} does not exist", ("id",op.event) );

   check_purchasable( *_event, now() );
   BOXOFFICE_ASSERT( _event->available_supply >= op.quantity, sold_out_exception,
                     "Only ${a} tickets left for event ${id}, ${q} requested",
                     ("a",_event->available_supply)("id",op.event)("q",op.quantity) );

   _quote = quote_batch( *_event, op.quantity, op.apply_group_discount );
   prepare_payment( op.buyer, _quote.total );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

batch_purchase_result ticket_batch_purchase_evaluator::do_apply( const ticket_batch_purchase_operation& op )
{ try {
   database& d = db();
   const height_type height = now();

   batch_purchase_result result;
   result.first_ticket     = d.allocate_ticket_ids( op.quantity );
   result.quantity         = op.quantity;
   result.total_paid       = _quote.total;
   result.discount_percent = _quote.discount_percent;

   for( uint32_t i = 0; i < op.quantity; ++i )
   {
      const ticket_id_type ticket_id = result.first_ticket + i;
      d.create<ticket_object>( object_id_type( ticket_id ), [&op,this,height,i]( ticket_object& t ) {
         t.event           = op.event;
         t.owner           = op.buyer;
         t.price_paid      = _quote.discounted_unit_price;
         t.purchase_height = height;
         t.used            = false;
         t.transferable    = true;
         t.seat_info       = op.seat_infos[i];
      });
   }

   d.modify( *_event, [&op]( event_object& e ) {
      e.available_supply -= op.quantity;
   });
   d.accrue_platform_fee( _quote.fee );

   dlog( "Sold ${q} tickets of event ${e} to ${b} starting at ${t} for ${p} total",
         ("q",op.quantity)("e",op.event)("b",op.buyer)("t",result.first_ticket)("p",_quote.total) );
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result ticket_transfer_evaluator::do_evaluate( const ticket_transfer_operation& op )
{ try {
   const database& d = db();

   _ticket = d.find_ticket( op.ticket );
   BOXOFFICE_ASSERT( _ticket != nullptr, object_not_found_exception,
                     "Ticket ${id} does not exist", ("id",op.ticket) );
   BOXOFFICE_ASSERT( _ticket->owner == op.from, not_ticket_owner_exception,
                     "Ticket ${id} is not owned by ${a}", ("id",op.ticket)("a",op.from) );
   BOXOFFICE_ASSERT( _ticket->transferable && !_ticket->used, transfer_not_allowed_exception,
                     "Ticket ${id} can not be transferred",
                     ("id",op.ticket)("transferable",_ticket->transferable)("used",_ticket->used) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result ticket_transfer_evaluator::do_apply( const ticket_transfer_operation& op )
{ try {
   db().modify( *_ticket, [&op]( ticket_object& t ) {
      t.owner = op.new_owner;
   });
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // boxoffice::chain
