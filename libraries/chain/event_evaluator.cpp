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
#include <boxoffice/chain/event_evaluator.hpp>

#include <boxoffice/chain/database.hpp>
#include <boxoffice/chain/event_object.hpp>
#include <boxoffice/chain/exceptions.hpp>

namespace boxoffice { namespace chain {

void_result event_create_evaluator::do_evaluate( const event_create_operation& op )
{ try {
   BOXOFFICE_ASSERT( op.event_height > now(), event_expired_exception,
                     "Event height ${e} must be after the current height ${h}",
                     ("e",op.event_height)("h",now()) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type event_create_evaluator::do_apply( const event_create_operation& op )
{ try {
   database& d = db();

   const event_id_type new_id = d.allocate_event_id();
   const auto& new_event = d.create<event_object>( object_id_type( new_id ), [&op]( event_object& e ) {
      e.creator          = op.creator;
      e.name             = op.name;
      e.description      = op.description;
      e.venue            = op.venue;
      e.event_type       = op.event_type;
      e.event_height     = op.event_height;
      e.total_supply     = op.total_tickets;
      e.available_supply = op.total_tickets;
      e.base_price       = op.base_price;
      e.active           = true;
   });

   ilog( "Created event ${id} '${n}' with ${s} tickets at ${p}",
         ("id",new_event.id)("n",new_event.name)("s",new_event.total_supply)("p",new_event.base_price) );
   return new_event.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // boxoffice::chain
