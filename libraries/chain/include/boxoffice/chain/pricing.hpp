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

   class event_object;

   /// Price of a single ticket at the current state of an event
   struct price_quote
   {
      share_type unit_price;
      share_type fee;
      share_type total;
   };

   /// Price of a batch of tickets, frozen at the state of the event before the batch
   struct batch_quote
   {
      share_type unit_price;             ///< Demand price before the group discount
      uint16_t   discount_percent = 0;
      share_type discounted_unit_price;  ///< What every ticket of the batch records as paid
      uint32_t   quantity = 0;
      share_type subtotal;
      share_type fee;
      share_type total;
   };

   /**
    * Current demand price of one ticket: the base price plus an uplift of up to half of it,
    * proportional to the share of the supply already sold.
    *
    * Throws corrupted_event_exception for an event without supply.
    */
   share_type ticket_price( const event_object& e );

   /// The platform fee charged on top of @p amount, truncated toward zero
   share_type platform_fee( share_type amount );

   /// The group discount for buying @p quantity tickets at once, in percent
   uint16_t group_discount_percent( uint32_t quantity, bool apply_group_discount );

   price_quote quote_ticket( const event_object& e );
   batch_quote quote_batch( const event_object& e, uint32_t quantity, bool apply_group_discount );

   /// True iff the event is active, lies in the future of @p now and has tickets left
   bool is_purchasable( const event_object& e, height_type now );

} } // boxoffice::chain

FC_REFLECT( boxoffice::chain::price_quote, (unit_price)(fee)(total) )
FC_REFLECT( boxoffice::chain::batch_quote,
            (unit_price)(discount_percent)(discounted_unit_price)(quantity)(subtotal)(fee)(total) )
