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

   /**
    * @brief Buys one ticket for an event at the current demand price plus platform fee
    * @ingroup operations
    */
   struct ticket_purchase_operation : public base_operation
   {
      account_name_type buyer;      ///< The account who pays and becomes owner of the ticket
      event_id_type     event;
      string            seat_info;  ///< Free form, not checked for uniqueness

      void validate()const;
   };

   /**
    * @brief Buys up to BOXOFFICE_MAX_BATCH_SIZE tickets for one event in a single step
    * @ingroup operations
    *
    * The unit price is taken from the event state before the batch, and is the same for
    * every ticket of the batch.  With apply_group_discount set, groups of
    * BOXOFFICE_SMALL_GROUP_SIZE or more tickets are discounted.
    */
   struct ticket_batch_purchase_operation : public base_operation
   {
      account_name_type buyer;
      event_id_type     event;
      uint32_t          quantity = 0;
      vector<string>    seat_infos;  ///< One entry per ticket, in minting order
      bool              apply_group_discount = false;

      void validate()const;
   };

   /**
    * @brief Hands a ticket over to another account
    * @ingroup operations
    *
    * No payment is involved.  Only the current owner may transfer, and only while the
    * ticket is transferable and not used.
    */
   struct ticket_transfer_operation : public base_operation
   {
      account_name_type from;       ///< Must be the current owner of the ticket
      ticket_id_type    ticket;
      account_name_type new_owner;

      void validate()const;
   };

   /// Result of a ticket_batch_purchase_operation
   struct batch_purchase_result
   {
      ticket_id_type first_ticket;  ///< Ids first_ticket .. first_ticket + quantity - 1 were minted
      uint32_t       quantity = 0;
      share_type     total_paid;    ///< Discounted subtotal plus platform fee
      uint16_t       discount_percent = 0;
   };

} } // boxoffice::protocol

FC_REFLECT( boxoffice::protocol::ticket_purchase_operation, (buyer)(event)(seat_info) )
FC_REFLECT( boxoffice::protocol::ticket_batch_purchase_operation,
            (buyer)(event)(quantity)(seat_infos)(apply_group_discount) )
FC_REFLECT( boxoffice::protocol::ticket_transfer_operation, (from)(ticket)(new_owner) )
FC_REFLECT( boxoffice::protocol::batch_purchase_result, (first_ticket)(quantity)(total_paid)(discount_percent) )
