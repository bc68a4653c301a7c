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
#include <boxoffice/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace boxoffice { namespace chain {

using namespace boxoffice::db;

/**
 *  @brief an individually owned entitlement to one seat at an event
 *  @ingroup object
 *  @ingroup protocol
 *
 *  A ticket is minted once per sold seat and only its owner changes afterwards.
 */
class ticket_object : public abstract_object<ticket_object>
{
   public:
      static constexpr uint8_t space_id = protocol_ids;
      static constexpr uint8_t type_id  = ticket_object_type;

      event_id_type     event;
      account_name_type owner;
      share_type        price_paid;          ///< Unit price charged, before the platform fee
      height_type       purchase_height = 0;
      /// Set by redemption, which happens outside the ledger
      bool              used = false;
      bool              transferable = true;
      string            seat_info;

      ticket_id_type get_id()const { return ticket_id_type( id ); }
};

struct by_owner;
struct by_event;

/**
* @ingroup object_index
*/
typedef multi_index_container<
   ticket_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_owner>,
         composite_key< ticket_object,
            member< ticket_object, account_name_type, &ticket_object::owner >,
            member< object, object_id_type, &object::id >
         >
      >,
      ordered_unique< tag<by_event>,
         composite_key< ticket_object,
            member< ticket_object, event_id_type, &ticket_object::event >,
            member< object, object_id_type, &object::id >
         >
      >
   >
> ticket_multi_index_type;

/**
* @ingroup object_index
*/
typedef generic_index<ticket_object, ticket_multi_index_type> ticket_index;

} } // boxoffice::chain

MAP_OBJECT_ID_TO_TYPE( boxoffice::chain::ticket_object )

FC_REFLECT_DERIVED( boxoffice::chain::ticket_object, (boxoffice::db::object),
                    (event)
                    (owner)
                    (price_paid)
                    (purchase_height)
                    (used)
                    (transferable)
                    (seat_info)
                  )
