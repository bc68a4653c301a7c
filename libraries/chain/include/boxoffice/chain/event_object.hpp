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
 *  @brief a sellable occasion with a fixed ticket supply
 *  @ingroup object
 *  @ingroup protocol
 *
 *  Only available_supply changes after creation; events are never removed.
 *  0 <= available_supply <= total_supply holds at all times.
 */
class event_object : public abstract_object<event_object>
{
   public:
      static constexpr uint8_t space_id = protocol_ids;
      static constexpr uint8_t type_id  = event_object_type;

      account_name_type creator;      ///< Informational, not used for authorization
      string            name;
      string            description;
      string            venue;
      string            event_type;
      height_type       event_height = 0;     ///< The logical height at which the event takes place
      uint32_t          total_supply = 0;
      uint32_t          available_supply = 0;
      share_type        base_price;
      /// No operation clears this flag, it is reserved for an event management collaborator
      bool              active = true;

      event_id_type get_id()const { return event_id_type( id ); }
      uint32_t      sold()const { return total_supply - available_supply; }
};

struct by_creator;

/**
* @ingroup object_index
*/
typedef multi_index_container<
   event_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_creator>,
         composite_key< event_object,
            member< event_object, account_name_type, &event_object::creator >,
            member< object, object_id_type, &object::id >
         >
      >
   >
> event_multi_index_type;

/**
* @ingroup object_index
*/
typedef generic_index<event_object, event_multi_index_type> event_index;

} } // boxoffice::chain

MAP_OBJECT_ID_TO_TYPE( boxoffice::chain::event_object )

FC_REFLECT_DERIVED( boxoffice::chain::event_object, (boxoffice::db::object),
                    (creator)
                    (name)
                    (description)
                    (venue)
                    (event_type)
                    (event_height)
                    (total_supply)
                    (available_supply)
                    (base_price)
                    (active)
                  )
