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

namespace boxoffice { namespace chain {

using namespace boxoffice::db;

/**
 * @class ledger_property_object
 * @brief Maintains the ledger wide counters and accumulators
 * @ingroup object
 * @ingroup implementation
 *
 * There is exactly one of these, at 2.0.0.  It is only changed through the database
 * while an operation is applied, so every change is undone with the operation.
 */
class ledger_property_object : public abstract_object<ledger_property_object>
{
   public:
      static constexpr uint8_t space_id = implementation_ids;
      static constexpr uint8_t type_id  = impl_ledger_property_object_type;

      /// Instance number of the next event, never reused
      uint64_t          next_event_id = 1;
      /// Instance number of the next ticket, never reused
      uint64_t          next_ticket_id = 1;
      share_type        total_platform_revenue;
      account_name_type treasury;
      /// Height observed by the last applied operation
      height_type       head_height = 0;
};

typedef multi_index_container<
   ledger_property_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
   >
> ledger_property_multi_index_type;

typedef generic_index<ledger_property_object, ledger_property_multi_index_type> ledger_property_index;

} } // boxoffice::chain

MAP_OBJECT_ID_TO_TYPE( boxoffice::chain::ledger_property_object )

FC_REFLECT_DERIVED( boxoffice::chain::ledger_property_object, (boxoffice::db::object),
                    (next_event_id)
                    (next_ticket_id)
                    (total_platform_revenue)
                    (treasury)
                    (head_height)
                  )
