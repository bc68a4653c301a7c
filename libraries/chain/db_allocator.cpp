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

namespace boxoffice { namespace chain {

event_id_type database::allocate_event_id()
{
   const auto& props = get_ledger_properties();
   const event_id_type result( props.next_event_id );
   modify( props, []( ledger_property_object& p ) {
      ++p.next_event_id;
   });
   return result;
}

ticket_id_type database::allocate_ticket_ids( uint32_t count )
{
   FC_ASSERT( count > 0, "Need to allocate at least one ticket id" );
   const auto& props = get_ledger_properties();
   const ticket_id_type first( props.next_ticket_id );
   FC_ASSERT( props.next_ticket_id + count - 1 <= object_id_type::max_instance, "Ticket ids exhausted" );
   modify( props, [count]( ledger_property_object& p ) {
      p.next_ticket_id += count;
   });
   return first;
}

void database::accrue_platform_fee( share_type fee )
{
   FC_ASSERT( fee >= 0, "Platform fee can not be negative", ("fee",fee) );
   modify( get_ledger_properties(), [fee]( ledger_property_object& p ) {
      p.total_platform_revenue += fee;
   });
}

} }
