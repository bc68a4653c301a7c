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
#include <boxoffice/protocol/ticket.hpp>
#include <boxoffice/protocol/event.hpp>

namespace boxoffice { namespace protocol {

void ticket_purchase_operation::validate()const
{
   validate_account_name( buyer );
   FC_ASSERT( seat_info.size() <= BOXOFFICE_MAX_SEAT_INFO_LENGTH, "Seat info is too long", ("seat_info",seat_info) );
}

void ticket_batch_purchase_operation::validate()const
{
   validate_account_name( buyer );
   FC_ASSERT( quantity > 0, "Quantity must be positive" );
   FC_ASSERT( quantity <= BOXOFFICE_MAX_BATCH_SIZE, "At most ${max} tickets can be bought at once",
              ("max",BOXOFFICE_MAX_BATCH_SIZE)("quantity",quantity) );
   FC_ASSERT( seat_infos.size() == quantity, "Need exactly one seat info per ticket",
              ("quantity",quantity)("seat_infos",seat_infos.size()) );
   for( const auto& seat : seat_infos )
      FC_ASSERT( seat.size() <= BOXOFFICE_MAX_SEAT_INFO_LENGTH, "Seat info is too long", ("seat_info",seat) );
}

void ticket_transfer_operation::validate()const
{
   validate_account_name( from );
   validate_account_name( new_owner );
}

} } // boxoffice::protocol
