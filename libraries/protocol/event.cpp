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
#include <boxoffice/protocol/event.hpp>

namespace boxoffice { namespace protocol {

void validate_account_name( const account_name_type& name )
{
   FC_ASSERT( !name.empty(), "Account name must not be empty" );
   FC_ASSERT( name.size() <= BOXOFFICE_MAX_ACCOUNT_NAME_LENGTH, "Account name is too long",
              ("name",name)("max",BOXOFFICE_MAX_ACCOUNT_NAME_LENGTH) );
}

void event_create_operation::validate()const
{
   validate_account_name( creator );
   FC_ASSERT( !name.empty(), "Event name must not be empty" );
   FC_ASSERT( name.size() <= BOXOFFICE_MAX_EVENT_NAME_LENGTH, "Event name is too long" );
   FC_ASSERT( description.size() <= BOXOFFICE_MAX_EVENT_DESCRIPTION_LENGTH, "Event description is too long" );
   FC_ASSERT( venue.size() <= BOXOFFICE_MAX_VENUE_LENGTH, "Venue is too long" );
   FC_ASSERT( event_type.size() <= BOXOFFICE_MAX_EVENT_TYPE_LENGTH, "Event type is too long" );
   FC_ASSERT( total_tickets > 0, "An event needs at least one ticket" );
   FC_ASSERT( base_price > 0, "Base price must be positive", ("base_price",base_price) );
   FC_ASSERT( base_price <= BOXOFFICE_MAX_SHARE_SUPPLY, "Base price is too large",
              ("base_price",base_price)("max",BOXOFFICE_MAX_SHARE_SUPPLY) );
}

} } // boxoffice::protocol
