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
#include <boxoffice/chain/pricing.hpp>

#include <boxoffice/chain/event_object.hpp>
#include <boxoffice/chain/exceptions.hpp>

#include <fc/uint128.hpp>

#include <limits>

namespace boxoffice { namespace chain {

using fc::uint128_t;

namespace {

   /// a * numerator / denominator without intermediate overflow
   share_type scale( share_type a, uint64_t numerator, uint64_t denominator )
   {
      FC_ASSERT( a >= 0, "Amount must not be negative", ("amount",a) );
      uint128_t result = ( uint128_t( a.value ) * numerator ) / denominator;
      FC_ASSERT( result <= uint128_t( std::numeric_limits<int64_t>::max() ), "Amount overflow" );
      return share_type( static_cast<int64_t>( result ) );
   }

}

share_type ticket_price( const event_object& e )
{ try {
   BOXOFFICE_ASSERT( e.total_supply > 0, corrupted_event_exception,
                     "Event ${id} has no ticket supply", ("id",e.id) );
   BOXOFFICE_ASSERT( e.available_supply <= e.total_supply, corrupted_event_exception,
                     "Event ${id} has more tickets available than it has supply",
                     ("id",e.id)("available",e.available_supply)("total",e.total_supply) );

   const uint64_t demand_multiplier = uint64_t( e.sold() ) * BOXOFFICE_100_PERCENT / e.total_supply;
   const share_type uplift = scale( e.base_price, demand_multiplier, BOXOFFICE_DEMAND_UPLIFT_DIVISOR );
   return e.base_price + uplift;
} FC_CAPTURE_AND_RETHROW( (e.id) ) }

share_type platform_fee( share_type amount )
{
   return scale( amount, BOXOFFICE_PLATFORM_FEE_PERCENT, BOXOFFICE_100_PERCENT );
}

uint16_t group_discount_percent( uint32_t quantity, bool apply_group_discount )
{
   if( !apply_group_discount )
      return 0;
   if( quantity >= BOXOFFICE_LARGE_GROUP_SIZE )
      return BOXOFFICE_LARGE_GROUP_DISCOUNT_PERCENT;
   if( quantity >= BOXOFFICE_SMALL_GROUP_SIZE )
      return BOXOFFICE_SMALL_GROUP_DISCOUNT_PERCENT;
   return 0;
}

price_quote quote_ticket( const event_object& e )
{
   price_quote quote;
   quote.unit_price = ticket_price( e );
   quote.fee = platform_fee( quote.unit_price );
   quote.total = quote.unit_price + quote.fee;
   return quote;
}

batch_quote quote_batch( const event_object& e, uint32_t quantity, bool apply_group_discount )
{
   batch_quote quote;
   quote.unit_price = ticket_price( e );
   quote.quantity = quantity;
   quote.discount_percent = group_discount_percent( quantity, apply_group_discount );
   quote.discounted_unit_price = quote.unit_price
                               - scale( quote.unit_price, quote.discount_percent, BOXOFFICE_100_PERCENT );
   quote.subtotal = quote.discounted_unit_price * share_type( int64_t( quantity ) );
   quote.fee = platform_fee( quote.subtotal );
   quote.total = quote.subtotal + quote.fee;
   return quote;
}

bool is_purchasable( const event_object& e, height_type now )
{
   return e.active && e.event_height > now && e.available_supply > 0;
}

} } // boxoffice::chain
