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

#include <boost/test/unit_test.hpp>

#include <boxoffice/chain/event_object.hpp>
#include <boxoffice/chain/exceptions.hpp>
#include <boxoffice/chain/pricing.hpp>

#include "../common/database_fixture.hpp"

#include <limits>

using namespace boxoffice::chain;

namespace {

   event_object make_event( uint32_t total, uint32_t available, int64_t base_price )
   {
      event_object e;
      e.id = object_id_type( event_id_type( 1 ) );
      e.event_height = 1000;
      e.total_supply = total;
      e.available_supply = available;
      e.base_price = base_price;
      return e;
   }

}

BOOST_AUTO_TEST_SUITE( pricing_tests )

BOOST_AUTO_TEST_CASE( price_grows_with_demand )
{ try {
   BOOST_CHECK_EQUAL( ticket_price( make_event( 100, 100, 1000 ) ).value, 1000 );
   BOOST_CHECK_EQUAL( ticket_price( make_event( 100, 99, 1000 ) ).value, 1005 );
   BOOST_CHECK_EQUAL( ticket_price( make_event( 100, 50, 1000 ) ).value, 1250 );
   BOOST_CHECK_EQUAL( ticket_price( make_event( 100, 0, 1000 ) ).value, 1500 );
   // the uplift is truncated
   BOOST_CHECK_EQUAL( ticket_price( make_event( 100, 0, 1001 ) ).value, 1501 );
   BOOST_CHECK_EQUAL( ticket_price( make_event( 3, 2, 100 ) ).value, 116 );
   BOOST_CHECK_EQUAL( ticket_price( make_event( 1, 1, 1 ) ).value, 1 );
   BOOST_CHECK_EQUAL( ticket_price( make_event( 1, 0, 1 ) ).value, 1 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( price_never_decreases_as_tickets_sell )
{ try {
   const uint32_t total = 37;
   share_type last = 0;
   for( uint32_t available = total; ; --available )
   {
      const share_type price = ticket_price( make_event( total, available, 777 ) );
      BOOST_CHECK( price >= last );
      BOOST_CHECK( price >= 777 );
      BOOST_CHECK( price <= 777 + 777 / 2 );
      last = price;
      if( available == 0 )
         break;
   }
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( price_does_not_overflow )
{ try {
   const int64_t base = std::numeric_limits<int64_t>::max() / 2;
   BOOST_CHECK_EQUAL( ticket_price( make_event( 4, 0, base ) ).value, base + base / 2 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( largest_base_price_fits )
{ try {
   const int64_t base = BOXOFFICE_MAX_SHARE_SUPPLY;
   BOOST_CHECK_EQUAL( ticket_price( make_event( 10, 0, base ) ).value, base + base / 2 );

   const batch_quote q = quote_batch( make_event( 10, 1, base ), BOXOFFICE_MAX_BATCH_SIZE, true );
   BOOST_CHECK_EQUAL( q.unit_price.value, 1450000000000000ll );
   BOOST_CHECK_EQUAL( q.discounted_unit_price.value, 1232500000000000ll );
   BOOST_CHECK_EQUAL( q.subtotal.value, 12325000000000000ll );
   BOOST_CHECK_EQUAL( q.fee.value, 616250000000000ll );
   BOOST_CHECK_EQUAL( q.total.value, 12941250000000000ll );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( corrupted_event_is_rejected )
{ try {
   BOXOFFICE_REQUIRE_THROW( ticket_price( make_event( 0, 0, 1000 ) ), corrupted_event_exception );
   BOXOFFICE_REQUIRE_THROW( ticket_price( make_event( 10, 11, 1000 ) ), corrupted_event_exception );
   BOOST_CHECK( classify_exception( corrupted_event_exception() ) == internal_error );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( platform_fee_truncates )
{ try {
   BOOST_CHECK_EQUAL( platform_fee( 0 ).value, 0 );
   BOOST_CHECK_EQUAL( platform_fee( 19 ).value, 0 );
   BOOST_CHECK_EQUAL( platform_fee( 20 ).value, 1 );
   BOOST_CHECK_EQUAL( platform_fee( 1000 ).value, 50 );
   BOOST_CHECK_EQUAL( platform_fee( 1005 ).value, 50 );
   BOOST_CHECK_EQUAL( platform_fee( 1050 ).value, 52 );
   BOOST_CHECK_EQUAL( platform_fee( 8500 ).value, 425 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( group_discount_tiers )
{ try {
   BOOST_CHECK_EQUAL( group_discount_percent( 1, true ), 0 );
   BOOST_CHECK_EQUAL( group_discount_percent( 4, true ), 0 );
   BOOST_CHECK_EQUAL( group_discount_percent( 5, true ), 10 );
   BOOST_CHECK_EQUAL( group_discount_percent( 9, true ), 10 );
   BOOST_CHECK_EQUAL( group_discount_percent( 10, true ), 15 );
   BOOST_CHECK_EQUAL( group_discount_percent( 10, false ), 0 );
   BOOST_CHECK_EQUAL( group_discount_percent( 5, false ), 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( single_ticket_quote )
{ try {
   const price_quote q = quote_ticket( make_event( 100, 100, 1000 ) );
   BOOST_CHECK_EQUAL( q.unit_price.value, 1000 );
   BOOST_CHECK_EQUAL( q.fee.value, 50 );
   BOOST_CHECK_EQUAL( q.total.value, 1050 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( batch_quotes )
{ try {
   const event_object e = make_event( 100, 100, 1000 );

   batch_quote q = quote_batch( e, 10, true );
   BOOST_CHECK_EQUAL( q.unit_price.value, 1000 );
   BOOST_CHECK_EQUAL( q.discount_percent, 15 );
   BOOST_CHECK_EQUAL( q.discounted_unit_price.value, 850 );
   BOOST_CHECK_EQUAL( q.subtotal.value, 8500 );
   BOOST_CHECK_EQUAL( q.fee.value, 425 );
   BOOST_CHECK_EQUAL( q.total.value, 8925 );

   q = quote_batch( e, 5, true );
   BOOST_CHECK_EQUAL( q.discounted_unit_price.value, 900 );
   BOOST_CHECK_EQUAL( q.subtotal.value, 4500 );
   BOOST_CHECK_EQUAL( q.fee.value, 225 );
   BOOST_CHECK_EQUAL( q.total.value, 4725 );

   q = quote_batch( e, 5, false );
   BOOST_CHECK_EQUAL( q.discount_percent, 0 );
   BOOST_CHECK_EQUAL( q.discounted_unit_price.value, 1000 );
   BOOST_CHECK_EQUAL( q.total.value, 5250 );

   // the whole batch is priced at the demand before the batch
   q = quote_batch( make_event( 100, 98, 1000 ), 3, true );
   BOOST_CHECK_EQUAL( q.unit_price.value, 1010 );
   BOOST_CHECK_EQUAL( q.subtotal.value, 3030 );
   BOOST_CHECK_EQUAL( q.fee.value, 151 );
   BOOST_CHECK_EQUAL( q.total.value, 3181 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( purchasable_events )
{ try {
   event_object e = make_event( 10, 10, 100 );
   BOOST_CHECK( is_purchasable( e, 999 ) );
   BOOST_CHECK( !is_purchasable( e, 1000 ) );
   BOOST_CHECK( !is_purchasable( e, 1001 ) );
   e.available_supply = 0;
   BOOST_CHECK( !is_purchasable( e, 500 ) );
   e.available_supply = 1;
   e.active = false;
   BOOST_CHECK( !is_purchasable( e, 500 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
