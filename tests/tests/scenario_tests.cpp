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

#include <boxoffice/chain/database.hpp>
#include <boxoffice/chain/event_object.hpp>
#include <boxoffice/chain/exceptions.hpp>
#include <boxoffice/chain/ticket_object.hpp>

#include "../common/database_fixture.hpp"

using namespace boxoffice::chain;

BOOST_FIXTURE_TEST_SUITE( scenario_tests, database_fixture )

BOOST_AUTO_TEST_CASE( box_office_day )
{ try {
   fund( "bob", 20000 );
   fund( "carol", 20000 );

   const event_id_type concert = create_event( "alice", 100, 1000 ).get_id();
   const event_id_type play = create_event( "dan", 10, 100, 400 ).get_id();

   // quotes are pure reads
   const price_quote before = db.get_price_quote( concert );
   BOOST_CHECK_EQUAL( db.get_price_quote( concert ).unit_price.value, before.unit_price.value );
   BOOST_CHECK_EQUAL( before.unit_price.value, 1000 );

   const ticket_object& first = purchase_ticket( "bob", concert, "Front row" );
   BOOST_CHECK_EQUAL( first.price_paid.value, 1000 );
   BOOST_CHECK_EQUAL( db.get_event( concert ).available_supply, 99u );

   set_height( 150 );
   const batch_purchase_result group = batch_purchase( "carol", concert, 10, true );
   BOOST_CHECK( group.first_ticket == ticket_id_type( 2 ) );
   BOOST_CHECK_EQUAL( group.discount_percent, 15 );
   // one ticket sold before the batch: 1005 less a truncated 15%
   BOOST_CHECK_EQUAL( db.get_ticket( group.first_ticket ).price_paid.value, 855 );
   BOOST_CHECK_EQUAL( group.total_paid.value, 8550 + 427 );
   BOOST_CHECK_EQUAL( db.get_event( concert ).available_supply, 89u );
   BOOST_CHECK_EQUAL( db.get_ticket( group.first_ticket ).purchase_height, 150u );

   const ticket_object& matinee = purchase_ticket( "bob", play );
   BOOST_CHECK( matinee.id == ticket_id_type( 12 ) );

   transfer_ticket( "carol", group.first_ticket + 3, "bob" );
   BOOST_CHECK_EQUAL( db.get_tickets_by_owner( "bob" ).size(), 3u );
   BOOST_CHECK_EQUAL( db.get_tickets_by_owner( "carol" ).size(), 9u );

   set_height( 400 );
   ticket_purchase_operation late;
   late.buyer = "carol";
   late.event = play;
   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( late ), event_not_active_exception );

   // bob spent 1050 + 105, carol 8977, all of it went to the treasury
   BOOST_CHECK_EQUAL( balance( "bob" ).value, 20000 - 1050 - 105 );
   BOOST_CHECK_EQUAL( balance( "carol" ).value, 20000 - 8977 );
   BOOST_CHECK_EQUAL( balance( BOXOFFICE_TESTING_TREASURY ).value, 1050 + 8977 + 105 );
   BOOST_CHECK_EQUAL( db.get_platform_revenue().value, 50 + 427 + 5 );
   BOOST_CHECK_EQUAL( db.get_ledger_properties().next_event_id, 3u );
   BOOST_CHECK_EQUAL( db.get_ledger_properties().next_ticket_id, 13u );
   BOOST_CHECK_EQUAL( db.head_height(), 150u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_operations_leave_no_trace )
{ try {
   const event_id_type event = create_event( "alice", 3, 100 ).get_id();
   fund( "bob", 1000 );
   purchase_ticket( "bob", event );

   ticket_batch_purchase_operation too_many = make_batch_op( "bob", event, 3, false );
   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( too_many ), sold_out_exception );

   ticket_purchase_operation poor;
   poor.buyer = "carol";
   poor.event = event;
   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( poor ), insufficient_payment_exception );

   ticket_transfer_operation steal;
   steal.from = "carol";
   steal.ticket = ticket_id_type( 1 );
   steal.new_owner = "carol";
   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( steal ), not_ticket_owner_exception );

   BOOST_CHECK_EQUAL( db.get_ledger_properties().next_ticket_id, 2u );
   BOOST_CHECK_EQUAL( db.get_event( event ).available_supply, 2u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
