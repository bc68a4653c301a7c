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

#include "../common/database_fixture.hpp"

#include <limits>

using namespace boxoffice::chain;

BOOST_FIXTURE_TEST_SUITE( event_tests, database_fixture )

BOOST_AUTO_TEST_CASE( create_event )
{ try {
   const event_object& e = create_event( "alice", 100, 1000 );

   BOOST_CHECK( e.id == event_id_type( 1 ) );
   BOOST_CHECK_EQUAL( std::string( e.id ), "1.1.1" );
   BOOST_CHECK_EQUAL( e.creator, "alice" );
   BOOST_CHECK_EQUAL( e.name, "Concert" );
   BOOST_CHECK_EQUAL( e.venue, "Main Hall" );
   BOOST_CHECK_EQUAL( e.event_height, 1000u );
   BOOST_CHECK_EQUAL( e.total_supply, 100u );
   BOOST_CHECK_EQUAL( e.available_supply, 100u );
   BOOST_CHECK_EQUAL( e.base_price.value, 1000 );
   BOOST_CHECK( e.active );

   const ledger_property_object& props = db.get_ledger_properties();
   BOOST_CHECK_EQUAL( props.next_event_id, 2u );
   BOOST_CHECK_EQUAL( props.next_ticket_id, 1u );
   BOOST_CHECK_EQUAL( props.total_platform_revenue.value, 0 );
   BOOST_CHECK_EQUAL( db.head_height(), BOXOFFICE_TESTING_INITIAL_HEIGHT );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( event_ids_are_sequential )
{ try {
   const event_id_type first = create_event( "alice", 10, 100 ).get_id();
   const event_id_type second = create_event( "bob", 20, 200 ).get_id();
   BOOST_CHECK_EQUAL( first.instance, 1u );
   BOOST_CHECK_EQUAL( second.instance, 2u );
   BOOST_CHECK_EQUAL( std::string( second ), "1.1.2" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( event_create_validation )
{ try {
   event_create_operation op = make_event_op( "alice", 100, 1000 );
   op.validate();

   REQUIRE_OP_VALIDATION_FAILURE( op, creator, "" );
   REQUIRE_OP_VALIDATION_FAILURE( op, creator, std::string( BOXOFFICE_MAX_ACCOUNT_NAME_LENGTH + 1, 'a' ) );
   REQUIRE_OP_VALIDATION_FAILURE( op, name, "" );
   REQUIRE_OP_VALIDATION_FAILURE( op, name, std::string( BOXOFFICE_MAX_EVENT_NAME_LENGTH + 1, 'n' ) );
   REQUIRE_OP_VALIDATION_FAILURE( op, description, std::string( BOXOFFICE_MAX_EVENT_DESCRIPTION_LENGTH + 1, 'd' ) );
   REQUIRE_OP_VALIDATION_FAILURE( op, venue, std::string( BOXOFFICE_MAX_VENUE_LENGTH + 1, 'v' ) );
   REQUIRE_OP_VALIDATION_FAILURE( op, event_type, std::string( BOXOFFICE_MAX_EVENT_TYPE_LENGTH + 1, 't' ) );
   REQUIRE_OP_VALIDATION_FAILURE( op, total_tickets, 0u );
   REQUIRE_OP_VALIDATION_FAILURE( op, base_price, 0 );
   REQUIRE_OP_VALIDATION_FAILURE( op, base_price, -1 );
   REQUIRE_OP_VALIDATION_FAILURE( op, base_price, BOXOFFICE_MAX_SHARE_SUPPLY + 1 );
   REQUIRE_OP_VALIDATION_FAILURE( op, base_price, std::numeric_limits<int64_t>::max() );

   // limits are inclusive
   op.name = std::string( BOXOFFICE_MAX_EVENT_NAME_LENGTH, 'n' );
   op.description = "";
   op.validate();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( largest_base_price_can_be_sold )
{ try {
   const int64_t base = BOXOFFICE_MAX_SHARE_SUPPLY;
   const event_id_type event = create_event( "alice", 10, base ).get_id();

   const batch_quote full = db.get_batch_quote( event, 10, false );
   BOOST_CHECK_EQUAL( full.unit_price.value, base );
   BOOST_CHECK_EQUAL( full.subtotal.value, base * 10 );
   BOOST_CHECK_EQUAL( full.fee.value, base / 2 );
   BOOST_CHECK_EQUAL( full.total.value, base * 10 + base / 2 );

   fund( "bob", 3 * base );
   const ticket_object& t = purchase_ticket( "bob", event );
   BOOST_CHECK_EQUAL( t.price_paid.value, base );
   BOOST_CHECK_EQUAL( balance( "bob" ).value, 3 * base - base - base / 20 );
   BOOST_CHECK_EQUAL( db.get_platform_revenue().value, base / 20 );
   BOOST_CHECK_EQUAL( db.get_price_quote( event ).unit_price.value, base + base / 20 );

   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( make_event_op( "alice", 10, base + 1 ) ),
                               invalid_parameters_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( invalid_event_is_rejected_unchanged )
{ try {
   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( make_event_op( "alice", 0, 1000 ) ),
                               invalid_parameters_exception );
   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( make_event_op( "alice", 10, 0 ) ),
                               invalid_parameters_exception );
   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( make_event_op( "", 10, 100 ) ),
                               invalid_parameters_exception );
   BOOST_CHECK_EQUAL( db.get_ledger_properties().next_event_id, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( event_in_the_past_is_rejected )
{ try {
   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( make_event_op( "alice", 10, 100, BOXOFFICE_TESTING_INITIAL_HEIGHT ) ),
                               event_expired_exception );
   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( make_event_op( "alice", 10, 100, 1 ) ),
                               event_expired_exception );

   // one block ahead is enough
   const event_object& e = create_event( "alice", 10, 100, BOXOFFICE_TESTING_INITIAL_HEIGHT + 1 );
   BOOST_CHECK( e.id == event_id_type( 1 ) );

   set_height( 500 );
   BOXOFFICE_REQUIRE_THROW( create_event( "alice", 10, 100, 500 ), event_expired_exception );
   create_event( "alice", 10, 100, 501 );
   BOOST_CHECK_EQUAL( db.head_height(), 500u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( events_by_creator )
{ try {
   create_event( "alice", 10, 100 );
   create_event( "bob", 10, 100 );
   create_event( "alice", 5, 300 );

   const auto alices = db.get_events_by_creator( "alice" );
   BOOST_REQUIRE_EQUAL( alices.size(), 2u );
   BOOST_CHECK( alices[0].id == event_id_type( 1 ) );
   BOOST_CHECK( alices[1].id == event_id_type( 3 ) );
   BOOST_CHECK_EQUAL( db.get_events_by_creator( "bob" ).size(), 1u );
   BOOST_CHECK( db.get_events_by_creator( "carol" ).empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( event_queries )
{ try {
   const event_id_type id = create_event( "alice", 100, 1000 ).get_id();

   const price_quote q = db.get_price_quote( id );
   BOOST_CHECK_EQUAL( q.unit_price.value, 1000 );
   BOOST_CHECK_EQUAL( q.fee.value, 50 );
   BOOST_CHECK_EQUAL( q.total.value, 1050 );

   const batch_quote bq = db.get_batch_quote( id, 10, true );
   BOOST_CHECK_EQUAL( bq.total.value, 8925 );

   BOOST_CHECK( db.find_event( event_id_type( 2 ) ) == nullptr );
   BOXOFFICE_REQUIRE_THROW( db.get_event( event_id_type( 2 ) ), object_not_found_exception );
   BOXOFFICE_REQUIRE_THROW( db.get_price_quote( event_id_type( 2 ) ), object_not_found_exception );
   BOXOFFICE_REQUIRE_THROW( db.get_batch_quote( event_id_type( 2 ), 5, true ), object_not_found_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
