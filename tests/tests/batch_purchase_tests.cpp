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

BOOST_FIXTURE_TEST_SUITE( batch_purchase_tests, database_fixture )

BOOST_AUTO_TEST_CASE( batch_of_ten_with_discount )
{ try {
   const event_id_type event = create_event( "alice", 100, 1000 ).get_id();
   fund( "bob", 10000 );

   const batch_purchase_result result = batch_purchase( "bob", event, 10, true );

   BOOST_CHECK( result.first_ticket == ticket_id_type( 1 ) );
   BOOST_CHECK_EQUAL( result.quantity, 10u );
   BOOST_CHECK_EQUAL( result.discount_percent, 15 );
   BOOST_CHECK_EQUAL( result.total_paid.value, 8925 );

   BOOST_CHECK_EQUAL( db.get_event( event ).available_supply, 90u );
   BOOST_CHECK_EQUAL( db.get_platform_revenue().value, 425 );
   BOOST_CHECK_EQUAL( balance( "bob" ).value, 10000 - 8925 );
   BOOST_CHECK_EQUAL( balance( BOXOFFICE_TESTING_TREASURY ).value, 8925 );
   BOOST_CHECK_EQUAL( db.get_ledger_properties().next_ticket_id, 11u );

   const auto tickets = db.get_tickets_by_event( event );
   BOOST_REQUIRE_EQUAL( tickets.size(), 10u );
   for( uint32_t i = 0; i < 10; ++i )
   {
      BOOST_CHECK( tickets[i].id == ticket_id_type( i + 1 ) );
      BOOST_CHECK_EQUAL( tickets[i].owner, "bob" );
      BOOST_CHECK_EQUAL( tickets[i].price_paid.value, 850 );
      BOOST_CHECK_EQUAL( tickets[i].purchase_height, BOXOFFICE_TESTING_INITIAL_HEIGHT );
      BOOST_CHECK_EQUAL( tickets[i].seat_info, "Row A Seat " + fc::to_string( uint64_t( i + 1 ) ) );
      BOOST_CHECK( tickets[i].transferable );
      BOOST_CHECK( !tickets[i].used );
   }
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( batch_ids_follow_single_purchases )
{ try {
   const event_id_type event = create_event( "alice", 100, 1000 ).get_id();
   fund( "bob", 100000 );

   purchase_ticket( "bob", event );
   purchase_ticket( "bob", event );
   const batch_purchase_result result = batch_purchase( "bob", event, 3, true );

   BOOST_CHECK_EQUAL( std::string( result.first_ticket ), "1.2.3" );
   BOOST_CHECK_EQUAL( result.discount_percent, 0 );
   BOOST_CHECK_EQUAL( result.total_paid.value, 3181 );
   BOOST_CHECK_EQUAL( db.get_ledger_properties().next_ticket_id, 6u );
   BOOST_CHECK_EQUAL( db.get_platform_revenue().value, 50 + 50 + 151 );

   // every ticket of the batch is priced at the demand before the batch
   for( uint64_t i = 3; i <= 5; ++i )
      BOOST_CHECK_EQUAL( db.get_ticket( ticket_id_type( i ) ).price_paid.value, 1010 );

   const ticket_object& next = purchase_ticket( "bob", event );
   BOOST_CHECK( next.id == ticket_id_type( 6 ) );
   BOOST_CHECK_EQUAL( next.price_paid.value, 1025 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( batch_without_discount_flag )
{ try {
   const event_id_type event = create_event( "alice", 100, 1000 ).get_id();
   fund( "bob", 100000 );

   const batch_purchase_result result = batch_purchase( "bob", event, 10, false );
   BOOST_CHECK_EQUAL( result.discount_percent, 0 );
   BOOST_CHECK_EQUAL( result.total_paid.value, 10500 );
   BOOST_CHECK_EQUAL( db.get_ticket( result.first_ticket ).price_paid.value, 1000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( batch_of_five )
{ try {
   const event_id_type event = create_event( "alice", 100, 1000 ).get_id();
   fund( "bob", 4725 );

   const batch_purchase_result result = batch_purchase( "bob", event, 5, true );
   BOOST_CHECK_EQUAL( result.discount_percent, 10 );
   BOOST_CHECK_EQUAL( result.total_paid.value, 4725 );
   BOOST_CHECK_EQUAL( balance( "bob" ).value, 0 );
   BOOST_CHECK_EQUAL( db.get_platform_revenue().value, 225 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( batch_validation )
{ try {
   const event_id_type event = create_event( "alice", 100, 1000 ).get_id();
   fund( "bob", 100000 );

   ticket_batch_purchase_operation op = make_batch_op( "bob", event, 3, true );
   op.validate();
   REQUIRE_OP_VALIDATION_FAILURE( op, buyer, "" );
   REQUIRE_OP_VALIDATION_FAILURE( op, quantity, 2u );
   REQUIRE_OP_VALIDATION_FAILURE( op, seat_infos, vector<string>() );

   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( make_batch_op( "bob", event, 0, true ) ),
                               invalid_parameters_exception );
   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( make_batch_op( "bob", event, 11, true ) ),
                               invalid_parameters_exception );

   op = make_batch_op( "bob", event, 4, true );
   op.seat_infos.pop_back();
   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( op ), invalid_parameters_exception );

   op = make_batch_op( "bob", event, 2, true );
   op.seat_infos[1] = std::string( BOXOFFICE_MAX_SEAT_INFO_LENGTH + 1, 's' );
   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( op ), invalid_parameters_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( batch_larger_than_availability )
{ try {
   const event_id_type event = create_event( "alice", 4, 100 ).get_id();
   fund( "bob", 100000 );

   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( make_batch_op( "bob", event, 5, true ) ),
                               sold_out_exception );

   batch_purchase( "bob", event, 4, false );
   BOOST_CHECK_EQUAL( db.get_event( event ).available_supply, 0u );

   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( make_batch_op( "bob", event, 1, false ) ),
                               sold_out_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( batch_rejections )
{ try {
   const event_id_type event = create_event( "alice", 100, 1000, 300 ).get_id();

   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( make_batch_op( "bob", event_id_type( 9 ), 5, true ) ),
                               object_not_found_exception );

   fund( "bob", 4724 );
   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( make_batch_op( "bob", event, 5, true ) ),
                               insufficient_payment_exception );

   fund( "bob", 100000 );
   set_height( 300 );
   REQUIRE_REJECTED_UNCHANGED( db.apply_operation( make_batch_op( "bob", event, 5, true ) ),
                               event_not_active_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
