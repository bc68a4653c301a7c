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

#include <fc/io/json.hpp>
#include <fc/variant_object.hpp>

#include <boost/test/unit_test.hpp>

#include <boxoffice/protocol/types.hpp>
#include <boxoffice/protocol/operations.hpp>

#include <boxoffice/chain/database.hpp>
#include <boxoffice/chain/event_object.hpp>
#include <boxoffice/chain/exceptions.hpp>
#include <boxoffice/chain/ledger_property_object.hpp>
#include <boxoffice/chain/ticket_object.hpp>

#include <iostream>
#include <memory>

using namespace boxoffice::db;

#define BOXOFFICE_TESTING_TREASURY "treasury"
#define BOXOFFICE_TESTING_INITIAL_HEIGHT 100
#define BOXOFFICE_TESTING_EVENT_HEIGHT 1000

#define BOXOFFICE_REQUIRE_THROW( expr, exc_type )         \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "BOXOFFICE_REQUIRE_THROW begin "       \
         << req_throw_info << std::endl;                  \
   BOOST_REQUIRE_THROW( expr, exc_type );                 \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "BOXOFFICE_REQUIRE_THROW end "         \
         << req_throw_info << std::endl;                  \
}

#define BOXOFFICE_CHECK_THROW( expr, exc_type )           \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "BOXOFFICE_CHECK_THROW begin "         \
         << req_throw_info << std::endl;                  \
   BOOST_CHECK_THROW( expr, exc_type );                   \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "BOXOFFICE_CHECK_THROW end "           \
         << req_throw_info << std::endl;                  \
}

#define REQUIRE_OP_VALIDATION_FAILURE( op, field, value ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   BOXOFFICE_REQUIRE_THROW( op.validate(), fc::exception ); \
   op.field = temp; \
}

/// Requires @p expr to be rejected with @p exc_type and the ledger to be left exactly as it was
#define REQUIRE_REJECTED_UNCHANGED( expr, exc_type ) \
{ \
   const std::string digest_before = ledger_digest(); \
   const std::string balances_before = balances_digest(); \
   BOXOFFICE_REQUIRE_THROW( expr, exc_type ); \
   BOOST_CHECK_EQUAL( ledger_digest(), digest_before ); \
   BOOST_CHECK_EQUAL( balances_digest(), balances_before ); \
}

namespace boxoffice { namespace chain {

struct database_fixture {
   std::shared_ptr<simple_payment_gateway> gateway;
   std::shared_ptr<manual_clock> clock;
   database db;

   database_fixture();
   ~database_fixture();

   static ledger_config default_config();

   void fund( const account_name_type& account, int64_t amount );
   share_type balance( const account_name_type& account )const;
   void set_height( height_type height );

   event_create_operation make_event_op( const account_name_type& creator,
                                         uint32_t total_tickets,
                                         int64_t base_price,
                                         height_type event_height = BOXOFFICE_TESTING_EVENT_HEIGHT )const;

   const event_object& create_event( const account_name_type& creator,
                                     uint32_t total_tickets,
                                     int64_t base_price,
                                     height_type event_height = BOXOFFICE_TESTING_EVENT_HEIGHT );

   const ticket_object& purchase_ticket( const account_name_type& buyer,
                                         event_id_type event,
                                         const string& seat_info = "" );

   ticket_batch_purchase_operation make_batch_op( const account_name_type& buyer,
                                                  event_id_type event,
                                                  uint32_t quantity,
                                                  bool apply_group_discount )const;

   batch_purchase_result batch_purchase( const account_name_type& buyer,
                                         event_id_type event,
                                         uint32_t quantity,
                                         bool apply_group_discount );

   void transfer_ticket( const account_name_type& from, ticket_id_type ticket, const account_name_type& new_owner );

   /// Clears the active flag, which no operation does
   void deactivate_event( event_id_type event );
   void set_ticket_flags( ticket_id_type ticket, bool transferable, bool used );

   /// JSON of every object in the ledger, in id order
   std::string ledger_digest()const;
   /// JSON of every balance held by the payment gateway
   std::string balances_digest()const;
};

} }
