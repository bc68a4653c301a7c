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

#include <boxoffice/chain/event_object.hpp>
#include <boxoffice/chain/ticket_object.hpp>
#include <boxoffice/chain/ledger_property_object.hpp>
#include <boxoffice/chain/ledger_config.hpp>
#include <boxoffice/chain/operation_outcome.hpp>
#include <boxoffice/chain/payment_gateway.hpp>
#include <boxoffice/chain/clock_source.hpp>
#include <boxoffice/chain/pricing.hpp>
#include <boxoffice/chain/evaluator.hpp>

#include <boxoffice/db/object_database.hpp>
#include <boxoffice/db/object.hpp>
#include <fc/signals.hpp>

#include <fc/log/logger.hpp>

#include <memory>

namespace boxoffice { namespace chain {
   using boxoffice::db::abstract_object;
   using boxoffice::db::object;
   class op_evaluator;
   class operation_evaluation_state;
   class event_create_evaluator;
   class ticket_purchase_evaluator;
   class ticket_batch_purchase_evaluator;
   class ticket_transfer_evaluator;
   struct database_fixture;

   /**
    *   @class database
    *   @brief tracks the ticket ledger state
    *
    *   Every change to the ledger goes through apply_operation, which applies one operation
    *   completely or not at all.  Callers are expected to serialize their calls.  The object
    *   store itself is not reachable from outside, only the evaluators write to it.
    */
   class database : protected db::object_database
   {
      friend class event_create_evaluator;
      friend class ticket_purchase_evaluator;
      friend class ticket_batch_purchase_evaluator;
      friend class ticket_transfer_evaluator;
      friend struct database_fixture;

         //////////////////// db_management.cpp ////////////////////
      public:
         database( const ledger_config& config,
                   std::shared_ptr<payment_gateway> gateway,
                   std::shared_ptr<clock_source> clock );
         ~database() override;

         //////////////////// db_apply.cpp ////////////////////

         /**
          *  Validates and applies @p op at the current height of the clock.  Nothing is changed
          *  if an exception is thrown.
          */
         operation_result apply_operation( const operation& op );

         /**
          *  Same as apply_operation, but reports rejections as an outcome instead of
          *  throwing them.  Only fc::exception is converted.
          */
         operation_outcome push_operation( const operation& op );

         /**
          *  Emitted after an operation has been committed.  Exceptions thrown by a handler are
          *  logged and dropped, the operation stays applied.
          */
         fc::signal<void(const operation&, const operation_result&)> applied_operation;

         //////////////////// db_getter.cpp ////////////////////

         const ledger_property_object&  get_ledger_properties()const;
         const ledger_config&           get_config()const;
         payment_gateway&               get_payment_gateway()const;

         /// Height observed by the last applied operation
         height_type                    head_height()const;
         share_type                     get_platform_revenue()const;

         /// @throws object_not_found_exception
         const event_object&            get_event( event_id_type id )const;
         const event_object*            find_event( event_id_type id )const;
         /// @throws object_not_found_exception
         const ticket_object&           get_ticket( ticket_id_type id )const;
         const ticket_object*           find_ticket( ticket_id_type id )const;

         vector<event_object>           get_events_by_creator( const account_name_type& creator )const;
         vector<ticket_object>          get_tickets_by_owner( const account_name_type& owner )const;
         vector<ticket_object>          get_tickets_by_event( event_id_type event )const;

         price_quote                    get_price_quote( event_id_type id )const;
         batch_quote                    get_batch_quote( event_id_type id, uint32_t quantity,
                                                         bool apply_group_discount )const;

         using db::object_database::get_index_type;
         using db::object_database::inspect_all_objects;
         using db::object_database::get_undo_db;

      private:
         //////////////////// db_allocator.cpp ////////////////////

         /// Takes the next event id from the ledger counters
         event_id_type  allocate_event_id();
         /// Reserves @p count consecutive ticket ids and returns the first one
         ticket_id_type allocate_ticket_ids( uint32_t count );
         void           accrue_platform_fee( share_type fee );

         //////////////////// db_init.cpp ////////////////////

         void initialize_evaluators();
         /// Registers one index per ledger object type
         void initialize_indexes();
         void init_ledger_properties();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            const auto op_type = operation::tag<typename EvaluatorType::operation_type>::value;
            FC_ASSERT( op_type >= 0, "Negative operation type" );
            FC_ASSERT( op_type < _operation_evaluators.size(),
                       "The operation type (${a}) must be smaller than the size of _operation_evaluators (${b})",
                       ("a", op_type)("b", _operation_evaluators.size()) );
            _operation_evaluators[op_type] = std::make_unique<op_evaluator_impl<EvaluatorType>>();
         }

         vector< unique_ptr<op_evaluator> >     _operation_evaluators;

         ledger_config                          _config;
         std::shared_ptr<payment_gateway>       _gateway;
         std::shared_ptr<clock_source>          _clock;

         const ledger_property_object*          _p_ledger_prop_obj = nullptr;
   };

} }
