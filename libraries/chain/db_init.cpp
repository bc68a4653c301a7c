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

#include <boxoffice/chain/event_evaluator.hpp>
#include <boxoffice/chain/ticket_evaluator.hpp>

#include <boxoffice/chain/event_object.hpp>
#include <boxoffice/chain/ticket_object.hpp>
#include <boxoffice/chain/ledger_property_object.hpp>

namespace boxoffice { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<event_create_evaluator>();
   register_evaluator<ticket_purchase_evaluator>();
   register_evaluator<ticket_batch_purchase_evaluator>();
   register_evaluator<ticket_transfer_evaluator>();
}

void database::initialize_indexes()
{
   //Protocol object indexes
   add_index< event_index >();
   add_index< ticket_index >();

   //Implementation object indexes
   add_index< ledger_property_index >();
}

void database::init_ledger_properties()
{
   const object_id_type props_id( ledger_property_object::space_id, ledger_property_object::type_id, 0 );
   _p_ledger_prop_obj = &create<ledger_property_object>( props_id, [this]( ledger_property_object& p ) {
      p.next_event_id          = 1;
      p.next_ticket_id         = 1;
      p.total_platform_revenue = 0;
      p.treasury               = _config.treasury;
      p.head_height            = _config.initial_height;
   });
}

} }
