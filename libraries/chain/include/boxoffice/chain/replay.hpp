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

#include <boxoffice/chain/database.hpp>
#include <boxoffice/chain/clock_source.hpp>
#include <boxoffice/chain/operation_outcome.hpp>

#include <fc/variant.hpp>

namespace boxoffice { namespace chain {

   /// One entry of an operation log, the operation still in its JSON form
   struct scheduled_operation
   {
      height_type height = 0;
      fc::variant op;         ///< [ <name or tag>, { ...fields } ]
   };

   /// What happened to one scheduled operation
   struct replay_entry
   {
      height_type       height = 0;
      fc::variant       op;
      operation_outcome outcome;
   };

   /**
    * Parses [ "ticket_purchase", {...} ] as well as the numeric tag form [ 1, {...} ].
    * Throws fc::assert_exception or fc::exception on anything else.
    */
   operation operation_from_variant( const fc::variant& v );

   /**
    * Moves @p clock to the entry's height and pushes the operation into @p db.
    *
    * Never throws for a bad entry.  An operation that does not parse is reported as
    * invalid_parameters and a height below the clock's current one as internal_error,
    * in both cases without touching the ledger or the clock.
    */
   replay_entry replay_operation( database& db, manual_clock& clock, const scheduled_operation& item );

} } // boxoffice::chain

FC_REFLECT( boxoffice::chain::scheduled_operation, (height)(op) )
FC_REFLECT( boxoffice::chain::replay_entry, (height)(op)(outcome) )
