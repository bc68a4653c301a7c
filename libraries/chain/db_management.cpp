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

namespace boxoffice { namespace chain {

database::database( const ledger_config& config,
                    std::shared_ptr<payment_gateway> gateway,
                    std::shared_ptr<clock_source> clock )
:_config(config),_gateway(std::move(gateway)),_clock(std::move(clock))
{ try {
   FC_ASSERT( _gateway, "A payment gateway is required" );
   FC_ASSERT( _clock, "A clock source is required" );
   _config.validate();

   initialize_indexes();
   initialize_evaluators();
   init_ledger_properties();

   ilog( "Opened ledger with treasury ${t} at height ${h}",
         ("t",_config.treasury)("h",_config.initial_height) );
} FC_CAPTURE_AND_RETHROW( (config) ) }

database::~database(){}

} }
