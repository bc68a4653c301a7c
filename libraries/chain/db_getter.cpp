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

#include <boxoffice/chain/exceptions.hpp>

namespace boxoffice { namespace chain {

const ledger_property_object& database::get_ledger_properties()const
{
   return *_p_ledger_prop_obj;
}

const ledger_config& database::get_config()const
{
   return _config;
}

payment_gateway& database::get_payment_gateway()const
{
   return *_gateway;
}

height_type database::head_height()const
{
   return get_ledger_properties().head_height;
}

share_type database::get_platform_revenue()const
{
   return get_ledger_properties().total_platform_revenue;
}

const event_object* database::find_event( event_id_type id )const
{
   return find( id );
}

const event_object& database::get_event( event_id_type id )const
{
   const auto* e = find_event( id );
   BOXOFFICE_ASSERT( e != nullptr, object_not_found_exception, "Event ${id} does not exist", ("id",id) );
   return *e;
}

const ticket_object* database::find_ticket( ticket_id_type id )const
{
   return find( id );
}

const ticket_object& database::get_ticket( ticket_id_type id )const
{
   const auto* t = find_ticket( id );
   BOXOFFICE_ASSERT( t != nullptr, object_not_found_exception, "Ticket ${id} does not exist", ("id",id) );
   return *t;
}

vector<event_object> database::get_events_by_creator( const account_name_type& creator )const
{
   vector<event_object> result;
   const auto& idx = get_index_type<event_index>().indices().get<by_creator>();
   auto range = idx.equal_range( boost::make_tuple( creator ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( *itr );
   return result;
}

vector<ticket_object> database::get_tickets_by_owner( const account_name_type& owner )const
{
   vector<ticket_object> result;
   const auto& idx = get_index_type<ticket_index>().indices().get<by_owner>();
   auto range = idx.equal_range( boost::make_tuple( owner ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( *itr );
   return result;
}

vector<ticket_object> database::get_tickets_by_event( event_id_type event )const
{
   vector<ticket_object> result;
   const auto& idx = get_index_type<ticket_index>().indices().get<by_event>();
   auto range = idx.equal_range( boost::make_tuple( event ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( *itr );
   return result;
}

price_quote database::get_price_quote( event_id_type id )const
{
   return quote_ticket( get_event( id ) );
}

batch_quote database::get_batch_quote( event_id_type id, uint32_t quantity, bool apply_group_discount )const
{
   return quote_batch( get_event( id ), quantity, apply_group_discount );
}

} }
