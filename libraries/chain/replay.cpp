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
#include <boxoffice/chain/replay.hpp>

#include <boxoffice/chain/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace boxoffice { namespace chain {

namespace {

   /// Name of an operation as accepted in an operation log, e.g. "ticket_purchase"
   struct operation_name_visitor
   {
      typedef std::string result_type;
      template<typename T>
      std::string operator()( const T& )const
      {
         std::string name = fc::get_typename<T>::name();
         auto pos = name.rfind( "::" );
         if( pos != std::string::npos )
            name = name.substr( pos + 2 );
         const std::string suffix = "_operation";
         if( name.size() > suffix.size() && name.compare( name.size() - suffix.size(), suffix.size(), suffix ) == 0 )
            name.resize( name.size() - suffix.size() );
         return name;
      }
   };

   void reject( replay_entry& entry, ledger_error error, const fc::exception& e )
   {
      entry.outcome.error = error;
      entry.outcome.message = e.to_string();
      wlog( "Rejected scheduled operation ${op} at height ${h}: ${e}",
            ("op",entry.op)("h",entry.height)("e",e.to_detail_string()) );
   }

}

operation operation_from_variant( const fc::variant& v )
{ try {
   FC_ASSERT( v.is_array(), "An operation must be given as [ name, { fields } ]" );
   const auto& ar = v.get_array();
   FC_ASSERT( ar.size() == 2, "An operation must be given as [ name, { fields } ]" );
   if( !ar[0].is_string() )
      return v.as<operation>( BOXOFFICE_MAX_NESTED_OBJECTS );

   const std::string name = ar[0].as_string();
   operation op;
   for( int64_t i = 0; i < operation::count(); ++i )
   {
      op.set_which( i );
      if( op.visit( operation_name_visitor() ) == name )
         return fc::variant( fc::variants{ fc::variant( i ), ar[1] } ).as<operation>( BOXOFFICE_MAX_NESTED_OBJECTS );
   }
   FC_THROW( "Unknown operation ${n}", ("n",name) );
} FC_CAPTURE_AND_RETHROW( (v) ) }

replay_entry replay_operation( database& db, manual_clock& clock, const scheduled_operation& item )
{
   replay_entry entry;
   entry.height = item.height;
   entry.op = item.op;

   operation op;
   try
   {
      op = operation_from_variant( item.op );
   }
   catch( const fc::exception& e )
   {
      reject( entry, invalid_parameters, e );
      return entry;
   }

   try
   {
      clock.set_height( item.height );
   }
   catch( const fc::exception& e )
   {
      reject( entry, internal_error, e );
      return entry;
   }

   entry.outcome = db.push_operation( op );
   return entry;
}

} } // boxoffice::chain
