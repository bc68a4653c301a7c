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
#include <boxoffice/chain/payment_gateway.hpp>

#include <fc/log/logger.hpp>

#include <limits>

namespace boxoffice { namespace chain {

void simple_payment_gateway::fund( const account_name_type& account, share_type amount )
{
   FC_ASSERT( amount >= 0, "Can not fund a negative amount", ("account",account)("amount",amount) );
   _balances[account] += amount;
}

share_type simple_payment_gateway::get_balance( const account_name_type& account )const
{
   auto itr = _balances.find( account );
   if( itr == _balances.end() )
      return share_type();
   return itr->second;
}

bool simple_payment_gateway::transfer( share_type amount, const account_name_type& from, const account_name_type& to )
{
   if( amount < 0 || get_balance( from ) < amount )
   {
      dlog( "Refusing transfer of ${a} from ${f} to ${t}", ("a",amount)("f",from)("t",to) );
      return false;
   }
   if( from == to )
      return true;
   // both balances are computed before either is written
   const share_type to_balance = get_balance( to );
   if( to_balance.value > std::numeric_limits<int64_t>::max() - amount.value )
   {
      dlog( "Refusing transfer of ${a} from ${f} to ${t}, the receiving balance would overflow",
            ("a",amount)("f",from)("t",to)("balance",to_balance) );
      return false;
   }
   _balances[from] -= amount;
   _balances[to] = to_balance + amount;
   return true;
}

} } // boxoffice::chain
