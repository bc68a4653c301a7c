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

#include <boxoffice/chain/types.hpp>

#include <map>

namespace boxoffice { namespace chain {

   /**
    * @brief settles payments between accounts outside of the ledger
    *
    * The ledger only ever moves money from a buyer to the treasury.  A transfer that
    * reports failure aborts the operation it belongs to.
    */
   class payment_gateway
   {
      public:
         virtual ~payment_gateway(){}

         virtual share_type get_balance( const account_name_type& account )const = 0;

         /// @return false if the payment could not be settled, in which case no funds moved
         virtual bool transfer( share_type amount, const account_name_type& from, const account_name_type& to ) = 0;
   };

   /**
    * In memory balances, used by the node program and by the tests.
    */
   class simple_payment_gateway : public payment_gateway
   {
      public:
         void fund( const account_name_type& account, share_type amount );

         virtual share_type get_balance( const account_name_type& account )const override;
         virtual bool transfer( share_type amount, const account_name_type& from, const account_name_type& to ) override;

         const std::map<account_name_type, share_type>& balances()const { return _balances; }

      private:
         std::map<account_name_type, share_type> _balances;
   };

} } // boxoffice::chain
