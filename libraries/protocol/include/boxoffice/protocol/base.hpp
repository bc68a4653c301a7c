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
#include <boxoffice/protocol/types.hpp>
#include <boxoffice/protocol/exceptions.hpp>

namespace boxoffice { namespace protocol {

   /**
    *  @defgroup operations Ledger Operations
    *  @brief A set of valid operations that mutate the ticket ledger.
    *
    *  Every operation names the account acting on the ledger.  Operations carry no
    *  signatures, callers are expected to be authenticated before the operation reaches
    *  the ledger.
    *
    *  validate() performs every check that does not depend on ledger state; the
    *  evaluators perform the rest.
    *  @{
    */

   struct void_result{};

   struct base_operation
   {
      void validate()const{}
   };

   ///@}

} } // boxoffice::protocol

FC_REFLECT_EMPTY( boxoffice::protocol::void_result )
