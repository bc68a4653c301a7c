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

#include <memory>
#include <vector>
#include <cstdint>
#include <string>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/seq/transform.hpp>
#include <boost/preprocessor/seq/enum.hpp>
#include <boost/preprocessor/tuple/elem.hpp>
#include <boost/preprocessor/cat.hpp>

#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/string.hpp>
#include <fc/static_variant.hpp>

#include <boxoffice/db/object_id.hpp>
#include <boxoffice/protocol/config.hpp>

#define BOXOFFICE_NAME_TO_OBJECT_TYPE(x, prefix, name) BOOST_PP_CAT(prefix, BOOST_PP_CAT(name, _object_type))
#define BOXOFFICE_NAME_TO_ID_TYPE(x, y, name) BOOST_PP_CAT(name, _id_type)
#define BOXOFFICE_DECLARE_ID(x, space_prefix_seq, name) \
    using BOOST_PP_CAT(name, _id_type) = object_id<BOOST_PP_TUPLE_ELEM(2, 0, space_prefix_seq), \
                            BOXOFFICE_NAME_TO_OBJECT_TYPE(x, BOOST_PP_TUPLE_ELEM(2, 1, space_prefix_seq), name)>;
#define BOXOFFICE_REFLECT_ID(x, id_namespace, name) FC_REFLECT_TYPENAME(boxoffice::id_namespace::name)

#define BOXOFFICE_DEFINE_IDS(id_namespace, object_space, object_type_prefix, names_seq) \
   namespace boxoffice { namespace id_namespace { \
   \
   enum BOOST_PP_CAT(object_type_prefix, object_type) { \
      BOOST_PP_SEQ_ENUM(BOOST_PP_SEQ_TRANSFORM(BOXOFFICE_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   }; \
   \
   BOOST_PP_SEQ_FOR_EACH(BOXOFFICE_DECLARE_ID, (object_space, object_type_prefix), names_seq) \
   \
   } } \
   \
   FC_REFLECT_ENUM(boxoffice::id_namespace::BOOST_PP_CAT(object_type_prefix, object_type), \
                   BOOST_PP_SEQ_TRANSFORM(BOXOFFICE_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   BOOST_PP_SEQ_FOR_EACH(BOXOFFICE_REFLECT_ID, id_namespace, BOOST_PP_SEQ_TRANSFORM(BOXOFFICE_NAME_TO_ID_TYPE, , names_seq))

namespace boxoffice { namespace protocol {
using namespace boxoffice::db;

using std::vector;
using std::string;
using std::shared_ptr;
using std::unique_ptr;

using fc::variant;
using fc::variant_object;
using fc::optional;
using fc::safe;

enum reserved_spaces {
    relative_protocol_ids = 0,
    protocol_ids          = 1,
    implementation_ids    = 2
};

/// Accounts live outside the ledger, they are referred to by name
using account_name_type = string;

/// Amounts of the settlement currency, overflow raises instead of wrapping
using share_type = safe<int64_t>;

/// Logical clock value supplied with every operation
using height_type = uint32_t;

} }  // boxoffice::protocol

BOXOFFICE_DEFINE_IDS(protocol, protocol_ids, /*protocol objects are not prefixed*/,
                     /* 1.0.x */ (null)
                     /* 1.1.x */ (event)
                     /* 1.2.x */ (ticket)
                    )
