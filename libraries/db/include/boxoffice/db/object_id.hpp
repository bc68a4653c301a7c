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
#include <fc/exception/exception.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/string.hpp>
#include <fc/variant.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace boxoffice { namespace db {

   constexpr uint8_t  object_instance_bits = 48;
   constexpr uint64_t object_max_instance  = ( uint64_t(1) << object_instance_bits ) - 1;

   /**
    * Identifies a stored object as `space.type.instance`: space and type each take one byte,
    * the instance the remaining 48 bits.
    */
   struct object_id_type
   {
      static constexpr uint64_t max_instance = object_max_instance;

      object_id_type() = default;
      object_id_type( uint8_t space, uint8_t type, uint64_t instance )
      {
         FC_ASSERT( instance <= max_instance, "instance overflow", ("instance",instance) );
         number = ( uint64_t(space) << 56 ) | ( uint64_t(type) << object_instance_bits ) | instance;
      }

      uint8_t  space()const    { return uint8_t( number >> 56 ); }
      uint8_t  type()const     { return uint8_t( number >> object_instance_bits ); }
      uint64_t instance()const { return number & max_instance; }

      friend bool operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool operator <  ( const object_id_type& a, const object_id_type& b ) { return a.number < b.number; }

      explicit operator std::string()const
      {
         return fc::to_string( uint64_t( space() ) ) + "." + fc::to_string( uint64_t( type() ) )
              + "." + fc::to_string( instance() );
      }

      uint64_t number = 0;
   };

   class object;

   /// The object class stored under a typed id, specialized by MAP_OBJECT_ID_TO_TYPE
   template<typename ObjectID>
   struct object_downcast { using type = object; };

   template<typename ObjectID>
   using object_downcast_t = typename object_downcast<ObjectID>::type;

#define MAP_OBJECT_ID_TO_TYPE(OBJECT) \
   namespace boxoffice { namespace db { \
   template<> \
   struct object_downcast< boxoffice::db::object_id<OBJECT::space_id, OBJECT::type_id> > { using type = OBJECT; }; \
   } }

   /**
    * An id that can only name objects of one space and type, e.g. event_id_type.
    */
   template<uint8_t SpaceID, uint8_t TypeID>
   struct object_id
   {
      static constexpr uint8_t space_id = SpaceID;
      static constexpr uint8_t type_id  = TypeID;

      object_id() = default;
      explicit object_id( uint64_t i ):instance(i)
      {
         FC_ASSERT( instance <= object_max_instance, "instance overflow", ("instance",instance) );
      }
      explicit object_id( const object_id_type& id ):instance( id.instance() )
      {
         FC_ASSERT( id.space() == SpaceID && id.type() == TypeID, "space or type mismatch",
                    ("id",std::string(id))("expected",std::string(*this)) );
      }

      explicit operator object_id_type()const { return object_id_type( SpaceID, TypeID, instance ); }

      /// The id @p delta instances further on, used to address consecutively minted objects
      friend object_id operator+( const object_id& a, uint64_t delta ) { return object_id( a.instance + delta ); }

      friend bool operator == ( const object_id& a, const object_id& b ) { return a.instance == b.instance; }
      friend bool operator != ( const object_id& a, const object_id& b ) { return a.instance != b.instance; }
      friend bool operator <  ( const object_id& a, const object_id& b ) { return a.instance < b.instance; }
      friend bool operator == ( const object_id& a, const object_id_type& b ) { return object_id_type(a) == b; }
      friend bool operator == ( const object_id_type& a, const object_id& b ) { return a == object_id_type(b); }

      explicit operator std::string()const
      {
         return fc::to_string( uint64_t( SpaceID ) ) + "." + fc::to_string( uint64_t( TypeID ) ) + "." + fc::to_string( instance );
      }

      uint64_t instance = 0;
   };

   namespace detail {
      /// Parses the "s.t.i" text form of an id
      inline object_id_type parse_object_id( const std::string& s )
      {
         const auto first_dot = s.find( '.' );
         const auto second_dot = first_dot == std::string::npos ? first_dot : s.find( '.', first_dot + 1 );
         FC_ASSERT( first_dot != std::string::npos && second_dot != std::string::npos
                    && first_dot > 0 && second_dot > first_dot + 1 && second_dot + 1 < s.size(),
                    "Object ids are written as space.type.instance", ("id",s) );
         const uint64_t space = fc::to_uint64( s.substr( 0, first_dot ) );
         const uint64_t type  = fc::to_uint64( s.substr( first_dot + 1, second_dot - first_dot - 1 ) );
         FC_ASSERT( space <= 0xff && type <= 0xff, "space or type overflow", ("id",s) );
         return object_id_type( uint8_t(space), uint8_t(type), fc::to_uint64( s.substr( second_dot + 1 ) ) );
      }
   }

} } // boxoffice::db

FC_REFLECT( boxoffice::db::object_id_type, (number) )

namespace fc {

   template<uint8_t SpaceID, uint8_t TypeID>
   struct get_typename<boxoffice::db::object_id<SpaceID,TypeID>>
   {
      static const char* name()
      {
         static const std::string n = "boxoffice::db::object_id<" + fc::to_string( uint64_t( SpaceID ) ) + ":"
                                      + fc::to_string( uint64_t( TypeID ) ) + ">";
         return n.c_str();
      }
   };

   inline void to_variant( const boxoffice::db::object_id_type& id, fc::variant& v, uint32_t max_depth = 1 )
   {
      v = std::string( id );
   }

   inline void from_variant( const fc::variant& v, boxoffice::db::object_id_type& id, uint32_t max_depth = 1 )
   { try {
      id = boxoffice::db::detail::parse_object_id( v.get_string() );
   } FC_CAPTURE_AND_RETHROW( (v) ) }

   template<uint8_t SpaceID, uint8_t TypeID>
   void to_variant( const boxoffice::db::object_id<SpaceID,TypeID>& id, fc::variant& v, uint32_t max_depth = 1 )
   {
      v = std::string( id );
   }

   template<uint8_t SpaceID, uint8_t TypeID>
   void from_variant( const fc::variant& v, boxoffice::db::object_id<SpaceID,TypeID>& id, uint32_t max_depth = 1 )
   { try {
      id = boxoffice::db::object_id<SpaceID,TypeID>( boxoffice::db::detail::parse_object_id( v.get_string() ) );
   } FC_CAPTURE_AND_RETHROW( (v) ) }

} // namespace fc

namespace std {
   template <> struct hash<boxoffice::db::object_id_type>
   {
      size_t operator()( const boxoffice::db::object_id_type& id )const
      {
         return std::hash<uint64_t>()( id.number );
      }
   };
}
