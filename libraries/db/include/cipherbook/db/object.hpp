// see LICENSE.txt

#pragma once

#include <fc/reflect/reflect.hpp>

#include <cstdint>

namespace cipherbook { namespace db {

   typedef uint64_t object_id_type;

   struct by_id;

   /**
    *  @brief base for all database objects
    *
    *  Objects are stored by value in a generic_index. The id is assigned by the index at creation
    *  time, is unique within that index and never reused while the object exists.
    */
   class object
   {
      public:
         object_id_type id = 0;
   };

   /**
    * Maps an object type to the index that stores it. Specialized with
    * CIPHERBOOK_MAP_OBJECT_TO_INDEX next to every object definition.
    */
   template<typename ObjectType>
   struct object_index;

} } // cipherbook::db

#define CIPHERBOOK_MAP_OBJECT_TO_INDEX( OBJECT, INDEX )                 \
   namespace cipherbook { namespace db {                                \
      template<> struct object_index< OBJECT > { typedef INDEX type; }; \
   } }

FC_REFLECT( cipherbook::db::object, (id) )
