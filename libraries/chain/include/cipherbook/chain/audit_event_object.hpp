// see LICENSE.txt

#pragma once

#include <cipherbook/chain/types.hpp>
#include <cipherbook/protocol/events.hpp>

namespace cipherbook { namespace chain {

   /**
    * @class audit_event_object
    * @ingroup object
    *
    * Append-only log entry. The object id doubles as the event sequence number.
    */
   class audit_event_object : public object
   {
      public:
         audit_event    event;
         fc::time_point timestamp;
   };

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      audit_event_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
      >
   > audit_event_multi_index_type;

   typedef generic_index<audit_event_object, audit_event_multi_index_type> audit_event_index;

} } // cipherbook::chain

CIPHERBOOK_MAP_OBJECT_TO_INDEX( cipherbook::chain::audit_event_object, cipherbook::chain::audit_event_index )

FC_REFLECT_DERIVED( cipherbook::chain::audit_event_object, (cipherbook::db::object),
                    (event)
                    (timestamp) )
