// see LICENSE.txt

#include <cipherbook/protocol/events.hpp>

namespace cipherbook { namespace protocol {

struct get_impacted_identity_visitor
{
   flat_set<identity_type>& _impacted;
   get_impacted_identity_visitor( flat_set<identity_type>& impact ):_impacted(impact) {}
   typedef void result_type;

   void operator()( const contribution_accepted_event& e )
   {
      _impacted.insert( e.identity );
   }
   void operator()( const total_made_public_event& e )
   {
      _impacted.insert( e.identity );
   }
   void operator()( const total_shared_event& e )
   {
      _impacted.insert( e.owner );
      _impacted.insert( e.viewer );
   }
};

void event_get_impacted_identities( const audit_event& e, flat_set<identity_type>& result )
{
   get_impacted_identity_visitor vtor( result );
   e.visit( vtor );
}

} } // cipherbook::protocol
