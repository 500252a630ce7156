// see LICENSE.txt

#pragma once

#include <cipherbook/protocol/address.hpp>
#include <cipherbook/protocol/types.hpp>

namespace cipherbook { namespace protocol {

   /**
    * @defgroup events Audit events
    *
    * Append-only, externally observable records of every successful state transition. Events carry
    * handles only, never plaintext.
    * @{
    */

   struct contribution_accepted_event
   {
      identity_type     identity;
      /// exposed for audit only, no decrypt rights are granted on it
      ciphertext_handle contribution_handle;
      ciphertext_handle new_total_handle;
   };

   struct total_made_public_event
   {
      identity_type     identity;
      ciphertext_handle handle;
   };

   struct total_shared_event
   {
      identity_type     owner;
      identity_type     viewer;
      ciphertext_handle handle;
   };

   typedef fc::static_variant<
            contribution_accepted_event,  // 0
            total_made_public_event,
            total_shared_event
         > audit_event;

   /// @}

   /// Collects every identity named by the event
   void event_get_impacted_identities( const audit_event& e, flat_set<identity_type>& result );

} } // cipherbook::protocol

FC_REFLECT( cipherbook::protocol::contribution_accepted_event,
            (identity)(contribution_handle)(new_total_handle) )
FC_REFLECT( cipherbook::protocol::total_made_public_event,
            (identity)(handle) )
FC_REFLECT( cipherbook::protocol::total_shared_event,
            (owner)(viewer)(handle) )
