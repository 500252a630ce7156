// see LICENSE.txt

#pragma once

#include <cipherbook/protocol/address.hpp>
#include <cipherbook/protocol/types.hpp>

namespace cipherbook { namespace protocol {

   /**
    * @ingroup operations
    *
    * Grants @ref viewer decrypt rights on the current total handle of @ref owner. The grant is
    * bound to that handle only: once the owner accumulates again the new total is private to the
    * owner until it is shared again.
    */
   struct share_total_operation
   {
      identity_type owner;
      identity_type viewer;

      identity_type submitter()const { return owner; }
      void          validate()const;
   };

   /**
    * @ingroup operations
    *
    * Makes the current total handle of @ref owner decryptable by anyone. This cannot be undone for
    * that handle; later totals are private again.
    */
   struct make_total_public_operation
   {
      identity_type owner;

      identity_type submitter()const { return owner; }
      void          validate()const;
   };

} } // cipherbook::protocol

FC_REFLECT( cipherbook::protocol::share_total_operation, (owner)(viewer) )
FC_REFLECT( cipherbook::protocol::make_total_public_operation, (owner) )
