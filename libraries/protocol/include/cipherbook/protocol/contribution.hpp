// see LICENSE.txt

#pragma once

#include <cipherbook/protocol/address.hpp>
#include <cipherbook/protocol/types.hpp>

namespace cipherbook { namespace protocol {

   /**
    * @ingroup operations
    *
    * Folds an encrypted contribution into the running total of @ref caller. The contribution is an
    * externally encoded ciphertext; @ref proof attests that it is well formed and was produced for
    * @ref caller. On success the new total handle is the operation result.
    */
   struct submit_contribution_operation
   {
      identity_type       caller;
      external_ciphertext contribution;
      input_proof         proof;

      identity_type       submitter()const { return caller; }
      void                validate()const;
   };

} } // cipherbook::protocol

FC_REFLECT( cipherbook::protocol::submit_contribution_operation,
            (caller)(contribution)(proof) )
