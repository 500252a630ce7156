// see LICENSE.txt

#pragma once

#include <cipherbook/chain/types.hpp>

namespace cipherbook { namespace chain {

   struct accumulator_parameters
   {
      /// address the accumulator itself acts as when it holds processing authority
      identity_type  system_identity;
      /// binds input proofs to this accumulator instance
      domain_id_type domain;
      uint32_t       max_ciphertext_size = CIPHERBOOK_DEFAULT_MAX_CIPHERTEXT_SIZE;
      uint32_t       max_proof_size      = CIPHERBOOK_DEFAULT_MAX_PROOF_SIZE;

      void validate()const;
   };

} } // cipherbook::chain

FC_REFLECT( cipherbook::chain::accumulator_parameters,
            (system_identity)
            (domain)
            (max_ciphertext_size)
            (max_proof_size) )
