// see LICENSE.txt

#include <cipherbook/chain/accumulator_parameters.hpp>

#include <fc/exception/exception.hpp>

namespace cipherbook { namespace chain {

   void accumulator_parameters::validate()const
   {
      FC_ASSERT( !system_identity.is_null(), "System identity is required" );
      FC_ASSERT( domain != domain_id_type(), "Proof domain is required" );
      FC_ASSERT( max_ciphertext_size > 0 );
      FC_ASSERT( max_proof_size > 0 );
   }

} } // cipherbook::chain
