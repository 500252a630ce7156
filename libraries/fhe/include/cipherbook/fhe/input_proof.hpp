// see LICENSE.txt

#pragma once

#include <cipherbook/protocol/address.hpp>
#include <cipherbook/protocol/types.hpp>

#include <fc/crypto/elliptic.hpp>

namespace cipherbook { namespace fhe {

   using namespace cipherbook::protocol;

   /**
    * Input proofs are compact secp256k1 signatures made by the input verifier over
    * sha256( CIPHERBOOK_INPUT_DIGEST_TAG | domain | submitter | ciphertext ).
    */
   fc::sha256 input_digest( const domain_id_type& domain,
                            const identity_type& submitter,
                            const external_ciphertext& ct );

   input_proof sign_input( const fc::ecc::private_key& verifier,
                           const domain_id_type& domain,
                           const identity_type& submitter,
                           const external_ciphertext& ct );

   /**
    * @throws protocol::invalid_proof_exception if the proof is malformed or was not made by
    *         @p verifier for exactly this submitter and ciphertext
    */
   void verify_input( const fc::ecc::public_key& verifier,
                      const domain_id_type& domain,
                      const identity_type& submitter,
                      const external_ciphertext& ct,
                      const input_proof& proof );

} } // cipherbook::fhe
