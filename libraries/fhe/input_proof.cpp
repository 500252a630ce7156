// see LICENSE.txt

#include <cipherbook/fhe/input_proof.hpp>
#include <cipherbook/protocol/exceptions.hpp>

#include <cstring>

namespace cipherbook { namespace fhe {

fc::sha256 input_digest( const domain_id_type& domain,
                         const identity_type& submitter,
                         const external_ciphertext& ct )
{
   const std::string tag( CIPHERBOOK_INPUT_DIGEST_TAG );

   fc::sha256::encoder enc;
   enc.write( tag.data(), tag.size() );
   enc.write( domain.data(), domain.data_size() );
   enc.write( submitter.addr.data(), submitter.addr.data_size() );
   enc.write( ct.data(), ct.size() );
   return enc.result();
}

input_proof sign_input( const fc::ecc::private_key& verifier,
                        const domain_id_type& domain,
                        const identity_type& submitter,
                        const external_ciphertext& ct )
{
   const fc::ecc::compact_signature sig = verifier.sign_compact( input_digest( domain, submitter, ct ) );
   return input_proof( sig.begin(), sig.end() );
}

void verify_input( const fc::ecc::public_key& verifier,
                   const domain_id_type& domain,
                   const identity_type& submitter,
                   const external_ciphertext& ct,
                   const input_proof& proof )
{
   fc::ecc::compact_signature sig;
   CIPHERBOOK_ASSERT( proof.size() == sig.size(), invalid_proof_exception,
                      "Input proof must be ${n} bytes, got ${s}", ("n", sig.size())("s", proof.size()) );
   memcpy( sig.data(), proof.data(), sig.size() );

   fc::ecc::public_key signer;
   try
   {
      signer = fc::ecc::public_key( sig, input_digest( domain, submitter, ct ) );
   }
   catch( const fc::exception& e )
   {
      FC_THROW_EXCEPTION( invalid_proof_exception, "Input proof signature could not be recovered: ${e}",
                          ("e", e.to_string()) );
   }

   CIPHERBOOK_ASSERT( signer.serialize() == verifier.serialize(), invalid_proof_exception,
                      "Input proof for ${s} was not issued by the input verifier", ("s", submitter) );
}

} } // cipherbook::fhe
