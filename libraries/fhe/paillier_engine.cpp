// see LICENSE.txt

#include <cipherbook/fhe/paillier_engine.hpp>
#include <cipherbook/fhe/exceptions.hpp>
#include <cipherbook/fhe/input_proof.hpp>

#include <fc/log/logger.hpp>

namespace cipherbook { namespace fhe {

paillier_engine::paillier_engine( const options& opts )
   : _options( opts ),
     _key( opts.modulus_bits )
{
   FC_ASSERT( _options.verifier_key.valid(), "Input verifier key is required" );
   ilog( "Paillier engine ready, ${b} bit modulus, ${s} byte ciphertexts",
         ("b", public_key().modulus_bits())("s", public_key().ciphertext_size()) );
}

paillier_engine::~paillier_engine() {}

internal_ciphertext paillier_engine::verify_and_decode( const external_ciphertext& input,
                                                        const input_proof& proof,
                                                        const identity_type& submitter )
{
   CIPHERBOOK_ASSERT( !proof.empty(), invalid_proof_exception,
                      "Empty input proof from ${s}", ("s", submitter) );
   verify_input( _options.verifier_key, _options.domain, submitter, input, proof );
   CIPHERBOOK_ASSERT( public_key().is_valid_ciphertext( input ), invalid_proof_exception,
                      "Input from ${s} is not a valid ciphertext under the engine key", ("s", submitter) );

   internal_ciphertext result;
   result.data = input;
   return result;
}

internal_ciphertext paillier_engine::encrypt_zero()
{
   internal_ciphertext result;
   result.data = public_key().encrypt( 0 );
   return result;
}

internal_ciphertext paillier_engine::add( const internal_ciphertext& a, const internal_ciphertext& b )
{
   CIPHERBOOK_ASSERT( public_key().is_valid_ciphertext( a.data ) && public_key().is_valid_ciphertext( b.data ),
                      malformed_ciphertext_exception, "Cannot add ciphertexts of ${a} and ${b} bytes",
                      ("a", a.data.size())("b", b.data.size()) );
   internal_ciphertext result;
   result.data = public_key().add( a.data, b.data );
   return result;
}

ciphertext_handle paillier_engine::to_external_handle( const internal_ciphertext& ct )
{
   CIPHERBOOK_ASSERT( public_key().is_valid_ciphertext( ct.data ), malformed_ciphertext_exception,
                      "Cannot export a malformed ciphertext of ${s} bytes", ("s", ct.data.size()) );

   const std::string tag( CIPHERBOOK_HANDLE_DIGEST_TAG );
   fc::sha256::encoder enc;
   enc.write( tag.data(), tag.size() );
   enc.write( ct.data.data(), ct.data.size() );
   const ciphertext_handle handle = enc.result();
   FC_ASSERT( !is_null_handle( handle ) );

   std::lock_guard<std::mutex> lock( _mutex );
   _ciphertexts.emplace( handle, ct.data );
   return handle;
}

internal_ciphertext paillier_engine::from_external_handle( const ciphertext_handle& handle )const
{
   std::lock_guard<std::mutex> lock( _mutex );
   const vector<char>& data = lookup( handle );
   CIPHERBOOK_ASSERT( _processing.count( handle ) != 0, processing_denied_exception,
                      "Handle ${h} is not authorized for processing", ("h", handle) );
   internal_ciphertext result;
   result.data = data;
   return result;
}

void paillier_engine::grant_processing_authority( const ciphertext_handle& handle )
{
   std::lock_guard<std::mutex> lock( _mutex );
   lookup( handle );
   _processing.insert( handle );
}

void paillier_engine::grant_decrypt_rights( const ciphertext_handle& handle, const identity_type& who )
{
   std::lock_guard<std::mutex> lock( _mutex );
   lookup( handle );
   _decrypt_rights.emplace( handle, who );
}

void paillier_engine::grant_public_decrypt( const ciphertext_handle& handle )
{
   std::lock_guard<std::mutex> lock( _mutex );
   lookup( handle );
   _public.insert( handle );
}

bool paillier_engine::can_decrypt( const ciphertext_handle& handle, const identity_type& who )const
{
   std::lock_guard<std::mutex> lock( _mutex );
   return is_allowed( handle, who );
}

uint64_t paillier_engine::decrypt( const ciphertext_handle& handle, const identity_type& requester )const
{
   vector<char> data;
   {
      std::lock_guard<std::mutex> lock( _mutex );
      data = lookup( handle );
      CIPHERBOOK_ASSERT( is_allowed( handle, requester ), decryption_denied_exception,
                         "${r} may not decrypt ${h}", ("r", requester)("h", handle) );
   }
   return _key.decrypt( data );
}

bool paillier_engine::is_public( const ciphertext_handle& handle )const
{
   std::lock_guard<std::mutex> lock( _mutex );
   return _public.count( handle ) != 0;
}

bool paillier_engine::has_processing_authority( const ciphertext_handle& handle )const
{
   std::lock_guard<std::mutex> lock( _mutex );
   return _processing.count( handle ) != 0;
}

size_t paillier_engine::handle_count()const
{
   std::lock_guard<std::mutex> lock( _mutex );
   return _ciphertexts.size();
}

const vector<char>& paillier_engine::lookup( const ciphertext_handle& handle )const
{
   auto itr = _ciphertexts.find( handle );
   CIPHERBOOK_ASSERT( itr != _ciphertexts.end(), unknown_handle_exception,
                      "Unknown ciphertext handle ${h}", ("h", handle) );
   return itr->second;
}

bool paillier_engine::is_allowed( const ciphertext_handle& handle, const identity_type& who )const
{
   return _public.count( handle ) != 0
       || _decrypt_rights.count( std::make_pair( handle, who ) ) != 0;
}

} } // cipherbook::fhe
