// see LICENSE.txt

#include <boost/test/unit_test.hpp>
#include "../common/database_fixture.hpp"

#include <limits>

using namespace cipherbook::fhe;
using namespace cipherbook::chain::test;

BOOST_AUTO_TEST_SUITE( fhe_tests )

BOOST_AUTO_TEST_CASE( paillier_addition )
{
   try {
      paillier_private_key key( TEST_MODULUS_BITS );
      const paillier_public_key& pub = key.get_public_key();

      BOOST_CHECK_EQUAL( pub.modulus_bits(), uint32_t( TEST_MODULUS_BITS ) );

      const auto a = pub.encrypt( 1234 );
      const auto b = pub.encrypt( 4321 );
      BOOST_CHECK_EQUAL( a.size(), pub.ciphertext_size() );
      BOOST_CHECK( pub.is_valid_ciphertext( a ) );

      BOOST_CHECK_EQUAL( key.decrypt( a ), 1234u );
      BOOST_CHECK_EQUAL( key.decrypt( pub.add( a, b ) ), 5555u );
      BOOST_CHECK_EQUAL( key.decrypt( pub.encrypt( 0 ) ), 0u );

      // encryption is randomized
      BOOST_CHECK( pub.encrypt( 1234 ) != a );

      const uint64_t max = std::numeric_limits<uint64_t>::max();
      BOOST_CHECK_EQUAL( key.decrypt( pub.encrypt( max ) ), max );
      BOOST_CHECK_THROW( key.decrypt( pub.add( pub.encrypt( max ), pub.encrypt( 2 ) ) ), plaintext_overflow_exception );
   } catch( fc::exception& e ) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( paillier_rejects_malformed_ciphertexts )
{
   try {
      paillier_private_key key( TEST_MODULUS_BITS );
      const paillier_public_key& pub = key.get_public_key();

      std::vector<char> ct = pub.encrypt( 7 );
      BOOST_CHECK( !pub.is_valid_ciphertext( std::vector<char>() ) );
      BOOST_CHECK( !pub.is_valid_ciphertext( std::vector<char>( ct.begin() + 1, ct.end() ) ) );
      BOOST_CHECK( !pub.is_valid_ciphertext( std::vector<char>( ct.size(), 0 ) ) );
      BOOST_CHECK( !pub.is_valid_ciphertext( std::vector<char>( ct.size(), char(0xff) ) ) );

      BOOST_CHECK_THROW( key.decrypt( std::vector<char>( ct.size(), 0 ) ), malformed_ciphertext_exception );
      BOOST_CHECK_THROW( pub.add( ct, std::vector<char>() ), fc::assert_exception );

      BOOST_CHECK_THROW( paillier_private_key{ 128 }, fc::assert_exception );
   } catch( fc::exception& e ) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( client_key_from_published_modulus )
{
   try {
      paillier_private_key key( TEST_MODULUS_BITS );
      paillier_public_key client( key.get_public_key().modulus() );

      BOOST_CHECK_EQUAL( client.modulus_bits(), key.get_public_key().modulus_bits() );
      BOOST_CHECK_EQUAL( client.ciphertext_size(), key.get_public_key().ciphertext_size() );
      BOOST_CHECK_EQUAL( key.decrypt( client.encrypt( 99 ) ), 99u );

      BOOST_CHECK_THROW( paillier_public_key{ std::vector<char>( 4, 1 ) }, fc::assert_exception );
   } catch( fc::exception& e ) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( input_proof_binding )
{
   try {
      const fc::ecc::private_key verifier = database_fixture::generate_private_key( "verifier" );
      const fc::ecc::private_key other    = database_fixture::generate_private_key( "other" );
      const identity_type alice( database_fixture::generate_private_key( "alice" ).get_public_key() );
      const identity_type bob( database_fixture::generate_private_key( "bob" ).get_public_key() );
      const domain_id_type domain = fc::sha256::hash( std::string( "domain" ) );
      const external_ciphertext ct( 32, 'c' );

      const input_proof proof = sign_input( verifier, domain, alice, ct );
      BOOST_CHECK_EQUAL( proof.size(), 65u );
      verify_input( verifier.get_public_key(), domain, alice, ct, proof );

      BOOST_CHECK_THROW( verify_input( verifier.get_public_key(), domain, bob, ct, proof ), invalid_proof_exception );
      BOOST_CHECK_THROW( verify_input( verifier.get_public_key(), fc::sha256(), alice, ct, proof ), invalid_proof_exception );
      BOOST_CHECK_THROW( verify_input( verifier.get_public_key(), domain, alice, external_ciphertext( 32, 'd' ), proof ),
                         invalid_proof_exception );
      BOOST_CHECK_THROW( verify_input( other.get_public_key(), domain, alice, ct, proof ), invalid_proof_exception );
      BOOST_CHECK_THROW( verify_input( verifier.get_public_key(), domain, alice, ct, input_proof() ), invalid_proof_exception );
      BOOST_CHECK_THROW( verify_input( verifier.get_public_key(), domain, alice, ct, input_proof( 65, 0 ) ),
                         invalid_proof_exception );
   } catch( fc::exception& e ) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_FIXTURE_TEST_CASE( engine_handles_and_acl, database_fixture )
{
   try {
      ACTOR(alice);
      ACTOR(bob);

      const external_ciphertext ct = encrypt( 40 );
      const internal_ciphertext validated = engine.verify_and_decode( ct, prove( alice_id, ct ), alice_id );
      const internal_ciphertext sum = engine.add( engine.encrypt_zero(), validated );

      const size_t registered = engine.handle_count();
      const ciphertext_handle h = engine.to_external_handle( sum );
      BOOST_CHECK( !is_null_handle( h ) );
      BOOST_CHECK_EQUAL( engine.handle_count(), registered + 1 );
      // the handle is a digest of the ciphertext
      BOOST_CHECK( engine.to_external_handle( sum ) == h );
      BOOST_CHECK_EQUAL( engine.handle_count(), registered + 1 );

      BOOST_CHECK_THROW( engine.from_external_handle( h ), processing_denied_exception );
      engine.grant_processing_authority( h );
      BOOST_CHECK( engine.from_external_handle( h ).data == sum.data );

      BOOST_CHECK( !engine.can_decrypt( h, alice_id ) );
      BOOST_CHECK_THROW( engine.decrypt( h, alice_id ), decryption_denied_exception );
      engine.grant_decrypt_rights( h, alice_id );
      engine.grant_decrypt_rights( h, alice_id );
      BOOST_CHECK_EQUAL( engine.decrypt( h, alice_id ), 40u );
      BOOST_CHECK( !engine.can_decrypt( h, bob_id ) );

      engine.grant_public_decrypt( h );
      BOOST_CHECK( engine.can_decrypt( h, bob_id ) );
      BOOST_CHECK( engine.can_decrypt( h, identity_type() ) );
      BOOST_CHECK_EQUAL( engine.decrypt( h, bob_id ), 40u );

      const ciphertext_handle unknown = fc::sha256::hash( std::string( "unknown" ) );
      BOOST_CHECK_THROW( engine.from_external_handle( unknown ), unknown_handle_exception );
      BOOST_CHECK_THROW( engine.grant_public_decrypt( unknown ), unknown_handle_exception );
      BOOST_CHECK_THROW( engine.decrypt( unknown, alice_id ), unknown_handle_exception );
      BOOST_CHECK( !engine.can_decrypt( unknown, alice_id ) );

      BOOST_CHECK_THROW( engine.verify_and_decode( ct, input_proof(), alice_id ), invalid_proof_exception );
      BOOST_CHECK_THROW( engine.add( sum, internal_ciphertext() ), malformed_ciphertext_exception );
      BOOST_CHECK_THROW( engine.to_external_handle( internal_ciphertext() ), malformed_ciphertext_exception );
   } catch( fc::exception& e ) {
      edump((e.to_detail_string()));
      throw;
   }
}

BOOST_AUTO_TEST_CASE( engine_requires_verifier_key )
{
   paillier_engine::options opts;
   opts.modulus_bits = CIPHERBOOK_MIN_MODULUS_BITS;
   BOOST_CHECK_THROW( paillier_engine{ opts }, fc::assert_exception );
}

BOOST_AUTO_TEST_SUITE_END()
