// see LICENSE.txt

#pragma once

#include <cipherbook/app/api.hpp>
#include <cipherbook/chain/database.hpp>
#include <cipherbook/chain/exceptions.hpp>
#include <cipherbook/fhe/exceptions.hpp>
#include <cipherbook/fhe/input_proof.hpp>
#include <cipherbook/fhe/paillier_engine.hpp>

#include <fc/log/logger.hpp>

#include <boost/preprocessor/stringize.hpp>

#include <string>

using namespace cipherbook::chain;
using namespace cipherbook::fhe;

#define TEST_MODULUS_BITS 1024

#define PREP_ACTOR(name) \
   fc::ecc::private_key name ## _private_key = generate_private_key(BOOST_PP_STRINGIZE(name)); \
   fc::ecc::public_key name ## _public_key = name ## _private_key.get_public_key(); \
   (void)name ## _public_key;

#define ACTOR(name) \
   PREP_ACTOR(name) \
   const identity_type name ## _id( name ## _public_key ); \
   (void)name ## _id;

namespace cipherbook { namespace chain { namespace test {

struct database_fixture {
   fc::ecc::private_key   verifier_private_key;
   accumulator_parameters params;
   paillier_engine        engine;
   database               db;

   database_fixture();
   ~database_fixture();

   static fc::ecc::private_key generate_private_key( const std::string& seed );
   static accumulator_parameters default_parameters();
   static paillier_engine::options engine_options( const fc::ecc::private_key& verifier,
                                                   const accumulator_parameters& params );

   /// client side: encrypts @p amount under the engine key
   external_ciphertext encrypt( uint64_t amount )const;
   /// input verifier side: attests @p ct for @p who
   input_proof         prove( const identity_type& who, const external_ciphertext& ct )const;

   ciphertext_handle   submit( const identity_type& who, uint64_t amount );
   ciphertext_handle   submit( const identity_type& who, const external_ciphertext& ct, const input_proof& proof );
   void                share( const identity_type& owner, const identity_type& viewer );
   void                publish( const identity_type& owner );

   uint64_t            decrypt_as( const identity_type& requester, const ciphertext_handle& handle )const;
   /// decrypts the current total of @p who as its owner
   uint64_t            total_of( const identity_type& who )const;
};

} } }
