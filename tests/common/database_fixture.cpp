// see LICENSE.txt

#include "database_fixture.hpp"

namespace cipherbook { namespace chain { namespace test {

database_fixture::database_fixture()
   : verifier_private_key( generate_private_key( "input-verifier" ) ),
     params( default_parameters() ),
     engine( engine_options( verifier_private_key, params ) ),
     db( engine, params )
{
}

database_fixture::~database_fixture()
{
}

fc::ecc::private_key database_fixture::generate_private_key( const std::string& seed )
{
   return fc::ecc::private_key::regenerate( fc::sha256::hash( seed ) );
}

accumulator_parameters database_fixture::default_parameters()
{
   accumulator_parameters result;
   result.system_identity = identity_type( generate_private_key( "accumulator" ).get_public_key() );
   result.domain          = fc::sha256::hash( std::string( "cipherbook-test" ) );
   return result;
}

paillier_engine::options database_fixture::engine_options( const fc::ecc::private_key& verifier,
                                                           const accumulator_parameters& params )
{
   paillier_engine::options result;
   result.modulus_bits = TEST_MODULUS_BITS;
   result.verifier_key = verifier.get_public_key();
   result.domain       = params.domain;
   return result;
}

external_ciphertext database_fixture::encrypt( uint64_t amount )const
{
   return engine.public_key().encrypt( amount );
}

input_proof database_fixture::prove( const identity_type& who, const external_ciphertext& ct )const
{
   return sign_input( verifier_private_key, params.domain, who, ct );
}

ciphertext_handle database_fixture::submit( const identity_type& who, uint64_t amount )
{
   const external_ciphertext ct = encrypt( amount );
   return submit( who, ct, prove( who, ct ) );
}

ciphertext_handle database_fixture::submit( const identity_type& who, const external_ciphertext& ct,
                                            const input_proof& proof )
{
   submit_contribution_operation op;
   op.caller       = who;
   op.contribution = ct;
   op.proof        = proof;
   return db.push_operation( op ).get<ciphertext_handle>();
}

void database_fixture::share( const identity_type& owner, const identity_type& viewer )
{
   share_total_operation op;
   op.owner  = owner;
   op.viewer = viewer;
   db.push_operation( op );
}

void database_fixture::publish( const identity_type& owner )
{
   make_total_public_operation op;
   op.owner = owner;
   db.push_operation( op );
}

uint64_t database_fixture::decrypt_as( const identity_type& requester, const ciphertext_handle& handle )const
{
   return engine.decrypt( handle, requester );
}

uint64_t database_fixture::total_of( const identity_type& who )const
{
   return engine.decrypt( db.get_total_handle( who ), who );
}

} } } // cipherbook::chain::test
