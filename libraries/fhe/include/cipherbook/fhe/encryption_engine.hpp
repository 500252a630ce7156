// see LICENSE.txt

#pragma once

#include <cipherbook/protocol/address.hpp>
#include <cipherbook/protocol/types.hpp>

namespace cipherbook { namespace fhe {

   using namespace cipherbook::protocol;

   /**
    * Engine private representation of a ciphertext. The accumulator never looks inside; it only
    * passes these values between engine calls.
    */
   struct internal_ciphertext
   {
      vector<char> data;
   };

   /**
    * @class encryption_engine
    * @brief contract between the accumulator and a homomorphic encryption engine
    *
    * The engine owns ciphertext representation, homomorphic addition, input proof verification and
    * the access control list consulted by its decryption oracle. Every call either fully succeeds
    * or throws; the accumulator never observes partial results.
    *
    * Implementations are shared infrastructure and must be safe to call from several threads.
    */
   class encryption_engine
   {
      public:
         virtual ~encryption_engine() {}

         /**
          * Checks that @p proof attests @p input was produced for @p submitter and decodes it.
          * @throws protocol::invalid_proof_exception
          */
         virtual internal_ciphertext verify_and_decode( const external_ciphertext& input,
                                                        const input_proof& proof,
                                                        const identity_type& submitter ) = 0;

         virtual internal_ciphertext encrypt_zero() = 0;

         /** homomorphic addition */
         virtual internal_ciphertext add( const internal_ciphertext& a, const internal_ciphertext& b ) = 0;

         /** exports a stable fixed width handle; the ciphertext stays resolvable through it */
         virtual ciphertext_handle to_external_handle( const internal_ciphertext& ct ) = 0;

         /**
          * Resolves a handle produced by to_external_handle.
          * @throws processing_denied_exception unless processing authority was granted on it
          */
         virtual internal_ciphertext from_external_handle( const ciphertext_handle& handle )const = 0;

         /// @name access control primitives, all idempotent
         /// @{
         virtual void grant_processing_authority( const ciphertext_handle& handle ) = 0;
         virtual void grant_decrypt_rights( const ciphertext_handle& handle, const identity_type& who ) = 0;
         virtual void grant_public_decrypt( const ciphertext_handle& handle ) = 0;
         /// @}

         virtual bool can_decrypt( const ciphertext_handle& handle, const identity_type& who )const = 0;

         /** the domain input proofs must be bound to; an accumulator only accepts an engine of its own domain */
         virtual domain_id_type domain()const = 0;
   };

} } // cipherbook::fhe

FC_REFLECT( cipherbook::fhe::internal_ciphertext, (data) )
