// see LICENSE.txt

#pragma once

#include <cipherbook/fhe/encryption_engine.hpp>
#include <cipherbook/fhe/paillier.hpp>

#include <fc/crypto/elliptic.hpp>

#include <map>
#include <mutex>
#include <set>

namespace cipherbook { namespace fhe {

   /**
    * @class paillier_engine
    * @brief reference encryption engine built on the Paillier cryptosystem
    *
    * Holds the trapdoor key, a registry of ciphertexts addressed by handle and the access control
    * list. Input proofs are signatures of the configured input verifier (see input_proof.hpp).
    *
    * Plaintexts live modulo n, so sums of 64 bit values never wrap; decrypting a total larger than
    * 2^64 - 1 throws plaintext_overflow_exception instead.
    */
   class paillier_engine : public encryption_engine
   {
      public:
         struct options
         {
            uint32_t            modulus_bits = CIPHERBOOK_DEFAULT_MODULUS_BITS;
            /// public key of the party that signs input proofs
            fc::ecc::public_key verifier_key;
            /// must match the domain of the accumulator the proofs are made for
            domain_id_type      domain;
         };

         explicit paillier_engine( const options& opts );
         virtual ~paillier_engine();

         virtual internal_ciphertext verify_and_decode( const external_ciphertext& input,
                                                        const input_proof& proof,
                                                        const identity_type& submitter ) override;
         virtual internal_ciphertext encrypt_zero() override;
         virtual internal_ciphertext add( const internal_ciphertext& a, const internal_ciphertext& b ) override;
         virtual ciphertext_handle   to_external_handle( const internal_ciphertext& ct ) override;
         virtual internal_ciphertext from_external_handle( const ciphertext_handle& handle )const override;

         virtual void grant_processing_authority( const ciphertext_handle& handle ) override;
         virtual void grant_decrypt_rights( const ciphertext_handle& handle, const identity_type& who ) override;
         virtual void grant_public_decrypt( const ciphertext_handle& handle ) override;

         virtual bool can_decrypt( const ciphertext_handle& handle, const identity_type& who )const override;
         virtual domain_id_type domain()const override { return _options.domain; }

         /**
          * Decryption oracle.
          * @throws unknown_handle_exception for handles this engine never produced
          * @throws decryption_denied_exception unless @p requester was granted or the handle is public
          */
         uint64_t decrypt( const ciphertext_handle& handle, const identity_type& requester )const;

         bool   is_public( const ciphertext_handle& handle )const;
         bool   has_processing_authority( const ciphertext_handle& handle )const;
         size_t handle_count()const;

         /// clients encrypt their contributions with this key
         const paillier_public_key& public_key()const { return _key.get_public_key(); }
         const options&             get_options()const { return _options; }

      private:
         const vector<char>& lookup( const ciphertext_handle& handle )const;
         bool                is_allowed( const ciphertext_handle& handle, const identity_type& who )const;

         options                                          _options;
         paillier_private_key                             _key;

         mutable std::mutex                               _mutex;
         std::map<ciphertext_handle, vector<char>>        _ciphertexts;
         std::set<ciphertext_handle>                      _processing;
         std::set<std::pair<ciphertext_handle, identity_type>> _decrypt_rights;
         std::set<ciphertext_handle>                      _public;
   };

} } // cipherbook::fhe

FC_REFLECT( cipherbook::fhe::paillier_engine::options, (modulus_bits)(verifier_key)(domain) )
