// see LICENSE.txt

#pragma once

#include <fc/crypto/openssl.hpp>

#include <openssl/bn.h>

#include <cstdint>
#include <vector>

namespace cipherbook { namespace fhe {

   class paillier_private_key;

   /**
    * @class paillier_public_key
    * @brief additively homomorphic Paillier encryption with generator g = n + 1
    *
    * Ciphertexts are elements of Z*(n^2) serialized big endian to a fixed width of
    * ciphertext_size() bytes. The product of two ciphertexts decrypts to the sum of their
    * plaintexts modulo n.
    */
   class paillier_public_key
   {
      public:
         paillier_public_key();
         /// @param modulus n, big endian
         explicit paillier_public_key( const std::vector<char>& modulus );

         paillier_public_key( const paillier_public_key& ) = delete;
         paillier_public_key& operator=( const paillier_public_key& ) = delete;

         std::vector<char> encrypt( uint64_t value )const;
         std::vector<char> add( const std::vector<char>& a, const std::vector<char>& b )const;

         /// true if @p ct has the expected width and encodes an element of (0, n^2)
         bool              is_valid_ciphertext( const std::vector<char>& ct )const;

         size_t            ciphertext_size()const;
         uint32_t          modulus_bits()const;
         std::vector<char> modulus()const;

      private:
         friend class paillier_private_key;
         void set_modulus( const BIGNUM* n );

         fc::ssl_bignum _n;
         fc::ssl_bignum _n_squared;
   };

   /**
    * @class paillier_private_key
    * @brief the trapdoor: lambda = lcm(p-1, q-1) and mu = lambda^-1 mod n
    */
   class paillier_private_key
   {
      public:
         /** generates a fresh key whose modulus has @p modulus_bits bits */
         explicit paillier_private_key( uint32_t modulus_bits );

         paillier_private_key( const paillier_private_key& ) = delete;
         paillier_private_key& operator=( const paillier_private_key& ) = delete;

         /**
          * @throws malformed_ciphertext_exception if @p ct is not a valid ciphertext
          * @throws plaintext_overflow_exception if the plaintext does not fit into 64 bits
          */
         uint64_t decrypt( const std::vector<char>& ct )const;

         const paillier_public_key& get_public_key()const { return _public; }

      private:
         paillier_public_key _public;
         fc::ssl_bignum      _lambda;
         fc::ssl_bignum      _mu;
   };

} } // cipherbook::fhe
