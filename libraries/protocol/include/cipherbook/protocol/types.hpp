// see LICENSE.txt

#pragma once

#include <cipherbook/protocol/config.hpp>

#include <fc/container/flat.hpp>
#include <fc/crypto/elliptic.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/static_variant.hpp>
#include <fc/time.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace cipherbook { namespace protocol {

   using std::string;
   using std::vector;
   using fc::flat_set;

   class address;

   /// An identity is the address of a principal; see address.hpp
   typedef address identity_type;

   /**
    * Opaque reference to an encrypted 64 bit value. Handles are immutable values produced by the
    * encryption engine; the default constructed (all zero) handle is the null sentinel and is never
    * produced by an engine.
    */
   typedef fc::sha256 ciphertext_handle;

   /// Binds input proofs to one accumulator instance
   typedef fc::sha256 domain_id_type;

   /// Ciphertext as encoded by a client, not yet validated against this system
   typedef vector<char> external_ciphertext;

   /// Client supplied evidence that an external ciphertext is well formed and bound to its submitter
   typedef vector<char> input_proof;

   inline bool is_null_handle( const ciphertext_handle& h ) { return h == ciphertext_handle(); }

   struct void_result{};

   typedef fc::static_variant<void_result, ciphertext_handle> operation_result;

} } // cipherbook::protocol

FC_REFLECT_EMPTY( cipherbook::protocol::void_result )
