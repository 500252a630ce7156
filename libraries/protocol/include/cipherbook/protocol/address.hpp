// see LICENSE.txt

#pragma once

#include <cipherbook/protocol/types.hpp>

#include <fc/crypto/elliptic.hpp>
#include <fc/crypto/ripemd160.hpp>

namespace cipherbook { namespace protocol {

   /**
    *  @brief identity of a principal: ripemd160( sha512( compressed public key ) )
    *
    *  Text form is CIPHERBOOK_ADDRESS_PREFIX followed by base58 of the 20 hash bytes and a 4 byte
    *  checksum, the leading bytes of ripemd160 over the hash. The default constructed address is
    *  the null identity; it never names a principal.
    */
   class address
   {
      public:
         address() {}
         address( const fc::ecc::public_key& pub );
         /** @throws fc::assert_exception on a wrong prefix, bad base58 or checksum mismatch */
         explicit address( const std::string& text );

         static bool is_valid( const std::string& text );

         bool is_null()const { return addr == fc::ripemd160(); }

         explicit operator std::string()const;

         fc::ripemd160 addr;
   };
   inline bool operator == ( const address& a, const address& b ) { return a.addr == b.addr; }
   inline bool operator != ( const address& a, const address& b ) { return a.addr != b.addr; }
   inline bool operator <  ( const address& a, const address& b ) { return a.addr <  b.addr; }

} } // namespace cipherbook::protocol

namespace fc
{
   void to_variant( const cipherbook::protocol::address& var,  fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var,  cipherbook::protocol::address& vo, uint32_t max_depth = 1 );
}

FC_REFLECT( cipherbook::protocol::address, (addr) )
