// see LICENSE.txt

#include <cipherbook/protocol/address.hpp>

#include <fc/crypto/base58.hpp>
#include <fc/optional.hpp>

#include <cstring>

namespace cipherbook { namespace protocol {

namespace {

   const size_t checksum_size = 4;

   fc::ripemd160 checksum_of( const fc::ripemd160& hash )
   {
      return fc::ripemd160::hash( hash.data(), sizeof( hash ) );
   }

   fc::optional<fc::ripemd160> decode( const std::string& text )
   {
      const std::string prefix( CIPHERBOOK_ADDRESS_PREFIX );
      if( text.size() <= prefix.size() || text.compare( 0, prefix.size(), prefix ) != 0 )
         return fc::optional<fc::ripemd160>();

      std::vector<char> bin;
      try {
         bin = fc::from_base58( text.substr( prefix.size() ) );
      } catch( const fc::parse_error_exception& ) {
         return fc::optional<fc::ripemd160>();
      }
      if( bin.size() != sizeof( fc::ripemd160 ) + checksum_size )
         return fc::optional<fc::ripemd160>();

      fc::ripemd160 hash;
      memcpy( hash.data(), bin.data(), sizeof( fc::ripemd160 ) );
      if( memcmp( bin.data() + sizeof( fc::ripemd160 ), checksum_of( hash ).data(), checksum_size ) != 0 )
         return fc::optional<fc::ripemd160>();
      return hash;
   }

}

address::address( const fc::ecc::public_key& pub )
{
   const fc::ecc::public_key_data key = pub.serialize();
   addr = fc::ripemd160::hash( fc::sha512::hash( key.data(), key.size() ) );
}

address::address( const std::string& text )
{
   const fc::optional<fc::ripemd160> hash = decode( text );
   FC_ASSERT( hash.valid(), "Not an identity: ${t}", ("t", text) );
   addr = *hash;
}

bool address::is_valid( const std::string& text )
{
   return decode( text ).valid();
}

address::operator std::string()const
{
   std::vector<char> bin( addr.data(), addr.data() + sizeof( addr ) );
   const fc::ripemd160 checksum = checksum_of( addr );
   bin.insert( bin.end(), checksum.data(), checksum.data() + checksum_size );
   return CIPHERBOOK_ADDRESS_PREFIX + fc::to_base58( bin.data(), bin.size() );
}

} } // cipherbook::protocol

namespace fc
{
   void to_variant( const cipherbook::protocol::address& var, variant& vo, uint32_t max_depth )
   {
      vo = std::string( var );
   }
   void from_variant( const variant& var, cipherbook::protocol::address& vo, uint32_t max_depth )
   {
      vo = cipherbook::protocol::address( var.as_string() );
   }
}
