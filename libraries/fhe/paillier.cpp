// see LICENSE.txt

#include <cipherbook/fhe/paillier.hpp>
#include <cipherbook/fhe/exceptions.hpp>
#include <cipherbook/protocol/config.hpp>

#include <openssl/rand.h>

namespace cipherbook { namespace fhe {

namespace {

   void bn_from_bytes( const std::vector<char>& in, BIGNUM* out )
   {
      FC_ASSERT( BN_bin2bn( reinterpret_cast<const unsigned char*>( in.data() ), in.size(), out ) != nullptr );
   }

   std::vector<char> bn_to_bytes( const BIGNUM* in, size_t width )
   {
      std::vector<char> out( width );
      FC_ASSERT( BN_bn2binpad( in, reinterpret_cast<unsigned char*>( out.data() ), width ) == int(width),
                 "Value does not fit into ${w} bytes", ("w", width) );
      return out;
   }

   /// uniformly random r in [1, n) with gcd(r, n) == 1
   void random_unit( BIGNUM* r, const BIGNUM* n, BN_CTX* ctx )
   {
      fc::ssl_bignum gcd;
      do
      {
         FC_ASSERT( BN_rand_range( r, n ) == 1 );
         FC_ASSERT( BN_gcd( gcd, r, n, ctx ) == 1 );
      } while( BN_is_zero( r ) || !BN_is_one( gcd ) );
   }

} // anonymous

paillier_public_key::paillier_public_key() {}

paillier_public_key::paillier_public_key( const std::vector<char>& modulus )
{
   fc::ssl_bignum n;
   bn_from_bytes( modulus, n );
   FC_ASSERT( BN_num_bits( n ) >= CIPHERBOOK_MIN_MODULUS_BITS, "Paillier modulus is too small" );
   set_modulus( n );
}

void paillier_public_key::set_modulus( const BIGNUM* n )
{
   fc::bn_ctx ctx( BN_CTX_new() );
   FC_ASSERT( BN_copy( _n, n ) != nullptr );
   FC_ASSERT( BN_sqr( _n_squared, _n, ctx ) == 1 );
}

size_t paillier_public_key::ciphertext_size()const
{
   return BN_num_bytes( _n_squared );
}

uint32_t paillier_public_key::modulus_bits()const
{
   return BN_num_bits( _n );
}

std::vector<char> paillier_public_key::modulus()const
{
   return bn_to_bytes( _n, BN_num_bytes( _n ) );
}

bool paillier_public_key::is_valid_ciphertext( const std::vector<char>& ct )const
{
   if( BN_is_zero( _n ) || ct.size() != ciphertext_size() )
      return false;
   fc::ssl_bignum c;
   bn_from_bytes( ct, c );
   return !BN_is_zero( c ) && BN_cmp( c, _n_squared ) < 0;
}

std::vector<char> paillier_public_key::encrypt( uint64_t value )const
{
   FC_ASSERT( !BN_is_zero( _n ), "Paillier key is not initialized" );

   fc::bn_ctx ctx( BN_CTX_new() );
   fc::ssl_bignum m, r, gm, rn, c;

   // BN_ULONG may be narrower than 64 bits
   FC_ASSERT( BN_set_word( m, static_cast<BN_ULONG>( value >> 32 ) ) == 1 );
   FC_ASSERT( BN_lshift( m, m, 32 ) == 1 );
   FC_ASSERT( BN_add_word( m, static_cast<BN_ULONG>( value & 0xffffffff ) ) == 1 );

   // g^m mod n^2 == 1 + m*n since g = n + 1
   FC_ASSERT( BN_mul( gm, m, _n, ctx ) == 1 );
   FC_ASSERT( BN_add_word( gm, 1 ) == 1 );

   random_unit( r, _n, ctx );
   FC_ASSERT( BN_mod_exp( rn, r, _n, _n_squared, ctx ) == 1 );
   FC_ASSERT( BN_mod_mul( c, gm, rn, _n_squared, ctx ) == 1 );

   return bn_to_bytes( c, ciphertext_size() );
}

std::vector<char> paillier_public_key::add( const std::vector<char>& a, const std::vector<char>& b )const
{
   FC_ASSERT( is_valid_ciphertext( a ) && is_valid_ciphertext( b ),
              "Cannot add malformed ciphertexts" );

   fc::bn_ctx ctx( BN_CTX_new() );
   fc::ssl_bignum ca, cb, sum;
   bn_from_bytes( a, ca );
   bn_from_bytes( b, cb );
   FC_ASSERT( BN_mod_mul( sum, ca, cb, _n_squared, ctx ) == 1 );
   return bn_to_bytes( sum, ciphertext_size() );
}

paillier_private_key::paillier_private_key( uint32_t modulus_bits )
{
   FC_ASSERT( modulus_bits >= CIPHERBOOK_MIN_MODULUS_BITS && modulus_bits % 2 == 0,
              "Unsupported Paillier modulus size ${b}", ("b", modulus_bits) );

   fc::bn_ctx ctx( BN_CTX_new() );
   fc::ssl_bignum p, q, n, p1, q1, phi, gcd;

   do
   {
      FC_ASSERT( BN_generate_prime_ex( p, modulus_bits / 2, 0, nullptr, nullptr, nullptr ) == 1 );
      FC_ASSERT( BN_generate_prime_ex( q, modulus_bits / 2, 0, nullptr, nullptr, nullptr ) == 1 );
      FC_ASSERT( BN_mul( n, p, q, ctx ) == 1 );
   } while( BN_cmp( p, q ) == 0 || BN_num_bits( n ) != int(modulus_bits) );

   FC_ASSERT( BN_sub( p1, p, BN_value_one() ) == 1 );
   FC_ASSERT( BN_sub( q1, q, BN_value_one() ) == 1 );
   FC_ASSERT( BN_mul( phi, p1, q1, ctx ) == 1 );
   FC_ASSERT( BN_gcd( gcd, p1, q1, ctx ) == 1 );
   // lambda = lcm(p-1, q-1)
   FC_ASSERT( BN_div( _lambda, nullptr, phi, gcd, ctx ) == 1 );
   FC_ASSERT( BN_mod_inverse( _mu, _lambda, n, ctx ) != nullptr, "lambda is not invertible modulo n" );

   _public.set_modulus( n );
}

uint64_t paillier_private_key::decrypt( const std::vector<char>& ct )const
{
   CIPHERBOOK_ASSERT( _public.is_valid_ciphertext( ct ), malformed_ciphertext_exception,
                      "Ciphertext of ${s} bytes is not valid under this key", ("s", ct.size()) );

   fc::bn_ctx ctx( BN_CTX_new() );
   fc::ssl_bignum c, u, l, m;
   bn_from_bytes( ct, c );

   // m = L(c^lambda mod n^2) * mu mod n, with L(x) = (x - 1) / n
   FC_ASSERT( BN_mod_exp( u, c, _lambda, _public._n_squared, ctx ) == 1 );
   FC_ASSERT( BN_sub_word( u, 1 ) == 1 );
   FC_ASSERT( BN_div( l, nullptr, u, _public._n, ctx ) == 1 );
   FC_ASSERT( BN_mod_mul( m, l, _mu, _public._n, ctx ) == 1 );

   CIPHERBOOK_ASSERT( BN_num_bits( m ) <= 64, plaintext_overflow_exception,
                      "Plaintext of ${b} bits does not fit into 64 bits", ("b", BN_num_bits( m )) );

   const std::vector<char> bytes = bn_to_bytes( m, 8 );
   uint64_t value = 0;
   for( char b : bytes )
      value = ( value << 8 ) | static_cast<unsigned char>( b );
   return value;
}

} } // cipherbook::fhe
