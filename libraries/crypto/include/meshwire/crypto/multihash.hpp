#pragma once
#include <meshwire/exception.hpp>
#include <meshwire/types/types.hpp>

#include <openssl/evp.h>

#include <cstdint>
#include <cstring>
#include <string>

namespace meshwire::crypto {

MESHWIRE_DECLARE_EXCEPTION( unknown_hash_algorithm );
MESHWIRE_DECLARE_EXCEPTION( multihash_size_mismatch );
MESHWIRE_DECLARE_EXCEPTION( multihash_size_limit_exceeded );

/* Multicodec IDs for hash algorithms
 * https://github.com/multiformats/multicodec/blob/master/table.csv
 */
enum class multicodec : uint64_t
{
   sha2_256   = 0x12,
   ripemd_160 = 0x1053
};

struct multihash
{
   multicodec    id = multicodec::sha2_256;
   variable_blob digest;

   inline friend bool operator ==( const multihash& a, const multihash& b )
   {
      return a.id == b.id && a.digest == b.digest;
   }

   inline friend bool operator !=( const multihash& a, const multihash& b )
   {
      return !(a == b);
   }
};

uint64_t multihash_standard_size( multicodec id );

struct encoder
{
   encoder( multicodec code, uint64_t size = 0 );
   ~encoder();

   encoder( const encoder& ) = delete;
   encoder& operator=( const encoder& ) = delete;

   void write( const char* d, size_t len );
   void put( char c ) { write( &c, 1 ); }
   void get_result( variable_blob& v );
   inline void get_result( multihash& mh )
   {
      get_result( mh.digest );
      mh.id = _code;
   }

   private:
      const EVP_MD* md = nullptr;
      EVP_MD_CTX* mdctx = nullptr;
      multicodec _code;
      uint64_t _size;
};

multihash hash( multicodec code, const char* data, size_t len, uint64_t size = 0 );
multihash hash( multicodec code, const std::string& s, uint64_t size = 0 );
multihash hash( multicodec code, const variable_blob& value, uint64_t size = 0 );

/**
 * Copies a digest into a fixed size blob. The digest must be exactly N bytes.
 */
template< std::size_t N >
fixed_blob< N > to_fixed_blob( const multihash& mh )
{
   MESHWIRE_ASSERT( mh.digest.size() == N, multihash_size_mismatch,
      "digest of ${size} bytes does not fit a ${n} byte blob", ("size", mh.digest.size())("n", N) );
   fixed_blob< N > b;
   std::memcpy( b.data(), mh.digest.data(), N );
   return b;
}

} // meshwire::crypto
