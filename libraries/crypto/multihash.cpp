#include <meshwire/crypto/multihash.hpp>
#include <meshwire/crypto/openssl.hpp>

#include <algorithm>
#include <limits>
#include <map>

namespace meshwire::crypto {

const EVP_MD* get_evp_md( multicodec code )
{
   static const std::map< multicodec, const EVP_MD* > evp_md_map = {
      { multicodec::sha2_256,   EVP_sha256() },
      { multicodec::ripemd_160, EVP_ripemd160() }
   };

   auto md_itr = evp_md_map.find( code );
   return md_itr != evp_md_map.end() ? md_itr->second : nullptr;
}

uint64_t multihash_standard_size( multicodec id )
{
   switch( id )
   {
      case multicodec::sha2_256:
         return 32;
      case multicodec::ripemd_160:
         return 20;
   }

   MESHWIRE_THROW( unknown_hash_algorithm, "unknown hash id ${i}", ("i", uint64_t( id )) );
}

encoder::encoder( multicodec code, uint64_t size )
{
   static const uint64_t MAX_HASH_SIZE = std::min< uint64_t >(
      {std::numeric_limits< uint8_t >::max(),              // We potentially store the size in uint8_t value
       std::numeric_limits< unsigned int >::max(),         // We cast the size to unsigned int for openssl call
       EVP_MAX_MD_SIZE                                     // Max size supported by OpenSSL library
      });

   init_openssl();

   _code = code;
   if( size == 0 )
      size = multihash_standard_size( code );
   MESHWIRE_ASSERT( size <= MAX_HASH_SIZE, multihash_size_limit_exceeded,
      "requested hash size ${size} is larger than max size ${max}", ("size", size)("max", MAX_HASH_SIZE) );

   _size = size;
   md = get_evp_md( code );
   MESHWIRE_ASSERT( md, unknown_hash_algorithm, "unknown hash id ${i}", ("i", uint64_t( code )) );
   mdctx = EVP_MD_CTX_new();
   MESHWIRE_ASSERT( mdctx && EVP_DigestInit_ex( mdctx, md, nullptr ) == 1, meshwire::exception, "unable to initialize digest context" );
}

encoder::~encoder()
{
   if( mdctx ) EVP_MD_CTX_free( mdctx );
}

void encoder::write( const char* d, size_t len )
{
   MESHWIRE_ASSERT( EVP_DigestUpdate( mdctx, d, len ) == 1, meshwire::exception, "EVP_DigestUpdate returned failure" );
}

void encoder::get_result( variable_blob& v )
{
   unsigned int size = (unsigned int) _size;
   v.resize( EVP_MAX_MD_SIZE );
   MESHWIRE_ASSERT(
      EVP_DigestFinal_ex(
         mdctx, (unsigned char*)( v.data() ), &size ),
      meshwire::exception, "EVP_DigestFinal_ex returned failure" );
   MESHWIRE_ASSERT( size == _size,
      multihash_size_mismatch,
      "OpenSSL EVP_DigestFinal_ex returned hash size ${size}, does not match expected hash size ${expected}",
      ("size", uint64_t( size ))("expected", _size) );
   v.resize( _size );
}

multihash hash( multicodec code, const char* data, size_t len, uint64_t size )
{
   multihash result;
   encoder e( code, size );
   e.write( data, len );
   e.get_result( result );
   return result;
}

multihash hash( multicodec code, const std::string& s, uint64_t size )
{
   return hash( code, s.data(), s.size(), size );
}

multihash hash( multicodec code, const variable_blob& value, uint64_t size )
{
   return hash( code, value.data(), value.size(), size );
}

} // meshwire::crypto
