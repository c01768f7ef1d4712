#include <meshwire/crypto/elliptic.hpp>
#include <meshwire/crypto/multihash.hpp>
#include <meshwire/crypto/openssl.hpp>

#include <boost/core/ignore_unused.hpp>
#include <boost/multiprecision/cpp_int.hpp>

#include <openssl/rand.h>

#include <secp256k1_recovery.h>

namespace meshwire::crypto {

using namespace boost::multiprecision::literals;

const secp256k1_context* _get_context()
{
   static secp256k1_context* ctx = secp256k1_context_create( SECP256K1_CONTEXT_VERIFY | SECP256K1_CONTEXT_SIGN );
   return ctx;
}

void _init_lib()
{
   static const secp256k1_context* ctx = _get_context();
   static int init_o = init_openssl();
   boost::ignore_unused(ctx, init_o);
}

static int extended_nonce_function( unsigned char *nonce32, const unsigned char *msg32,
                                    const unsigned char *key32, const unsigned char* algo16,
                                    void *data, unsigned int attempt )
{
   unsigned int* extra = (unsigned int*) data;
   (*extra)++;
   return secp256k1_nonce_function_default( nonce32, msg32, key32, algo16, nullptr, attempt + *extra );
}

const fixed_blob< 64 >& empty_pub()
{
   static const fixed_blob< 64 > empty_pub{};
   return empty_pub;
}

const private_key_secret& empty_priv()
{
   static const private_key_secret empty_priv{};
   return empty_priv;
}

bool is_sha256( const multihash& digest )
{
   return digest.id == multicodec::sha2_256 && digest.digest.size() == 32;
}


public_key::public_key() { _init_lib(); }

public_key::public_key( const public_key& pk ) : _key( pk._key ) { _init_lib(); }

public_key::public_key( public_key&& pk ) : _key( std::move( pk._key ) ) { _init_lib(); }

public_key::~public_key() {}

compressed_public_key public_key::serialize()const
{
   MESHWIRE_ASSERT( _key != empty_pub(), key_serialization_error, "cannot serialize an empty public key" );

   compressed_public_key cpk;
   size_t len = cpk.size();
   MESHWIRE_ASSERT(
      secp256k1_ec_pubkey_serialize(
         _get_context(),
         (unsigned char *) cpk.data(),
         &len,
         (const secp256k1_pubkey*) _key.data(),
         SECP256K1_EC_COMPRESSED ),
      key_serialization_error, "unknown error during public key serialization" );
   MESHWIRE_ASSERT( len == cpk.size(), key_serialization_error,
      "serialized key does not match expected size of ${n} bytes", ("n", cpk.size()) );

   return cpk;
}

public_key public_key::deserialize( const compressed_public_key& cpk )
{
   public_key pk;
   MESHWIRE_ASSERT(
      secp256k1_ec_pubkey_parse(
         _get_context(),
         (secp256k1_pubkey*) pk._key.data(),
         (const unsigned char*) cpk.data(),
         cpk.size() ),
      key_serialization_error, "public key is not a valid compressed curve point" );
   return pk;
}

public_key public_key::recover( const recoverable_signature& sig, const multihash& digest )
{
   MESHWIRE_ASSERT( is_sha256( digest ), key_recovery_error, "digest must be a 32 byte sha2-256 hash" );
   MESHWIRE_ASSERT( is_canonical( sig ), key_recovery_error, "signature is not canonical" );
   fixed_blob< 65 > internal_sig;
   public_key pk;

   int32_t rec_id = int32_t( uint8_t( sig[0] ) ) - 31;
   MESHWIRE_ASSERT( 0 <= rec_id && rec_id <= 3, key_recovery_error, "recovery id mismatch, must be in range [31,34]" );

   // The internal representation, as per the secp256k1 documentation, is an implementation
   // detail and not guaranteed across platforms or versions of secp256k1. We need to
   // convert the portable format to the internal format first.
   MESHWIRE_ASSERT(
      secp256k1_ecdsa_recoverable_signature_parse_compact(
         _get_context(),
         (secp256k1_ecdsa_recoverable_signature*) internal_sig.data(),
         (const unsigned char*) sig.data() + 1,
         rec_id ),
      key_recovery_error, "unknown error when parsing signature" );

   MESHWIRE_ASSERT(
      secp256k1_ecdsa_recover(
         _get_context(),
         (secp256k1_pubkey*) pk._key.data(),
         (const secp256k1_ecdsa_recoverable_signature*) internal_sig.data(),
         (const unsigned char*) digest.digest.data() ),
      key_recovery_error, "unknown error recovering public key from signature" );

   return pk;
}

bool public_key::verify( const recoverable_signature& sig, const multihash& digest )const
{
   if ( !valid() )
      return false;

   try
   {
      return recover( sig, digest ) == *this;
   }
   catch ( const key_recovery_error& )
   {
      return false;
   }
}

public_key& public_key::operator=( const public_key& pk )
{
   _key = pk._key;
   return *this;
}

public_key& public_key::operator=( public_key&& pk )
{
   _key = std::move( pk._key );
   return *this;
}

bool public_key::valid()const
{
   return _key != empty_pub();
}

address_type public_key::to_address()const
{
   auto compressed_key = serialize();
   auto sha256 = hash( multicodec::sha2_256, compressed_key.data(), compressed_key.size() );
   auto ripemd160 = hash( multicodec::ripemd_160, sha256.digest.data(), sha256.digest.size() );
   return to_fixed_blob< address_size >( ripemd160 );
}

bool public_key::is_canonical( const recoverable_signature& c )
{
   using boost::multiprecision::uint256_t;
   constexpr uint256_t n_2 =
      0x7FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF5D576E7357A4501DDFE92F46681B20A0_cppui256;

   // s is stored big endian in the last 32 bytes
   uint256_t s;
   const uint8_t* begin = reinterpret_cast< const uint8_t* >( c.data() ) + 33;
   boost::multiprecision::import_bits( s, begin, begin + 32 );

   // BIP-0062 states that sig must be in [1,n/2], however because a sig of value 0 is an invalid
   // signature under all circumstances, the lower bound does not need checking
   return s <= n_2;
}

private_key::private_key() { _init_lib(); }

private_key::private_key( private_key&& pk ) : _key( std::move( pk._key ) ) { _init_lib(); }

private_key::private_key( const private_key& pk ) : _key( pk._key ) { _init_lib(); }

private_key::~private_key() {}

private_key& private_key::operator=( private_key&& pk )
{
   _key = std::move( pk._key );
   return *this;
}

private_key& private_key::operator=( const private_key& pk )
{
   _key = pk._key;
   return *this;
}

private_key private_key::generate()
{
   private_key self;
   do
   {
      MESHWIRE_ASSERT(
         RAND_bytes( (unsigned char*) self._key.data(), self._key.size() ) == 1,
         key_manipulation_error, "unable to gather entropy for a new private key" );
   } while ( !secp256k1_ec_seckey_verify( _get_context(), (const unsigned char*) self._key.data() ) );

   return self;
}

private_key private_key::regenerate( const multihash& secret )
{
   MESHWIRE_ASSERT( is_sha256( secret ), key_manipulation_error, "secret must be a 32 byte sha2-256 hash" );
   private_key self;
   std::memcpy( self._key.data(), secret.digest.data(), self._key.size() );
   MESHWIRE_ASSERT(
      secp256k1_ec_seckey_verify( _get_context(), (const unsigned char*) self._key.data() ),
      key_manipulation_error, "secret is not a valid secp256k1 scalar" );
   return self;
}

private_key_secret private_key::get_secret()const
{
   return _key;
}

recoverable_signature private_key::sign_compact( const multihash& digest )const
{
   MESHWIRE_ASSERT( is_sha256( digest ), signing_error, "digest must be a 32 byte sha2-256 hash" );
   MESHWIRE_ASSERT( _key != empty_priv(), signing_error, "cannot sign with an empty key" );
   fixed_blob< 65 > internal_sig;
   recoverable_signature sig;
   int32_t rec_id;
   unsigned int counter = 0;
   do
   {
      MESHWIRE_ASSERT(
         secp256k1_ecdsa_sign_recoverable(
            _get_context(),
            (secp256k1_ecdsa_recoverable_signature*) internal_sig.data(),
            (const unsigned char*) digest.digest.data(),
            (const unsigned char*) _key.data(),
            extended_nonce_function,
            &counter ),
         signing_error, "unknown error when signing" );
      MESHWIRE_ASSERT(
         secp256k1_ecdsa_recoverable_signature_serialize_compact(
            _get_context(),
            (unsigned char*) sig.data() + 1,
            &rec_id,
            (const secp256k1_ecdsa_recoverable_signature*) internal_sig.data() ),
         signing_error, "unknown error when serializing recoverable signature" );
      sig[0] = (char)( rec_id + 31 );
   } while( !public_key::is_canonical( sig ) );

   return sig;
}

public_key private_key::get_public_key()const
{
   MESHWIRE_ASSERT( _key != empty_priv(), key_manipulation_error, "cannot get the public key of an empty private key" );
   public_key pk;
   MESHWIRE_ASSERT(
      secp256k1_ec_pubkey_create(
         _get_context(),
         (secp256k1_pubkey*) pk._key.data(),
         (const unsigned char*) _key.data() ),
      key_manipulation_error, "unknown error creating public key from a private key" );
   return pk;
}

} // meshwire::crypto
