#pragma once
#include <meshwire/crypto/multihash.hpp>
#include <meshwire/exception.hpp>
#include <meshwire/types/types.hpp>

#include <secp256k1.h>

#include <cstring>
#include <string>

namespace meshwire::crypto {

MESHWIRE_DECLARE_EXCEPTION( crypto_exception );
MESHWIRE_DECLARE_DERIVED_EXCEPTION( key_serialization_error, crypto_exception );
MESHWIRE_DECLARE_DERIVED_EXCEPTION( key_recovery_error, crypto_exception );
MESHWIRE_DECLARE_DERIVED_EXCEPTION( key_manipulation_error, crypto_exception );
MESHWIRE_DECLARE_DERIVED_EXCEPTION( signing_error, crypto_exception );

using recoverable_signature = fixed_blob< 65 >;
using compressed_public_key = fixed_blob< 33 >;
using private_key_secret    = fixed_blob< 32 >;

/**
 *  @class public_key
 *  @brief contains only the public point of an elliptic curve key.
 */
class public_key
{
   public:
      public_key();
      public_key( const public_key& k );
      public_key( public_key&& pk );

      ~public_key();

      compressed_public_key serialize()const;
      static public_key deserialize( const compressed_public_key& cpk );

      static public_key recover( const recoverable_signature& sig, const multihash& digest );

      /**
       * True when sig is a canonical signature of digest made by this key.
       * Malformed signatures yield false rather than an exception.
       */
      bool verify( const recoverable_signature& sig, const multihash& digest )const;

      bool valid()const;

      public_key& operator =( public_key&& pk );
      public_key& operator =( const public_key& pk );

      inline friend bool operator ==( const public_key& a, const public_key& b )
      {
         if ( !a.valid() || !b.valid() )
            return a._key == b._key;
         return a.serialize() == b.serialize();
      }

      inline friend bool operator !=( const public_key& a, const public_key& b )
      {
         return !(a == b);
      }

      address_type to_address()const;

      static bool is_canonical( const recoverable_signature& c );

   private:
      friend class private_key;

      // Opaque secp256k1_pubkey
      fixed_blob< 64 > _key = {};
};

/**
 *  @class private_key
 *  @brief an elliptic curve private key.
 */
class private_key
{
   public:
      private_key();
      private_key( private_key&& pk );
      private_key( const private_key& pk );
      ~private_key();

      private_key& operator=( private_key&& pk );
      private_key& operator=( const private_key& pk );

      static private_key generate();
      static private_key regenerate( const multihash& secret );

      private_key_secret get_secret()const; // get the private key secret

      recoverable_signature sign_compact( const multihash& digest )const;

      public_key get_public_key()const;

      inline friend bool operator==( const private_key& a, const private_key& b )
      {
         return a._key == b._key;
      }

      inline friend bool operator!=( const private_key& a, const private_key& b )
      {
         return !(a == b);
      }

   private:
      private_key_secret _key = {};
};

} // meshwire::crypto
