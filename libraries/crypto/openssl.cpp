#include <meshwire/crypto/openssl.hpp>
#include <meshwire/exception.hpp>

namespace meshwire::crypto
{
   struct openssl_scope
   {
      openssl_scope()
      {
         MESHWIRE_ASSERT(
            OPENSSL_init_crypto(
               OPENSSL_INIT_LOAD_CRYPTO_STRINGS |
               OPENSSL_INIT_ADD_ALL_CIPHERS |
               OPENSSL_INIT_ADD_ALL_DIGESTS |
               OPENSSL_INIT_LOAD_CONFIG,
               nullptr ) == 1,
            meshwire::exception, "unable to initialize openssl" );
      }
   };

   int init_openssl()
   {
      static openssl_scope ossl;
      return 0;
   }

} // meshwire::crypto
