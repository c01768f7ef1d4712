#pragma once

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>

namespace meshwire::crypto
{
    /** Loads OpenSSL error strings, digests and configuration once per process.
        Safe to call from any thread and any number of times.
    */
    int init_openssl();

} // meshwire::crypto
