#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace meshwire {

using variable_blob = std::vector< char >;

template< std::size_t N >
using fixed_blob = std::array< char, N >;

constexpr std::size_t block_hash_size = 32;
constexpr std::size_t tx_id_size      = 32;
constexpr std::size_t address_size    = 20;

using block_hash_type = fixed_blob< block_hash_size >; ///< SHA-256 of a block header
using tx_id_type      = fixed_blob< tx_id_size >;      ///< SHA-256 of a signed transaction
using address_type    = fixed_blob< address_size >;    ///< RIPEMD-160 of the SHA-256 of a compressed public key

} // meshwire
