#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace meshwire::net {

enum class message_type : uint8_t
{
   ping              = 0x01, ///< Check message to determine peer is alive
   pong              = 0x02, ///< A reply to ping
   peer_set_delta    = 0x03, ///< Peer's delta set to sync peer list
   get_block_hashes  = 0x04, ///< Request to query block hashes
   block_hashes      = 0x05, ///< Inventory to transfer blocks
   tx_ids            = 0x06, ///< Inventory to transfer transactions
   get_blocks        = 0x07, ///< Request to query blocks
   get_txs           = 0x08, ///< Request to query transactions
   blocks            = 0x0a, ///< Serialized blocks
   get_recent_states = 0x0b, ///< Request to query calculated states
   recent_states     = 0x0c, ///< Calculated recent states and state references
   tx                = 0x10  ///< A serialized transaction
};

std::string to_string( message_type t );

inline std::ostream& operator<<( std::ostream& os, message_type t )
{
   return os << to_string( t );
}

} // meshwire::net
