#include <meshwire/net/message_type.hpp>

namespace meshwire::net {

std::string to_string( message_type t )
{
   switch ( t )
   {
      case message_type::ping:
         return "ping";
      case message_type::pong:
         return "pong";
      case message_type::peer_set_delta:
         return "peer_set_delta";
      case message_type::get_block_hashes:
         return "get_block_hashes";
      case message_type::block_hashes:
         return "block_hashes";
      case message_type::tx_ids:
         return "tx_ids";
      case message_type::get_blocks:
         return "get_blocks";
      case message_type::get_txs:
         return "get_txs";
      case message_type::blocks:
         return "blocks";
      case message_type::get_recent_states:
         return "get_recent_states";
      case message_type::recent_states:
         return "recent_states";
      case message_type::tx:
         return "tx";
   }

   return "unknown(" + std::to_string( uint32_t( t ) ) + ")";
}

} // meshwire::net
