#pragma once
#include <meshwire/net/frame.hpp>
#include <meshwire/net/message_type.hpp>
#include <meshwire/types/types.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <vector>

namespace meshwire::net {

struct ping
{
   static constexpr message_type type = message_type::ping;

   frame_sequence to_frames()const;
   static ping from_frames( const frame_sequence& body );

   friend bool operator==( const ping&, const ping& ) { return true; }
};

struct pong
{
   static constexpr message_type type = message_type::pong;

   frame_sequence to_frames()const;
   static pong from_frames( const frame_sequence& body );

   friend bool operator==( const pong&, const pong& ) { return true; }
};

/**
 * Changes to the sender's peer set. The delta itself is serialized by the
 * peer discovery layer and carried as a single opaque frame.
 */
struct peer_set_delta
{
   static constexpr message_type type = message_type::peer_set_delta;

   variable_blob delta;

   frame_sequence to_frames()const;
   static peer_set_delta from_frames( const frame_sequence& body );

   friend bool operator==( const peer_set_delta& a, const peer_set_delta& b ) { return a.delta == b.delta; }
};

/**
 * Asks for the hashes of the blocks following the first locator hash the
 * receiver knows, up to stop (inclusive) when given.
 */
struct get_block_hashes
{
   static constexpr message_type type = message_type::get_block_hashes;

   std::vector< block_hash_type >   locator;
   std::optional< block_hash_type > stop;

   frame_sequence to_frames()const;
   static get_block_hashes from_frames( const frame_sequence& body );

   friend bool operator==( const get_block_hashes& a, const get_block_hashes& b )
   {
      return a.locator == b.locator && a.stop == b.stop;
   }
};

struct block_hashes
{
   static constexpr message_type type = message_type::block_hashes;

   std::vector< block_hash_type > hashes;

   frame_sequence to_frames()const;
   static block_hashes from_frames( const frame_sequence& body );

   friend bool operator==( const block_hashes& a, const block_hashes& b ) { return a.hashes == b.hashes; }
};

struct tx_ids
{
   static constexpr message_type type = message_type::tx_ids;

   address_type              sender = {};
   std::vector< tx_id_type > ids;

   frame_sequence to_frames()const;
   static tx_ids from_frames( const frame_sequence& body );

   friend bool operator==( const tx_ids& a, const tx_ids& b ) { return a.sender == b.sender && a.ids == b.ids; }
};

struct get_blocks
{
   static constexpr message_type type = message_type::get_blocks;

   std::vector< block_hash_type > hashes;

   frame_sequence to_frames()const;
   static get_blocks from_frames( const frame_sequence& body );

   friend bool operator==( const get_blocks& a, const get_blocks& b ) { return a.hashes == b.hashes; }
};

struct get_txs
{
   static constexpr message_type type = message_type::get_txs;

   std::vector< tx_id_type > ids;

   frame_sequence to_frames()const;
   static get_txs from_frames( const frame_sequence& body );

   friend bool operator==( const get_txs& a, const get_txs& b ) { return a.ids == b.ids; }
};

struct blocks
{
   static constexpr message_type type = message_type::blocks;

   std::vector< variable_blob > payloads; ///< serialized blocks, opaque to the wire

   frame_sequence to_frames()const;
   static blocks from_frames( const frame_sequence& body );

   friend bool operator==( const blocks& a, const blocks& b ) { return a.payloads == b.payloads; }
};

struct tx
{
   static constexpr message_type type = message_type::tx;

   variable_blob payload; ///< serialized transaction, opaque to the wire

   frame_sequence to_frames()const;
   static tx from_frames( const frame_sequence& body );

   friend bool operator==( const tx& a, const tx& b ) { return a.payload == b.payload; }
};

struct get_recent_states
{
   static constexpr message_type type = message_type::get_recent_states;

   block_hash_type block_hash = {};

   frame_sequence to_frames()const;
   static get_recent_states from_frames( const frame_sequence& body );

   friend bool operator==( const get_recent_states& a, const get_recent_states& b ) { return a.block_hash == b.block_hash; }
};

void to_json( nlohmann::json& j, const ping& m );
void to_json( nlohmann::json& j, const pong& m );
void to_json( nlohmann::json& j, const peer_set_delta& m );
void to_json( nlohmann::json& j, const get_block_hashes& m );
void to_json( nlohmann::json& j, const block_hashes& m );
void to_json( nlohmann::json& j, const tx_ids& m );
void to_json( nlohmann::json& j, const get_blocks& m );
void to_json( nlohmann::json& j, const get_txs& m );
void to_json( nlohmann::json& j, const blocks& m );
void to_json( nlohmann::json& j, const tx& m );
void to_json( nlohmann::json& j, const get_recent_states& m );

} // meshwire::net
