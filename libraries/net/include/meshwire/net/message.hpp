#pragma once
#include <meshwire/crypto/elliptic.hpp>
#include <meshwire/net/frame.hpp>
#include <meshwire/net/message_type.hpp>
#include <meshwire/net/messages.hpp>
#include <meshwire/net/recent_states.hpp>
#include <meshwire/net/state_codec.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <variant>

namespace meshwire::net {

using message_body = std::variant<
   ping,
   pong,
   peer_set_delta,
   get_block_hashes,
   block_hashes,
   tx_ids,
   get_blocks,
   get_txs,
   blocks,
   tx,
   get_recent_states,
   recent_states
>;

using identity_type = variable_blob;

// Header widths, identity excluded: type tag, public key, signature
constexpr std::size_t reply_header_size   = 3;
constexpr std::size_t request_header_size = 4;

/**
 * A signed peer to peer message.
 *
 * Wire layout:
 *
 *    request direction: [identity] [type] [public_key] [signature] [body...]
 *    reply direction:              [type] [public_key] [signature] [body...]
 *
 * The signature covers the sha2-256 digest of the concatenated body frames
 * only. The identity is an opaque routing token of the transport.
 */
class message
{
   public:
      message( message_body body, std::optional< identity_type > identity = {} );

      message_type                          type()const;
      const message_body&                   body()const;
      const std::optional< identity_type >& identity()const;

      template< typename T >
      const T& get()const
      {
         return std::get< T >( _body );
      }

      template< typename T >
      bool is()const
      {
         return std::holds_alternative< T >( _body );
      }

      frame_sequence body_frames( const state_codec& codec = cbor_state_codec() )const;

      /**
       * Signs the body with key and prepends the envelope header.
       */
      frame_sequence to_frames( const crypto::private_key& key, const state_codec& codec = cbor_state_codec() )const;

      /**
       * Verifies and decodes a raw frame sequence.
       *
       * reply selects the header width: 3 frames for reply direction input,
       * 4 for request direction input whose first frame is the identity.
       * The signature is checked before the body is decoded.
       *
       * Throws empty_message, truncated_payload, malformed_frame,
       * invalid_signature, unknown_message_type or inconsistent_payload.
       */
      static message parse( const frame_sequence& raw, bool reply, const state_codec& codec = cbor_state_codec() );

      friend bool operator==( const message& a, const message& b )
      {
         return a._identity == b._identity && a._body == b._body;
      }

   private:
      message_body                   _body;
      std::optional< identity_type > _identity;
};

message_type type_of( const message_body& body );

void to_json( nlohmann::json& j, const message& m );

} // meshwire::net
