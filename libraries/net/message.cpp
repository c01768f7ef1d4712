#include <meshwire/net/message.hpp>
#include <meshwire/net/registry.hpp>

#include <meshwire/crypto/multihash.hpp>
#include <meshwire/log.hpp>
#include <meshwire/util.hpp>
#include <meshwire/util/hex.hpp>

#include <cstring>
#include <iterator>

namespace meshwire::net {

namespace detail {

bool verify_envelope( const frame& public_key_frame, const frame& signature_frame, const frame_sequence& raw, std::size_t header_size )
{
   crypto::compressed_public_key cpk;
   crypto::recoverable_signature sig;

   if ( public_key_frame.size() != cpk.size() || signature_frame.size() != sig.size() )
      return false;

   std::memcpy( cpk.data(), public_key_frame.data(), cpk.size() );
   std::memcpy( sig.data(), signature_frame.data(), sig.size() );

   crypto::public_key key;
   try
   {
      key = crypto::public_key::deserialize( cpk );
   }
   catch ( const crypto::key_serialization_error& )
   {
      return false;
   }

   auto digest = crypto::hash( crypto::multicodec::sha2_256, concat( raw, header_size ) );
   return key.verify( sig, digest );
}

} // detail

message::message( message_body body, std::optional< identity_type > identity ) :
   _body( std::move( body ) ),
   _identity( std::move( identity ) )
{}

message_type message::type()const
{
   return type_of( _body );
}

const message_body& message::body()const
{
   return _body;
}

const std::optional< identity_type >& message::identity()const
{
   return _identity;
}

frame_sequence message::body_frames( const state_codec& codec )const
{
   return std::visit(
      meshwire::overloaded {
         [&]( const recent_states& m ) { return m.to_frames( codec ); },
         [&]( const auto& m ) { return m.to_frames(); }
      }, _body );
}

frame_sequence message::to_frames( const crypto::private_key& key, const state_codec& codec )const
{
   frame_sequence body = body_frames( codec );

   auto digest = crypto::hash( crypto::multicodec::sha2_256, concat( body ) );
   auto signature = key.sign_compact( digest );

   frame_sequence frames;
   frames.reserve( body.size() + request_header_size );

   if ( _identity )
      frames.push_back( *_identity );

   frames.push_back( frame{ char( type() ) } );
   frames.push_back( make_frame( key.get_public_key().serialize() ) );
   frames.push_back( make_frame( signature ) );
   std::move( body.begin(), body.end(), std::back_inserter( frames ) );

   return frames;
}

message message::parse( const frame_sequence& raw, bool reply, const state_codec& codec )
{ try {
   MESHWIRE_ASSERT( !raw.empty(), empty_message, "cannot parse an empty message" );

   std::size_t header_size = reply ? reply_header_size : request_header_size;
   MESHWIRE_ASSERT( raw.size() >= header_size, truncated_payload,
      "message of ${n} frames is shorter than its ${h} frame header", ("n", raw.size())("h", header_size) );

   const frame& type_frame = raw[ header_size - 3 ];
   const frame& public_key_frame = raw[ header_size - 2 ];
   const frame& signature_frame = raw[ header_size - 1 ];

   MESHWIRE_ASSERT( type_frame.size() == 1, malformed_frame,
      "type frame is ${n} bytes, expected 1", ("n", type_frame.size()) );
   uint8_t tag = uint8_t( type_frame[0] );

   MESHWIRE_ASSERT( detail::verify_envelope( public_key_frame, signature_frame, raw, header_size ), invalid_signature,
      "the message signature is invalid", ("type", uint32_t( tag )) );

   const message_decoder* decoder = message_registry::instance().find( tag );
   MESHWIRE_ASSERT( decoder, unknown_message_type, "cannot determine message type ${type}", ("type", uint32_t( tag )) );

   frame_sequence body( raw.begin() + header_size, raw.end() );

   std::optional< identity_type > identity;
   if ( !reply )
      identity = raw[0];

   message_body decoded;
   try
   {
      decoded = (*decoder)( body, codec );
   }
   MESHWIRE_CAPTURE_CATCH_AND_RETHROW( ("type", to_string( message_type( tag ) ))("body_frames", body.size()) )

   return message( std::move( decoded ), std::move( identity ) );
} MESHWIRE_CATCH_LOG_AND_RETHROW( debug ) }

message_type type_of( const message_body& body )
{
   return std::visit( []( const auto& m ) { return std::decay_t< decltype( m ) >::type; }, body );
}

void to_json( nlohmann::json& j, const message& m )
{
   j["type"] = to_string( m.type() );

   if ( m.identity() )
      j["identity"] = util::to_hex( *m.identity() );

   std::visit( [&]( const auto& b ) { j["body"] = b; }, m.body() );
}

} // meshwire::net
