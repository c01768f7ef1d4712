#include <meshwire/net/messages.hpp>

#include <meshwire/util/hex.hpp>

namespace meshwire::net {

namespace detail {

template< std::size_t N >
void append_fixed_list( frame_sequence& frames, const std::vector< fixed_blob< N > >& items )
{
   frames.push_back( make_frame( int32_t( items.size() ) ) );
   for ( const auto& item : items )
      frames.push_back( make_frame( item ) );
}

template< std::size_t N >
std::vector< fixed_blob< N > > read_fixed_list( frame_reader& reader, const char* what )
{
   std::size_t count = reader.read_count( what );
   reader.require( count, what );

   std::vector< fixed_blob< N > > items;
   items.reserve( count );
   for ( std::size_t i = 0; i < count; i++ )
      items.push_back( reader.read_fixed< N >( what ) );

   return items;
}

template< std::size_t N >
nlohmann::json hex_list( const std::vector< fixed_blob< N > >& items )
{
   nlohmann::json j = nlohmann::json::array();
   for ( const auto& item : items )
      j.push_back( util::to_hex( item ) );
   return j;
}

} // detail

frame_sequence ping::to_frames()const
{
   return {};
}

ping ping::from_frames( const frame_sequence& body )
{
   frame_reader( body ).finish( "ping" );
   return ping{};
}

frame_sequence pong::to_frames()const
{
   return {};
}

pong pong::from_frames( const frame_sequence& body )
{
   frame_reader( body ).finish( "pong" );
   return pong{};
}

frame_sequence peer_set_delta::to_frames()const
{
   return { delta };
}

peer_set_delta peer_set_delta::from_frames( const frame_sequence& body )
{
   frame_reader reader( body );
   peer_set_delta m;
   m.delta = reader.read_blob( "peer set delta" );
   reader.finish( "peer set delta" );
   return m;
}

frame_sequence get_block_hashes::to_frames()const
{
   frame_sequence frames;
   detail::append_fixed_list( frames, locator );

   // An empty frame stands for "no stop hash"
   if ( stop )
      frames.push_back( make_frame( *stop ) );
   else
      frames.emplace_back();

   return frames;
}

get_block_hashes get_block_hashes::from_frames( const frame_sequence& body )
{
   frame_reader reader( body );
   get_block_hashes m;
   m.locator = detail::read_fixed_list< block_hash_size >( reader, "block locator" );

   reader.require( 1, "stop hash" );
   if ( body[ reader.position() ].empty() )
      reader.next( "stop hash" );
   else
      m.stop = reader.read_fixed< block_hash_size >( "stop hash" );

   reader.finish( "get block hashes" );
   return m;
}

frame_sequence block_hashes::to_frames()const
{
   frame_sequence frames;
   detail::append_fixed_list( frames, hashes );
   return frames;
}

block_hashes block_hashes::from_frames( const frame_sequence& body )
{
   frame_reader reader( body );
   block_hashes m;
   m.hashes = detail::read_fixed_list< block_hash_size >( reader, "block hash" );
   reader.finish( "block hashes" );
   return m;
}

frame_sequence tx_ids::to_frames()const
{
   frame_sequence frames;
   frames.push_back( make_frame( sender ) );
   detail::append_fixed_list( frames, ids );
   return frames;
}

tx_ids tx_ids::from_frames( const frame_sequence& body )
{
   frame_reader reader( body );
   tx_ids m;
   m.sender = reader.read_fixed< address_size >( "sender address" );
   m.ids = detail::read_fixed_list< tx_id_size >( reader, "transaction id" );
   reader.finish( "tx ids" );
   return m;
}

frame_sequence get_blocks::to_frames()const
{
   frame_sequence frames;
   detail::append_fixed_list( frames, hashes );
   return frames;
}

get_blocks get_blocks::from_frames( const frame_sequence& body )
{
   frame_reader reader( body );
   get_blocks m;
   m.hashes = detail::read_fixed_list< block_hash_size >( reader, "block hash" );
   reader.finish( "get blocks" );
   return m;
}

frame_sequence get_txs::to_frames()const
{
   frame_sequence frames;
   detail::append_fixed_list( frames, ids );
   return frames;
}

get_txs get_txs::from_frames( const frame_sequence& body )
{
   frame_reader reader( body );
   get_txs m;
   m.ids = detail::read_fixed_list< tx_id_size >( reader, "transaction id" );
   reader.finish( "get txs" );
   return m;
}

frame_sequence blocks::to_frames()const
{
   frame_sequence frames;
   frames.reserve( payloads.size() + 1 );
   frames.push_back( make_frame( int32_t( payloads.size() ) ) );
   for ( const auto& p : payloads )
      frames.push_back( p );
   return frames;
}

blocks blocks::from_frames( const frame_sequence& body )
{
   frame_reader reader( body );
   blocks m;

   std::size_t count = reader.read_count( "block count" );
   reader.require( count, "block count" );

   m.payloads.reserve( count );
   for ( std::size_t i = 0; i < count; i++ )
      m.payloads.push_back( reader.read_blob( "block" ) );

   reader.finish( "blocks" );
   return m;
}

frame_sequence tx::to_frames()const
{
   return { payload };
}

tx tx::from_frames( const frame_sequence& body )
{
   frame_reader reader( body );
   tx m;
   m.payload = reader.read_blob( "transaction" );
   reader.finish( "tx" );
   return m;
}

frame_sequence get_recent_states::to_frames()const
{
   return { make_frame( block_hash ) };
}

get_recent_states get_recent_states::from_frames( const frame_sequence& body )
{
   frame_reader reader( body );
   get_recent_states m;
   m.block_hash = reader.read_fixed< block_hash_size >( "block hash" );
   reader.finish( "get recent states" );
   return m;
}

void to_json( nlohmann::json& j, const ping& )
{
   j = nlohmann::json::object();
}

void to_json( nlohmann::json& j, const pong& )
{
   j = nlohmann::json::object();
}

void to_json( nlohmann::json& j, const peer_set_delta& m )
{
   j["delta"] = util::to_hex( m.delta );
}

void to_json( nlohmann::json& j, const get_block_hashes& m )
{
   j["locator"] = detail::hex_list( m.locator );
   if ( m.stop )
      j["stop"] = util::to_hex( *m.stop );
   else
      j["stop"] = nullptr;
}

void to_json( nlohmann::json& j, const block_hashes& m )
{
   j["hashes"] = detail::hex_list( m.hashes );
}

void to_json( nlohmann::json& j, const tx_ids& m )
{
   j["sender"] = util::to_hex( m.sender );
   j["ids"] = detail::hex_list( m.ids );
}

void to_json( nlohmann::json& j, const get_blocks& m )
{
   j["hashes"] = detail::hex_list( m.hashes );
}

void to_json( nlohmann::json& j, const get_txs& m )
{
   j["ids"] = detail::hex_list( m.ids );
}

void to_json( nlohmann::json& j, const blocks& m )
{
   j["payloads"] = nlohmann::json::array();
   for ( const auto& p : m.payloads )
      j["payloads"].push_back( util::to_hex( p ) );
}

void to_json( nlohmann::json& j, const tx& m )
{
   j["payload"] = util::to_hex( m.payload );
}

void to_json( nlohmann::json& j, const get_recent_states& m )
{
   j["block_hash"] = util::to_hex( m.block_hash );
}

} // meshwire::net
