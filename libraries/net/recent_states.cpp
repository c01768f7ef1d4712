#include <meshwire/net/recent_states.hpp>

#include <meshwire/util/hex.hpp>

#include <exception>
#include <set>

namespace meshwire::net {

recent_states::recent_states( const block_hash_type& block_hash ) :
   _block_hash( block_hash ),
   _missing( true )
{}

recent_states::recent_states( const block_hash_type& block_hash, block_states states, state_references refs ) :
   _block_hash( block_hash ),
   _missing( false ),
   _states( std::move( states ) ),
   _references( std::move( refs ) )
{
   validate();
}

void recent_states::validate()const
{
   std::set< block_hash_type > referenced;
   for ( const auto& [ address, trail ] : _references )
      referenced.insert( trail.begin(), trail.end() );

   for ( const auto& entry : _states )
   {
      MESHWIRE_ASSERT( referenced.count( entry.first ), inconsistent_payload,
         "block states of ${hash} are not referenced by any account", ("hash", util::to_hex( entry.first )) );
   }
}

const block_hash_type& recent_states::block_hash()const
{
   return _block_hash;
}

bool recent_states::missing()const
{
   return _missing;
}

const block_states& recent_states::states()const
{
   return _states;
}

const state_references& recent_states::references()const
{
   return _references;
}

frame_sequence recent_states::to_frames( const state_codec& codec )const
{
   frame_sequence frames;
   frames.push_back( make_frame( _block_hash ) );

   if ( _missing )
   {
      frames.push_back( make_frame( missing_sentinel ) );
      return frames;
   }

   frames.push_back( make_frame( int32_t( _references.size() ) ) );
   for ( const auto& [ address, trail ] : _references )
   {
      frames.push_back( make_frame( address ) );
      frames.push_back( make_frame( int32_t( trail.size() ) ) );
      for ( const auto& hash : trail )
         frames.push_back( make_frame( hash ) );
   }

   frames.push_back( make_frame( int32_t( _states.size() ) ) );
   for ( const auto& [ hash, accounts ] : _states )
   {
      frames.push_back( make_frame( hash ) );
      frames.push_back( make_frame( int32_t( accounts.size() ) ) );
      for ( const auto& [ address, value ] : accounts )
      {
         frames.push_back( make_frame( address ) );
         frames.push_back( codec.serialize( value ) );
      }
   }

   return frames;
}

recent_states recent_states::from_frames( const frame_sequence& body, const state_codec& codec )
{
   frame_reader reader( body );

   auto block_hash = reader.read_fixed< block_hash_size >( "block hash" );
   int32_t account_count = reader.read_int32( "account count" );

   if ( account_count == missing_sentinel )
   {
      reader.finish( "missing recent states" );
      return recent_states( block_hash );
   }

   MESHWIRE_ASSERT( account_count >= 0, malformed_frame,
      "account count ${n} is neither a count nor the missing sentinel", ("n", account_count) );

   // Every account takes at least an address and a trail length
   reader.require( std::size_t( account_count ) * 2, "account count" );

   state_references refs;
   for ( int32_t i = 0; i < account_count; i++ )
   {
      auto address = reader.read_fixed< address_size >( "account address" );
      std::size_t trail_length = reader.read_count( "state reference count" );
      reader.require( trail_length, "state reference count" );

      std::vector< block_hash_type > trail;
      trail.reserve( trail_length );
      for ( std::size_t j = 0; j < trail_length; j++ )
         trail.push_back( reader.read_fixed< block_hash_size >( "state reference" ) );

      bool inserted = refs.emplace( address, std::move( trail ) ).second;
      MESHWIRE_ASSERT( inserted, inconsistent_payload,
         "account ${a} has more than one state reference trail", ("a", util::to_hex( address )) );
   }

   std::size_t snapshot_count = reader.read_count( "snapshot count" );
   reader.require( snapshot_count * 2, "snapshot count" );

   block_states states;
   for ( std::size_t i = 0; i < snapshot_count; i++ )
   {
      auto hash = reader.read_fixed< block_hash_size >( "snapshot block hash" );
      std::size_t pair_count = reader.read_count( "account state count" );
      reader.require( pair_count * 2, "account state count" );

      account_states accounts;
      for ( std::size_t j = 0; j < pair_count; j++ )
      {
         auto address = reader.read_fixed< address_size >( "state address" );
         const frame& blob = reader.next( "account state" );

         state_value value;
         try
         {
            value = codec.deserialize( blob );
         }
         catch ( const message_exception& )
         {
            throw;
         }
         catch ( const std::exception& e )
         {
            MESHWIRE_THROW( malformed_frame,
               "account state at position ${pos} could not be decoded: ${reason}",
               ("pos", reader.position() - 1)("reason", e.what()) );
         }

         bool inserted = accounts.emplace( address, std::move( value ) ).second;
         MESHWIRE_ASSERT( inserted, inconsistent_payload,
            "account ${a} appears twice in the snapshot of ${h}",
            ("a", util::to_hex( address ))("h", util::to_hex( hash )) );
      }

      bool inserted = states.emplace( hash, std::move( accounts ) ).second;
      MESHWIRE_ASSERT( inserted, inconsistent_payload,
         "block ${h} has more than one snapshot", ("h", util::to_hex( hash )) );
   }

   reader.finish( "recent states" );

   return recent_states( block_hash, std::move( states ), std::move( refs ) );
}

void to_json( nlohmann::json& j, const recent_states& m )
{
   j["block_hash"] = util::to_hex( m.block_hash() );
   j["missing"] = m.missing();

   if ( m.missing() )
      return;

   j["references"] = nlohmann::json::object();
   for ( const auto& [ address, trail ] : m.references() )
   {
      auto& jt = j["references"][ util::to_hex( address ) ];
      jt = nlohmann::json::array();
      for ( const auto& hash : trail )
         jt.push_back( util::to_hex( hash ) );
   }

   j["states"] = nlohmann::json::object();
   for ( const auto& [ hash, accounts ] : m.states() )
   {
      auto& js = j["states"][ util::to_hex( hash ) ];
      js = nlohmann::json::object();
      for ( const auto& [ address, value ] : accounts )
         js[ util::to_hex( address ) ] = value;
   }
}

} // meshwire::net
