#include <meshwire/net/registry.hpp>

#include <boost/core/ignore_unused.hpp>

#include <type_traits>

namespace meshwire::net {

MESHWIRE_DECLARE_EXCEPTION( duplicate_message_type );

message_registry::message_registry()
{
   add_all( static_cast< const message_body* >( nullptr ) );
}

const message_registry& message_registry::instance()
{
   static const message_registry registry;
   return registry;
}

template< typename T >
void message_registry::add()
{
   auto decoder = []( const frame_sequence& body, const state_codec& codec ) -> message_body
   {
      if constexpr ( std::is_same_v< T, recent_states > )
      {
         return T::from_frames( body, codec );
      }
      else
      {
         boost::ignore_unused( codec );
         return T::from_frames( body );
      }
   };

   bool inserted = _decoders.emplace( uint8_t( T::type ), decoder ).second;
   MESHWIRE_ASSERT( inserted, duplicate_message_type,
      "message type ${t} is registered more than once", ("t", to_string( T::type )) );
}

template< typename... Ts >
void message_registry::add_all( const std::variant< Ts... >* )
{
   ( add< Ts >(), ... );
}

const message_decoder* message_registry::find( uint8_t tag )const
{
   auto itr = _decoders.find( tag );
   return itr != _decoders.end() ? &itr->second : nullptr;
}

bool message_registry::contains( uint8_t tag )const
{
   return _decoders.count( tag ) != 0;
}

std::size_t message_registry::size()const
{
   return _decoders.size();
}

} // meshwire::net
