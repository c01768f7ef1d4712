#pragma once
#include <meshwire/net/message.hpp>

#include <boost/container/flat_map.hpp>

#include <cstdint>
#include <functional>

namespace meshwire::net {

using message_decoder = std::function< message_body( const frame_sequence&, const state_codec& ) >;

/**
 * Maps a one byte type tag to the decoder of its message body.
 *
 * The process wide instance holds one decoder per alternative of
 * message_body. It is built on first use and never modified afterwards,
 * so it can be shared across threads without locking.
 */
class message_registry final
{
   public:
      static const message_registry& instance();

      const message_decoder* find( uint8_t tag )const;
      bool contains( uint8_t tag )const;
      std::size_t size()const;

   private:
      message_registry();

      template< typename T >
      void add();

      template< typename... Ts >
      void add_all( const std::variant< Ts... >* );

      boost::container::flat_map< uint8_t, message_decoder > _decoders;
};

} // meshwire::net
