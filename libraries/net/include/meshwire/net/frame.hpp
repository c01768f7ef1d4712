#pragma once
#include <meshwire/net/exceptions.hpp>
#include <meshwire/types/types.hpp>

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace meshwire::net {

using frame          = variable_blob;
using frame_sequence = std::vector< frame >;

constexpr std::size_t int_frame_size = 4;

// Integers travel as 4 byte big endian two's complement
frame make_frame( int32_t v );

template< std::size_t N >
frame make_frame( const fixed_blob< N >& b )
{
   return frame( b.begin(), b.end() );
}

int32_t frame_to_int32( const frame& f );

/**
 * The exact byte concatenation of frames [from, end). This is what a
 * message signature covers.
 */
variable_blob concat( const frame_sequence& frames, std::size_t from = 0 );

/**
 * Positional reader over a frame sequence.
 *
 * Running out of frames throws truncated_payload, a frame of the wrong
 * width throws malformed_frame. The reader never reads past the end of
 * the sequence.
 */
class frame_reader
{
   public:
      frame_reader( const frame_sequence& frames, std::size_t pos = 0 );

      const frame& next( const char* what );

      int32_t     read_int32( const char* what );
      std::size_t read_count( const char* what );
      frame       read_blob( const char* what );

      template< std::size_t N >
      fixed_blob< N > read_fixed( const char* what )
      {
         const frame& f = next( what );
         MESHWIRE_ASSERT( f.size() == N, malformed_frame,
            "${what} frame at position ${pos} is ${size} bytes, expected ${n}",
            ("what", what)("pos", _pos - 1)("size", f.size())("n", N) );
         fixed_blob< N > b;
         std::memcpy( b.data(), f.data(), N );
         return b;
      }

      /**
       * Throws truncated_payload unless at least n frames remain.
       */
      void require( std::size_t n, const char* what )const;

      /**
       * Ends a decode. Frames left over after a complete payload are
       * accepted and logged at warning.
       */
      void finish( const char* what )const;

      std::size_t remaining()const;
      std::size_t position()const;
      bool        empty()const;

   private:
      const frame_sequence& _frames;
      std::size_t           _pos;
};

} // meshwire::net
