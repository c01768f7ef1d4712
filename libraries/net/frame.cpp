#include <meshwire/net/frame.hpp>

#include <meshwire/log.hpp>

namespace meshwire::net {

frame make_frame( int32_t v )
{
   uint32_t u = uint32_t( v );
   return frame{
      char( ( u >> 24 ) & 0xFF ),
      char( ( u >> 16 ) & 0xFF ),
      char( ( u >>  8 ) & 0xFF ),
      char(   u         & 0xFF )
   };
}

int32_t frame_to_int32( const frame& f )
{
   MESHWIRE_ASSERT( f.size() == int_frame_size, malformed_frame,
      "integer frame is ${size} bytes, expected ${n}", ("size", f.size())("n", int_frame_size) );

   uint32_t u = ( uint32_t( uint8_t( f[0] ) ) << 24 )
              | ( uint32_t( uint8_t( f[1] ) ) << 16 )
              | ( uint32_t( uint8_t( f[2] ) ) <<  8 )
              |   uint32_t( uint8_t( f[3] ) );
   return int32_t( u );
}

variable_blob concat( const frame_sequence& frames, std::size_t from )
{
   std::size_t total = 0;
   for ( std::size_t i = from; i < frames.size(); i++ )
      total += frames[i].size();

   variable_blob result;
   result.reserve( total );
   for ( std::size_t i = from; i < frames.size(); i++ )
      result.insert( result.end(), frames[i].begin(), frames[i].end() );

   return result;
}

frame_reader::frame_reader( const frame_sequence& frames, std::size_t pos ) :
   _frames( frames ),
   _pos( pos )
{}

const frame& frame_reader::next( const char* what )
{
   MESHWIRE_ASSERT( _pos < _frames.size(), truncated_payload,
      "expected ${what} frame at position ${pos}, but the message has only ${n} frames",
      ("what", what)("pos", _pos)("n", _frames.size()) );
   return _frames[ _pos++ ];
}

int32_t frame_reader::read_int32( const char* what )
{
   const frame& f = next( what );
   MESHWIRE_ASSERT( f.size() == int_frame_size, malformed_frame,
      "${what} frame at position ${pos} is ${size} bytes, expected ${n}",
      ("what", what)("pos", _pos - 1)("size", f.size())("n", int_frame_size) );
   return frame_to_int32( f );
}

std::size_t frame_reader::read_count( const char* what )
{
   int32_t count = read_int32( what );
   MESHWIRE_ASSERT( count >= 0, malformed_frame,
      "${what} at position ${pos} is negative (${count})", ("what", what)("pos", _pos - 1)("count", count) );
   return std::size_t( count );
}

frame frame_reader::read_blob( const char* what )
{
   return next( what );
}

void frame_reader::require( std::size_t n, const char* what )const
{
   MESHWIRE_ASSERT( remaining() >= n, truncated_payload,
      "${what} declares ${n} frames, but only ${remaining} remain",
      ("what", what)("n", n)("remaining", remaining()) );
}

void frame_reader::finish( const char* what )const
{
   if ( !empty() )
      LOG(warning) << "Ignoring " << remaining() << " trailing frames after a " << what << " body";
}

std::size_t frame_reader::remaining()const
{
   return _pos < _frames.size() ? _frames.size() - _pos : 0;
}

std::size_t frame_reader::position()const
{
   return _pos;
}

bool frame_reader::empty()const
{
   return remaining() == 0;
}

} // meshwire::net
