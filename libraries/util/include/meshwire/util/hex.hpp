#pragma once

#include <meshwire/exception.hpp>

#include <string>
#include <vector>

namespace meshwire::util {

MESHWIRE_DECLARE_EXCEPTION( invalid_hex );

inline std::string to_hex( const char* data, std::size_t len )
{
   static const char hex[16] = {'0','1','2','3','4','5','6','7','8','9','a','b','c','d','e','f'};

   std::string s;
   s.reserve( len * 2 );

   for ( std::size_t i = 0; i < len; i++ )
   {
      s += hex[(data[i] & 0xF0) >> 4];
      s += hex[data[i] & 0x0F];
   }

   return s;
}

template< typename Blob >
std::string to_hex( const Blob& b )
{
   return to_hex( reinterpret_cast< const char* >( b.data() ), b.size() );
}

inline char from_hex_digit( char c )
{
   if ( c >= '0' && c <= '9' ) return c - '0';
   if ( c >= 'a' && c <= 'f' ) return c - 'a' + 10;
   if ( c >= 'A' && c <= 'F' ) return c - 'A' + 10;
   MESHWIRE_THROW( invalid_hex, "invalid hex digit '${c}'", ("c", std::string( 1, c )) );
}

inline std::vector< char > from_hex( const std::string& s )
{
   MESHWIRE_ASSERT( s.size() % 2 == 0, invalid_hex, "hex string has odd length ${n}", ("n", s.size()) );

   std::vector< char > result;
   result.reserve( s.size() / 2 );

   for ( std::size_t i = 0; i < s.size(); i += 2 )
      result.push_back( char( ( from_hex_digit( s[i] ) << 4 ) | from_hex_digit( s[i+1] ) ) );

   return result;
}

} // meshwire::util
