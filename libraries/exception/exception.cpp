#include <meshwire/exception.hpp>

#include <sstream>

namespace meshwire {

namespace detail {

namespace {

constexpr const char* placeholder_open = "${";

// Strings are spliced in as text, anything else as compact json
std::string placeholder_text( const nlohmann::json& value )
{
   if ( value.is_string() )
      return value.get< std::string >();
   return value.dump();
}

} // anonymous

std::string json_strpolate( const std::string& format, const nlohmann::json& context )
{
   std::string result;
   result.reserve( format.size() );

   std::size_t pos = 0;
   while ( pos < format.size() )
   {
      std::size_t open = format.find( placeholder_open, pos );
      if ( open == std::string::npos )
         break;

      result.append( format, pos, open - pos );
      std::size_t key_start = open + 2;

      if ( key_start < format.size() && format[ key_start ] == '$' )
      {
         result += placeholder_open;
         pos = key_start + 1;
         continue;
      }

      std::size_t close = format.find( '}', key_start );
      if ( close == std::string::npos )
      {
         pos = open;
         break;
      }

      auto itr = context.find( format.substr( key_start, close - key_start ) );
      if ( itr != context.end() )
         result += placeholder_text( *itr );
      else
         result.append( format, open, close - open + 1 );

      pos = close + 1;
   }

   if ( pos < format.size() )
      result.append( format, pos, std::string::npos );

   return result;
}

context_capture::context_capture( exception& e ) :
   _e( e )
{}

} // detail

exception::exception() :
   exception( std::string() )
{}

exception::exception( std::string format ) :
   _format( std::move( format ) )
{
   *this << detail::json_info( nlohmann::json::object() );
   render();
}

const char* exception::what()const noexcept
{
   return _message.c_str();
}

const std::string& exception::get_message()const
{
   return _message;
}

const nlohmann::json& exception::get_json()const
{
   return *boost::get_error_info< detail::json_info >( *this );
}

std::string exception::get_stacktrace()const
{
   std::stringstream ss;
   if ( const auto* trace = boost::get_error_info< detail::exception_stacktrace >( *this ) )
      ss << *trace;
   return ss.str();
}

nlohmann::json& exception::context()
{
   return *boost::get_error_info< detail::json_info >( *this );
}

void exception::render()
{
   _message = detail::json_strpolate( _format, context() );
}

} // meshwire
