#pragma once

#include <boost/exception/all.hpp>
#include <boost/stacktrace.hpp>

#include <nlohmann/json.hpp>

#include <meshwire/log.hpp>

#include <string>

// Turns a bubble list ("key", value)("key", value) into calls on `capture`
#define _DETAIL_MESHWIRE_CAPTURE( ... ) capture __VA_ARGS__

#define MESHWIRE_THROW( exc_name, msg, ... )                                           \
   do {                                                                                \
      exc_name _meshwire_e( msg );                                                     \
      meshwire::detail::context_capture capture( _meshwire_e );                        \
      _DETAIL_MESHWIRE_CAPTURE( __VA_ARGS__ );                                         \
      BOOST_THROW_EXCEPTION( _meshwire_e                                               \
         << meshwire::detail::exception_stacktrace( boost::stacktrace::stacktrace() ) ); \
   } while ( 0 )

#define MESHWIRE_ASSERT( cond, exc_name, msg, ... )     \
   do {                                                 \
      if ( !(cond) )                                    \
      {                                                 \
         MESHWIRE_THROW( exc_name, msg, __VA_ARGS__ );  \
      }                                                 \
   } while ( 0 )

// Adds context to a meshwire exception on its way up the stack
#define MESHWIRE_CAPTURE_CATCH_AND_RETHROW( ... )                   \
   catch ( meshwire::exception& _meshwire_e )                       \
   {                                                                \
      meshwire::detail::context_capture capture( _meshwire_e );     \
      _DETAIL_MESHWIRE_CAPTURE( __VA_ARGS__ );                      \
      throw;                                                        \
   }

#define MESHWIRE_CATCH_LOG_AND_RETHROW( log_level )                         \
   catch ( meshwire::exception& _meshwire_e )                               \
   {                                                                        \
      LOG( log_level ) << boost::diagnostic_information( _meshwire_e );     \
      throw;                                                                \
   }

#define MESHWIRE_DECLARE_EXCEPTION( exc_name )        \
   struct exc_name : public meshwire::exception       \
   {                                                  \
      using meshwire::exception::exception;           \
   };

#define MESHWIRE_DECLARE_DERIVED_EXCEPTION( exc_name, base ) \
   struct exc_name : public base                             \
   {                                                         \
      using base::base;                                      \
   };

namespace meshwire {

namespace detail { class context_capture; }

/**
 * Base of every meshwire error.
 *
 * An exception carries a json context next to its message. The message is
 * built from a format string whose ${key} placeholders are replaced by the
 * matching context values, and is rebuilt each time context is added. A
 * placeholder with no matching key is left as written. ${$ stands for a
 * literal ${.
 */
class exception : virtual public boost::exception, virtual public std::exception
{
   public:
      exception();
      explicit exception( std::string format );

      const char* what()const noexcept override;

      const std::string& get_message()const;
      const nlohmann::json& get_json()const;
      std::string get_stacktrace()const;

   private:
      friend class detail::context_capture;

      nlohmann::json& context();
      void render();

      std::string _format;
      std::string _message;
};

namespace detail {

using json_info            = boost::error_info< struct json_tag, nlohmann::json >;
using exception_stacktrace = boost::error_info< struct stacktrace_tag, boost::stacktrace::stacktrace >;

std::string json_strpolate( const std::string& format, const nlohmann::json& context );

class context_capture
{
   public:
      explicit context_capture( exception& e );

      template< typename T >
      context_capture& operator()( const std::string& key, const T& value )
      {
         _e.context()[ key ] = value;
         _e.render();
         return *this;
      }

   private:
      exception& _e;
};

} // detail

} // meshwire
