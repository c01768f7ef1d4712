#include <boost/test/unit_test.hpp>

#include <meshwire/exception.hpp>
#include <meshwire/net/frame.hpp>
#include <meshwire/util/hex.hpp>

#include <string>

MESHWIRE_DECLARE_EXCEPTION( lookup_error );
MESHWIRE_DECLARE_DERIVED_EXCEPTION( missing_account, lookup_error );

struct exception_fixture
{
   meshwire::net::frame_sequence frames{ meshwire::net::frame( meshwire::block_hash_size, 'a' ) };
};

BOOST_FIXTURE_TEST_SUITE( exception_tests, exception_fixture )

BOOST_AUTO_TEST_CASE( reader_context_test )
{ try {
   BOOST_TEST_MESSAGE( "Running out of frames reports what was expected and where" );

   meshwire::net::frame_reader reader( frames );
   reader.next( "block hash" );

   try
   {
      reader.next( "account count" );
      BOOST_FAIL( "expected truncated_payload" );
   }
   catch ( const meshwire::net::truncated_payload& e )
   {
      BOOST_CHECK_EQUAL( e.get_message(), "expected account count frame at position 1, but the message has only 1 frames" );
      BOOST_CHECK_EQUAL( std::string( e.what() ), e.get_message() );
      BOOST_CHECK_EQUAL( e.get_json().at( "what" ).get< std::string >(), "account count" );
      BOOST_CHECK_EQUAL( e.get_json().at( "pos" ).get< std::size_t >(), 1u );
      BOOST_CHECK_EQUAL( e.get_json().at( "n" ).get< std::size_t >(), 1u );
      BOOST_CHECK( !e.get_stacktrace().empty() );
   }

   BOOST_TEST_MESSAGE( "A frame of the wrong width is caught through every base" );

   meshwire::net::frame_sequence short_hash{ meshwire::net::frame( meshwire::block_hash_size - 1, 'a' ) };

   BOOST_CHECK_THROW( meshwire::net::frame_reader( short_hash ).read_fixed< meshwire::block_hash_size >( "block hash" ), meshwire::net::malformed_frame );
   BOOST_CHECK_THROW( meshwire::net::frame_reader( short_hash ).read_fixed< meshwire::block_hash_size >( "block hash" ), meshwire::net::message_exception );
   BOOST_CHECK_THROW( meshwire::net::frame_reader( short_hash ).read_fixed< meshwire::block_hash_size >( "block hash" ), meshwire::exception );

   try
   {
      meshwire::net::frame_reader( short_hash ).read_fixed< meshwire::block_hash_size >( "block hash" );
      BOOST_FAIL( "expected malformed_frame" );
   }
   catch ( const meshwire::exception& e )
   {
      BOOST_CHECK_EQUAL( e.get_message(), "block hash frame at position 0 is 31 bytes, expected 32" );
      BOOST_CHECK_EQUAL( e.get_json().at( "size" ).get< std::size_t >(), 31u );
   }
} MESHWIRE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( capture_test )
{ try {
   BOOST_TEST_MESSAGE( "Context added while unwinding rebuilds the message from its format" );

   meshwire::net::frame_reader reader( frames );

   try
   {
      try
      {
         reader.next( "block hash" );
         reader.read_int32( "account count" );
      }
      MESHWIRE_CAPTURE_CATCH_AND_RETHROW( ("frame_count", frames.size())("what", "trail length") )

      BOOST_FAIL( "expected truncated_payload" );
   }
   catch ( const meshwire::net::truncated_payload& e )
   {
      BOOST_CHECK_EQUAL( e.get_json().at( "frame_count" ).get< std::size_t >(), 1u );
      BOOST_CHECK_EQUAL( e.get_json().at( "what" ).get< std::string >(), "trail length" );
      BOOST_CHECK_EQUAL( e.get_message(), "expected trail length frame at position 1, but the message has only 1 frames" );
   }

   BOOST_TEST_MESSAGE( "A placeholder missing at throw time is filled by a later capture" );

   try
   {
      try
      {
         try
         {
            MESHWIRE_THROW( missing_account, "account ${address} has no state in ${block}", ("address", "0a0b") );
         }
         catch ( const missing_account& e )
         {
            BOOST_CHECK_EQUAL( e.get_message(), "account 0a0b has no state in ${block}" );
            throw;
         }
      }
      MESHWIRE_CAPTURE_CATCH_AND_RETHROW( ("block", "ff01") )
   }
   catch ( const lookup_error& e )
   {
      BOOST_CHECK_EQUAL( e.get_message(), "account 0a0b has no state in ff01" );
      BOOST_CHECK_EQUAL( e.get_json().size(), 2u );
   }
} MESHWIRE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( placeholder_test )
{ try {
   using meshwire::detail::json_strpolate;

   nlohmann::json context;
   context["count"] = -1;
   context["hash"]  = "00ff";
   context["trail"] = nlohmann::json::array( { 1, 2 } );
   context["inner"] = "${count}";

   BOOST_TEST_MESSAGE( "Strings are spliced without quotes, other values as json" );
   BOOST_CHECK_EQUAL( json_strpolate( "block ${hash} count ${count} trail ${trail}", context ), "block 00ff count -1 trail [1,2]" );

   BOOST_TEST_MESSAGE( "Unknown keys and unterminated placeholders stay as written" );
   BOOST_CHECK_EQUAL( json_strpolate( "${address} in ${hash}", context ), "${address} in 00ff" );
   BOOST_CHECK_EQUAL( json_strpolate( "block ${hash", context ), "block ${hash" );
   BOOST_CHECK_EQUAL( json_strpolate( "trailing ${", context ), "trailing ${" );
   BOOST_CHECK_EQUAL( json_strpolate( "cost $5 {x}", context ), "cost $5 {x}" );

   BOOST_TEST_MESSAGE( "${$ escapes a literal placeholder" );
   BOOST_CHECK_EQUAL( json_strpolate( "write ${$hash} to get ${hash}", context ), "write ${hash} to get 00ff" );

   BOOST_TEST_MESSAGE( "Substituted text is not expanded again" );
   BOOST_CHECK_EQUAL( json_strpolate( "inner ${inner}", context ), "inner ${count}" );

   BOOST_TEST_MESSAGE( "Substitution is applied to thrown messages" );
   try
   {
      MESHWIRE_THROW( lookup_error, "trail ${trail} for ${hash} (${$raw})", ("trail", context["trail"])("hash", "00ff") );
   }
   catch ( const lookup_error& e )
   {
      BOOST_CHECK_EQUAL( e.get_message(), "trail [1,2] for 00ff (${raw})" );
   }
} MESHWIRE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( library_errors_test )
{ try {
   BOOST_TEST_MESSAGE( "Errors raised by the utility libraries carry their context" );

   try
   {
      meshwire::util::from_hex( "abc" );
      BOOST_FAIL( "expected invalid_hex" );
   }
   catch ( const meshwire::util::invalid_hex& e )
   {
      BOOST_CHECK( e.get_json().size() > 0 );
      BOOST_CHECK( e.get_message().find( "${" ) == std::string::npos );
      BOOST_CHECK( !e.get_stacktrace().empty() );
   }

   BOOST_TEST_MESSAGE( "Log and rethrow keeps the original type" );

   auto rethrow = []()
   {
      { try {
         MESHWIRE_THROW( missing_account, "account ${a} is missing", ("a", 7) );
      } MESHWIRE_CATCH_LOG_AND_RETHROW(debug) }
   };

   BOOST_CHECK_THROW( rethrow(), missing_account );
} MESHWIRE_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
