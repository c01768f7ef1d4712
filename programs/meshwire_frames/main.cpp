#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <nlohmann/json.hpp>

#include <meshwire/crypto/elliptic.hpp>
#include <meshwire/crypto/multihash.hpp>
#include <meshwire/exception.hpp>
#include <meshwire/log.hpp>
#include <meshwire/net/message.hpp>
#include <meshwire/util/hex.hpp>
#include <meshwire/util/options.hpp>

#define MESHWIRE_MAJOR_VERSION "0"
#define MESHWIRE_MINOR_VERSION "1"
#define MESHWIRE_PATCH_VERSION "0"

#define SERVICE_NAME                        "frames"

#define HELP_OPTION                         "help"
#define VERSION_OPTION                      "version"
#define BASEDIR_OPTION                      "basedir"
#define BASEDIR_DEFAULT                     ".meshwire"
#define LOG_LEVEL_OPTION                    "log-level"
#define LOG_LEVEL_DEFAULT                   "info"
#define LOG_COLOR_OPTION                    "log-color"
#define LOG_COLOR_DEFAULT                   true
#define REPLY_OPTION                        "reply"
#define INPUT_OPTION                        "input"
#define OUTPUT_OPTION                       "output"
#define SEED_OPTION                         "seed"
#define ENCODE_OPTION                       "encode"
#define DECODE_OPTION                       "decode"
#define BLOCK_HASH_OPTION                   "block-hash"
#define IDENTITY_OPTION                     "identity"

MESHWIRE_DECLARE_EXCEPTION( service_exception );
MESHWIRE_DECLARE_DERIVED_EXCEPTION( invalid_argument, service_exception );

namespace program_options = boost::program_options;
using namespace meshwire;

const std::string& version_string();
net::frame_sequence read_frames( std::istream& in );
void write_frames( std::ostream& out, const net::frame_sequence& frames );
net::message make_message( const std::string& kind, const std::string& block_hash, const std::string& identity );

int main( int argc, char** argv )
{
   int retcode = EXIT_SUCCESS;

   try
   {
      program_options::options_description options;
      options.add_options()
         (HELP_OPTION       ",h", "Print this help message and exit")
         (VERSION_OPTION    ",v", "Print version string and exit")
         (BASEDIR_OPTION    ",d", program_options::value< std::string >()->default_value( BASEDIR_DEFAULT ), "Base directory holding config.yml and logs")
         (LOG_LEVEL_OPTION  ",l", program_options::value< std::string >(), "The log filtering level")
         (LOG_COLOR_OPTION      , program_options::value< bool >(), "Colorize console log severity")
         (ENCODE_OPTION     ",e", program_options::value< std::string >(), "Sign and encode a message: ping, pong, get-recent-states, recent-states-missing")
         (DECODE_OPTION         , "Verify and decode the frames read from input")
         (REPLY_OPTION      ",r", program_options::value< bool >(), "Treat input as reply direction (no identity frame)")
         (INPUT_OPTION      ",i", program_options::value< std::string >(), "JSON file holding an array of hex frames (default stdin)")
         (OUTPUT_OPTION     ",o", program_options::value< std::string >(), "Where to write encoded frames (default stdout)")
         (SEED_OPTION       ",s", program_options::value< std::string >(), "Seed the signing key is derived from")
         (BLOCK_HASH_OPTION ",b", program_options::value< std::string >(), "Hex block hash for recent state messages")
         (IDENTITY_OPTION       , program_options::value< std::string >(), "Hex routing identity to prepend");

      program_options::variables_map args;
      program_options::store( program_options::parse_command_line( argc, argv, options ), args );

      if ( args.count( HELP_OPTION ) )
      {
         std::cout << options << std::endl;
         return EXIT_SUCCESS;
      }

      if ( args.count( VERSION_OPTION ) )
      {
         const auto& v_str = version_string();
         std::cout.write( v_str.c_str(), v_str.size() );
         std::cout << std::endl;
         return EXIT_SUCCESS;
      }

      auto basedir = std::filesystem::path( args[ BASEDIR_OPTION ].as< std::string >() );
      if ( basedir.is_relative() )
         basedir = std::filesystem::current_path() / basedir;

      YAML::Node config;
      YAML::Node global_config;
      YAML::Node frames_config;

      auto yaml_config = basedir / "config.yml";
      if ( !std::filesystem::exists( yaml_config ) )
      {
         yaml_config = basedir / "config.yaml";
      }

      if ( std::filesystem::exists( yaml_config ) )
      {
         config = YAML::LoadFile( yaml_config.string() );
         global_config = config[ "global" ];
         frames_config = config[ SERVICE_NAME ];
      }

      std::string log_level  = util::get_option< std::string >( LOG_LEVEL_OPTION, LOG_LEVEL_DEFAULT, args, frames_config, global_config );
      bool log_color         = util::get_option< bool >( LOG_COLOR_OPTION, LOG_COLOR_DEFAULT, args, frames_config, global_config );
      bool reply             = util::get_option< bool >( REPLY_OPTION, false, args, frames_config, global_config );
      std::string seed       = util::get_option< std::string >( SEED_OPTION, "", args, frames_config, global_config );
      std::string block_hash = util::get_option< std::string >( BLOCK_HASH_OPTION, "", args, frames_config, global_config );
      std::string identity   = util::get_option< std::string >( IDENTITY_OPTION, "", args, frames_config, global_config );

      auto logdir = basedir / SERVICE_NAME / "logs";
      std::filesystem::create_directories( logdir );
      meshwire::initialize_logging( logdir, "meshwire_frames_%3N.log", log_level, log_color );

      if ( config.IsNull() )
      {
         LOG(debug) << "Could not find config (config.yml or config.yaml expected). Using default values";
      }

      bool encode = args.count( ENCODE_OPTION ) != 0;
      bool decode = args.count( DECODE_OPTION ) != 0;

      MESHWIRE_ASSERT( encode != decode, invalid_argument, "exactly one of --encode or --decode is required" );

      if ( encode )
      {
         crypto::private_key key;
         if ( seed.empty() )
         {
            LOG(warning) << "No seed given, signing with a random key";
            key = crypto::private_key::generate();
         }
         else
         {
            key = crypto::private_key::regenerate( crypto::hash( crypto::multicodec::sha2_256, seed ) );
         }

         auto msg = make_message( args[ ENCODE_OPTION ].as< std::string >(), block_hash, identity );
         auto frames = msg.to_frames( key );

         LOG(info) << "Encoded " << msg.type() << " message into " << frames.size() << " frames";
         LOG(info) << "Signer address: " << util::to_hex( key.get_public_key().to_address() );

         if ( args.count( OUTPUT_OPTION ) )
         {
            std::ofstream ofs( args[ OUTPUT_OPTION ].as< std::string >() );
            MESHWIRE_ASSERT( ofs.is_open(), invalid_argument, "unable to open output file ${f}", ("f", args[ OUTPUT_OPTION ].as< std::string >()) );
            write_frames( ofs, frames );
         }
         else
         {
            write_frames( std::cout, frames );
         }
      }
      else
      {
         net::frame_sequence frames;

         if ( args.count( INPUT_OPTION ) )
         {
            std::ifstream ifs( args[ INPUT_OPTION ].as< std::string >() );
            MESHWIRE_ASSERT( ifs.is_open(), invalid_argument, "unable to open input file ${f}", ("f", args[ INPUT_OPTION ].as< std::string >()) );
            frames = read_frames( ifs );
         }
         else
         {
            frames = read_frames( std::cin );
         }

         LOG(info) << "Parsing " << frames.size() << " frames as " << ( reply ? "reply" : "request" ) << " direction";

         auto msg = net::message::parse( frames, reply );
         nlohmann::json j = msg;
         std::cout << j.dump( 3 ) << std::endl;
      }
   }
   catch ( const invalid_argument& e )
   {
      LOG(error) << "Invalid argument: " << e.what();
      retcode = EXIT_FAILURE;
   }
   catch ( const net::message_exception& e )
   {
      LOG(error) << "Message rejected: " << e.what();
      retcode = EXIT_FAILURE;
   }
   catch ( const meshwire::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << e.what();
      retcode = EXIT_FAILURE;
   }
   catch ( const boost::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << boost::diagnostic_information( e );
      retcode = EXIT_FAILURE;
   }
   catch ( const std::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << e.what();
      retcode = EXIT_FAILURE;
   }

   return retcode;
}

const std::string& version_string()
{
   static std::string v_str = "meshwire frames v" MESHWIRE_MAJOR_VERSION "." MESHWIRE_MINOR_VERSION "." MESHWIRE_PATCH_VERSION;
   return v_str;
}

net::frame_sequence read_frames( std::istream& in )
{
   auto j = nlohmann::json::parse( in );
   MESHWIRE_ASSERT( j.is_array(), invalid_argument, "frames must be a json array of hex strings" );

   net::frame_sequence frames;
   frames.reserve( j.size() );
   for ( const auto& f : j )
   {
      MESHWIRE_ASSERT( f.is_string(), invalid_argument, "frames must be a json array of hex strings" );
      frames.push_back( util::from_hex( f.get< std::string >() ) );
   }

   return frames;
}

void write_frames( std::ostream& out, const net::frame_sequence& frames )
{
   nlohmann::json j = nlohmann::json::array();
   for ( const auto& f : frames )
      j.push_back( util::to_hex( f ) );
   out << j.dump( 3 ) << std::endl;
}

block_hash_type parse_block_hash( const std::string& hex )
{
   MESHWIRE_ASSERT( !hex.empty(), invalid_argument, "--" BLOCK_HASH_OPTION " is required for this message" );
   auto bytes = util::from_hex( hex );
   MESHWIRE_ASSERT( bytes.size() == block_hash_size, invalid_argument,
      "block hash must be ${n} bytes, was ${s}", ("n", block_hash_size)("s", bytes.size()) );

   block_hash_type h;
   std::copy( bytes.begin(), bytes.end(), h.begin() );
   return h;
}

net::message make_message( const std::string& kind, const std::string& block_hash, const std::string& identity )
{
   std::optional< net::identity_type > id;
   if ( !identity.empty() )
      id = util::from_hex( identity );

   if ( kind == "ping" )
      return net::message( net::ping{}, id );
   if ( kind == "pong" )
      return net::message( net::pong{}, id );
   if ( kind == "get-recent-states" )
      return net::message( net::get_recent_states{ parse_block_hash( block_hash ) }, id );
   if ( kind == "recent-states-missing" )
      return net::message( net::recent_states( parse_block_hash( block_hash ) ), id );

   MESHWIRE_THROW( invalid_argument, "cannot encode message kind ${k}", ("k", kind) );
}
