#include <meshwire/net/state_codec.hpp>
#include <meshwire/net/exceptions.hpp>

#include <string>
#include <utility>
#include <vector>

namespace meshwire::net {

namespace detail {

/**
 * Builds a json document from CBOR events and refuses to nest deeper than
 * max_depth. The CBOR reader recurses once per container, so the depth
 * bound is what keeps a hostile blob from exhausting the stack.
 */
class bounded_state_builder : public nlohmann::json_sax< nlohmann::json >
{
   public:
      bounded_state_builder( nlohmann::json& root, std::size_t max_depth ) :
         _root( root ),
         _max_depth( max_depth )
      {}

      bool null() override
      {
         put( nullptr );
         return true;
      }

      bool boolean( bool v ) override
      {
         put( v );
         return true;
      }

      bool number_integer( number_integer_t v ) override
      {
         put( v );
         return true;
      }

      bool number_unsigned( number_unsigned_t v ) override
      {
         put( v );
         return true;
      }

      bool number_float( number_float_t v, const string_t& ) override
      {
         put( v );
         return true;
      }

      bool string( string_t& v ) override
      {
         put( std::move( v ) );
         return true;
      }

      bool binary( binary_t& v ) override
      {
         put( nlohmann::json::binary_t( std::move( v ) ) );
         return true;
      }

      bool start_object( std::size_t ) override
      {
         return open( nlohmann::json::object() );
      }

      bool key( string_t& k ) override
      {
         _key = std::move( k );
         return true;
      }

      bool end_object() override
      {
         _parents.pop_back();
         return true;
      }

      bool start_array( std::size_t ) override
      {
         return open( nlohmann::json::array() );
      }

      bool end_array() override
      {
         _parents.pop_back();
         return true;
      }

      bool parse_error( std::size_t, const std::string&, const nlohmann::json::exception& ex ) override
      {
         _error = ex.what();
         return false;
      }

      bool too_deep()const { return _too_deep; }
      const std::string& error()const { return _error; }

   private:
      nlohmann::json* put( nlohmann::json&& v )
      {
         if ( _parents.empty() )
         {
            _root = std::move( v );
            return &_root;
         }

         nlohmann::json& parent = *_parents.back();
         if ( parent.is_array() )
         {
            parent.push_back( std::move( v ) );
            return &parent.back();
         }

         nlohmann::json& slot = parent[ _key ];
         slot = std::move( v );
         return &slot;
      }

      bool open( nlohmann::json&& container )
      {
         if ( _parents.size() >= _max_depth )
         {
            _too_deep = true;
            return false;
         }

         _parents.push_back( put( std::move( container ) ) );
         return true;
      }

      nlohmann::json&                _root;
      std::size_t                    _max_depth;
      std::vector< nlohmann::json* > _parents;
      std::string                    _key;
      std::string                    _error;
      bool                           _too_deep = false;
};

variable_blob cbor_serialize( const state_value& v )
{
   auto bytes = nlohmann::json::to_cbor( v );
   return variable_blob( bytes.begin(), bytes.end() );
}

state_value cbor_deserialize( const variable_blob& b )
{
   state_value value;
   bounded_state_builder builder( value, max_state_depth );
   bool parsed = false;

   try
   {
      parsed = nlohmann::json::sax_parse( b.begin(), b.end(), &builder, nlohmann::json::input_format_t::cbor );
   }
   catch ( const nlohmann::json::exception& e )
   {
      MESHWIRE_THROW( malformed_frame, "state blob is not valid cbor: ${reason}", ("reason", e.what()) );
   }

   MESHWIRE_ASSERT( !builder.too_deep(), malformed_frame,
      "state blob nests deeper than ${max} levels", ("max", max_state_depth) );
   MESHWIRE_ASSERT( parsed, malformed_frame,
      "state blob is not valid cbor: ${reason}", ("reason", builder.error()) );

   return value;
}

} // detail

const state_codec& cbor_state_codec()
{
   static const state_codec codec{ &detail::cbor_serialize, &detail::cbor_deserialize };
   return codec;
}

} // meshwire::net
