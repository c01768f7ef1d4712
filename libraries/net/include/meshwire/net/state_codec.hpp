#pragma once
#include <meshwire/types/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>

namespace meshwire::net {

// An account's state at some block. The wire never looks inside it.
using state_value = nlohmann::json;

/**
 * Turns account state values into opaque blobs and back.
 *
 * deserialize must throw on a blob it cannot read. Decoders report anything
 * other than a message_exception as malformed_frame.
 */
struct state_codec
{
   std::function< variable_blob( const state_value& ) > serialize;
   std::function< state_value( const variable_blob& ) > deserialize;
};

// Deepest container nesting the default codec accepts in a state blob
constexpr std::size_t max_state_depth = 64;

// Values as CBOR documents
const state_codec& cbor_state_codec();

} // meshwire::net
