#pragma once
#include <meshwire/exception.hpp>

namespace meshwire::net {

// Any failure to turn a frame sequence into a message. Terminal for that message only.
MESHWIRE_DECLARE_EXCEPTION( message_exception );

MESHWIRE_DECLARE_DERIVED_EXCEPTION( empty_message, message_exception );
MESHWIRE_DECLARE_DERIVED_EXCEPTION( invalid_signature, message_exception );
MESHWIRE_DECLARE_DERIVED_EXCEPTION( unknown_message_type, message_exception );
MESHWIRE_DECLARE_DERIVED_EXCEPTION( truncated_payload, message_exception );
MESHWIRE_DECLARE_DERIVED_EXCEPTION( malformed_frame, message_exception );
MESHWIRE_DECLARE_DERIVED_EXCEPTION( inconsistent_payload, message_exception );

} // meshwire::net
