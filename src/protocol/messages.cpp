#include "protocol/messages.hpp"

namespace billwire {

const char* protocol_error_name(ProtocolError err) {
    switch (err) {
    case ProtocolError::kNone:            return "None";
    case ProtocolError::kTruncatedHeader: return "TruncatedHeader";
    case ProtocolError::kInvalidLength:   return "InvalidLength";
    case ProtocolError::kTruncatedBody:   return "TruncatedBody";
    case ProtocolError::kMalformedBody:   return "MalformedBody";
    case ProtocolError::kTotalMismatch:   return "TotalMismatch";
    case ProtocolError::kFieldOutOfRange: return "FieldOutOfRange";
    case ProtocolError::kMessageTooLarge: return "MessageTooLarge";
    }
    return "Unknown";
}

} // namespace billwire
