#include <unordered_map>

#include "tuiobridge/Exceptions.h"

namespace tuiobridge {
    // Static method to get a description for an error code
    std::string BridgeException::getErrorDescription(ErrorCode code) {
        static const std::unordered_map<ErrorCode, std::string> descriptions = {
            {ErrorCode::None, "No error"},
            {ErrorCode::ParseError, "Invalid JSON text"},
            {ErrorCode::ShapeError, "Unrecognized JSON envelope"},
            {ErrorCode::TransportError, "UDP send failed"},
            {ErrorCode::SocketError, "Socket error"},
            {ErrorCode::AddressError, "Destination address error"},
            {ErrorCode::InvalidArgument, "Invalid argument"},
            {ErrorCode::MalformedPacket, "Malformed OSC packet"},
            {ErrorCode::TypeMismatch, "OSC type mismatch"},
            {ErrorCode::BufferOverflow, "Buffer overflow"},
            {ErrorCode::UnknownType, "Unknown OSC type"},
            {ErrorCode::DeserializationError, "Error during OSC deserialization"},
            {ErrorCode::ServerError, "WebSocket server error"}};

        auto it = descriptions.find(code);
        if (it != descriptions.end()) {
            return it->second;
        }

        return "Unknown error";
    }
}  // namespace tuiobridge
