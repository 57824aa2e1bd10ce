/*
 *  TuioBridge - WebSocket JSON to OSC/TUIO relay.
 *  This file defines exceptions used throughout the bridge.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace tuiobridge {
    /**
     * @brief Base exception class for all bridge errors
     */
    class BridgeException : public std::runtime_error {
       public:
        /**
         * @brief Error codes for bridge exceptions
         */
        enum class ErrorCode {
            None = 0,
            ParseError,            ///< Inbound text is not valid JSON
            ShapeError,            ///< JSON envelope not recognized
            TransportError,        ///< UDP send failed
            SocketError,           ///< Socket could not be created
            AddressError,          ///< Destination could not be resolved
            InvalidArgument,       ///< Invalid function argument
            MalformedPacket,       ///< Packet does not conform to OSC
            TypeMismatch,          ///< Value accessed as the wrong type
            BufferOverflow,        ///< Read past the end of a buffer
            UnknownType,           ///< Unknown OSC type tag
            DeserializationError,  ///< Error during deserialization
            ServerError            ///< WebSocket listener error
        };

        /**
         * @brief Construct a new bridge exception
         * @param message Error message
         * @param code Error code
         */
        BridgeException(const std::string &message, ErrorCode code = ErrorCode::None)
            : std::runtime_error(message), code_(code) {}

        /**
         * @brief Get the error code
         * @return ErrorCode
         */
        ErrorCode code() const { return code_; }

        /**
         * @brief Get a description for an error code
         * @param code The error code
         * @return std::string The description
         */
        static std::string getErrorDescription(ErrorCode code);

       private:
        ErrorCode code_;
    };

    /**
     * @brief Inbound frame text could not be parsed as JSON
     */
    class ParseException : public BridgeException {
       public:
        ParseException(const std::string &message)
            : BridgeException(message, ErrorCode::ParseError) {}
    };

    /**
     * @brief JSON document matches none of the accepted envelope shapes
     */
    class ShapeException : public BridgeException {
       public:
        ShapeException(const std::string &message)
            : BridgeException(message, ErrorCode::ShapeError) {}
    };

    /**
     * @brief Datagram could not be handed to the network
     */
    class TransportException : public BridgeException {
       public:
        TransportException(const std::string &message)
            : BridgeException(message, ErrorCode::TransportError) {}
    };

    class SocketException : public BridgeException {
       public:
        SocketException(const std::string &message)
            : BridgeException(message, ErrorCode::SocketError) {}
    };

    class AddressException : public BridgeException {
       public:
        AddressException(const std::string &message)
            : BridgeException(message, ErrorCode::AddressError) {}
    };

    class InvalidArgumentException : public BridgeException {
       public:
        InvalidArgumentException(const std::string &message)
            : BridgeException(message, ErrorCode::InvalidArgument) {}
    };

    /**
     * @brief Exception for malformed OSC packets
     */
    class MalformedPacketException : public BridgeException {
       public:
        MalformedPacketException(const std::string &message)
            : BridgeException(message, ErrorCode::MalformedPacket) {}
    };

    class TypeMismatchException : public BridgeException {
       public:
        TypeMismatchException(const std::string &message)
            : BridgeException(message, ErrorCode::TypeMismatch) {}
    };

    class BufferOverflowException : public BridgeException {
       public:
        BufferOverflowException(const std::string &message)
            : BridgeException(message, ErrorCode::BufferOverflow) {}
    };

    class UnknownTypeException : public BridgeException {
       public:
        UnknownTypeException(const std::string &message)
            : BridgeException(message, ErrorCode::UnknownType) {}
    };

    class DeserializationException : public BridgeException {
       public:
        DeserializationException(const std::string &message)
            : BridgeException(message, ErrorCode::DeserializationError) {}
    };

    /**
     * @brief Exception for WebSocket listener errors
     */
    class ServerException : public BridgeException {
       public:
        ServerException(const std::string &message)
            : BridgeException(message, ErrorCode::ServerError) {}
    };

}  // namespace tuiobridge
