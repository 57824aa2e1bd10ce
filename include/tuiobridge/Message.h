/*
 *  TuioBridge - WebSocket JSON to OSC/TUIO relay.
 *  This header file declares the Message class, which represents an OSC message,
 *  including its address and arguments.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "tuiobridge/Packet.h"
#include "tuiobridge/Types.h"

namespace tuiobridge {
    /**
     * @brief The Message class represents an OSC message.
     */
    class Message {
       public:
        /**
         * @brief Construct a new OSC Message object
         * @param path The OSC address (must be non-empty; conventionally starts with '/')
         * @throws InvalidArgumentException if the path is empty
         */
        explicit Message(const std::string &path);

        /**
         * @brief Build a message from a normalized packet
         *
         * Each JSON argument is classified by TypeCoercion, preserving order.
         *
         * @param packet The packet to convert
         * @return The typed message
         */
        static Message fromPacket(const Packet &packet);

        /**
         * @brief Get the OSC address path
         */
        std::string getPath() const;

        /**
         * @brief Get the arguments in this message
         */
        const std::vector<Value> &getArguments() const;

        size_t getArgumentCount() const;

        /**
         * @brief Get one argument
         * @throws InvalidArgumentException if the index is out of range
         */
        const Value &getArgument(size_t index) const;

        /**
         * @brief Add an Int32 argument (type tag 'i')
         * @return Reference to this message for method chaining
         */
        Message &addInt32(int32_t value);

        /**
         * @brief Add a Float argument (type tag 'f')
         * @return Reference to this message for method chaining
         */
        Message &addFloat(float value);

        /**
         * @brief Add a String argument (type tag 's')
         * @return Reference to this message for method chaining
         */
        Message &addString(const std::string &value);

        /**
         * @brief Add a generic Value argument
         * @return Reference to this message for method chaining
         */
        Message &addValue(const Value &value);

        /**
         * @brief Build the type tag string, e.g. ",sif"
         */
        std::string typeTags() const;

        /**
         * @brief Serialize the message to the OSC binary format
         *
         * The result is always a multiple of four bytes long.
         *
         * @return Vector of bytes representing the serialized message
         */
        std::vector<std::byte> serialize() const;

        /**
         * @brief Deserialize a message from OSC binary format
         * @param data Pointer to the binary data
         * @param size Size of the binary data in bytes
         * @return The deserialized Message object
         * @throws BridgeException if the data is invalid
         */
        static Message deserialize(const std::byte *data, size_t size);

       private:
        std::string path_;
        std::vector<Value> arguments_;
    };

}  // namespace tuiobridge
