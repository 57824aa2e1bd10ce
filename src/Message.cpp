#include "tuiobridge/Message.h"

#include "tuiobridge/Exceptions.h"
#include "tuiobridge/TypeCoercion.h"

namespace tuiobridge {
    // Constructor; only emptiness is enforced, any other address is sent as given
    Message::Message(const std::string &path) : path_(path) {
        if (path.empty()) {
            throw InvalidArgumentException("OSC address must not be empty");
        }
    }

    Message Message::fromPacket(const Packet &packet) {
        Message message(packet.address);
        if (packet.args.is_array()) {
            for (const auto &arg : packet.args) {
                message.addValue(TypeCoercion::classify(arg));
            }
        } else if (!packet.args.is_null()) {
            message.addValue(TypeCoercion::classify(packet.args));
        }
        return message;
    }

    std::string Message::getPath() const { return path_; }

    const std::vector<Value> &Message::getArguments() const { return arguments_; }

    size_t Message::getArgumentCount() const { return arguments_.size(); }

    const Value &Message::getArgument(size_t index) const {
        if (index >= arguments_.size()) {
            throw InvalidArgumentException("Argument index " + std::to_string(index) +
                                           " out of range (" + std::to_string(arguments_.size()) +
                                           " arguments)");
        }
        return arguments_[index];
    }

    Message &Message::addInt32(int32_t value) {
        arguments_.emplace_back(value);
        return *this;
    }

    Message &Message::addFloat(float value) {
        arguments_.emplace_back(value);
        return *this;
    }

    Message &Message::addString(const std::string &value) {
        arguments_.emplace_back(value);
        return *this;
    }

    Message &Message::addValue(const Value &value) {
        arguments_.push_back(value);
        return *this;
    }

    std::string Message::typeTags() const {
        std::string tags = ",";
        for (const auto &arg : arguments_) {
            tags += arg.typeTag();
        }
        return tags;
    }

    // Serialize the message to OSC format
    std::vector<std::byte> Message::serialize() const {
        std::string tags = typeTags();

        // Pre-calculate buffer size to avoid reallocations
        size_t totalSize = padSize(path_.size() + 1) + padSize(tags.size() + 1);
        for (const auto &arg : arguments_) {
            totalSize += arg.isString() ? padSize(arg.asString().size() + 1) : 4;
        }

        std::vector<std::byte> result;
        result.reserve(totalSize);

        // 1. Address pattern, 2. type tag string, 3. argument data
        appendPaddedString(result, path_);
        appendPaddedString(result, tags);
        for (const auto &arg : arguments_) {
            arg.serialize(result);
        }

        return result;
    }

    // Deserialize a message from binary data
    Message Message::deserialize(const std::byte *data, size_t size) {
        if (!data) {
            throw InvalidArgumentException("Null data pointer provided to deserialize");
        }
        if (size < 4 || size % 4 != 0) {
            throw MalformedPacketException("Message size " + std::to_string(size) +
                                           " is not a positive multiple of 4");
        }

        const char *cdata = reinterpret_cast<const char *>(data);

        // 1. Extract OSC Address Pattern
        size_t pathEnd = 0;
        while (pathEnd < size && cdata[pathEnd] != '\0') {
            pathEnd++;
        }
        if (pathEnd >= size) {
            throw MalformedPacketException("Missing null terminator in OSC address pattern");
        }
        if (pathEnd == 0) {
            throw MalformedPacketException("Empty OSC address pattern");
        }

        Message message(std::string(cdata, pathEnd));

        size_t pos = padSize(pathEnd + 1);
        if (pos >= size) {
            // No type tag string or arguments
            return message;
        }

        // 2. Extract Type Tag String
        if (cdata[pos] != ',') {
            throw MalformedPacketException("Type tag string must start with ','");
        }

        size_t typeTagEnd = pos;
        while (typeTagEnd < size && cdata[typeTagEnd] != '\0') {
            typeTagEnd++;
        }
        if (typeTagEnd >= size) {
            throw MalformedPacketException("Missing null terminator in type tag string");
        }

        std::string typeTag(cdata + pos, typeTagEnd - pos);
        pos = padSize(typeTagEnd + 1);
        if (pos > size) {
            throw MalformedPacketException("Type tag string padding is truncated");
        }

        // 3. Extract Arguments based on Type Tags, skipping the leading ','
        const std::byte *cursor = data + pos;
        size_t remaining = size - pos;
        for (size_t i = 1; i < typeTag.size(); i++) {
            try {
                message.arguments_.push_back(Value::deserialize(cursor, remaining, typeTag[i]));
            } catch (const BridgeException &e) {
                throw DeserializationException("Argument " + std::to_string(i - 1) + " of " +
                                               message.path_ + ": " + e.what());
            }
        }

        return message;
    }

}  // namespace tuiobridge
