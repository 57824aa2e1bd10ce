#include "tuiobridge/Bundle.h"

#include <cstring>

#include "tuiobridge/Exceptions.h"

namespace tuiobridge {

    namespace {
        constexpr char BUNDLE_MARKER[] = "#bundle";
        constexpr size_t BUNDLE_HEADER_SIZE = 16;  // "#bundle\0" + 8-byte time tag
    }  // namespace

    Bundle::Bundle(const TimeTag &requestedTime) : requestedTime_(requestedTime) {}

    Bundle &Bundle::addMessage(const Message &message) {
        messages_.push_back(message);
        return *this;
    }

    TimeTag Bundle::getTimeTag() const { return TimeTag::immediate(); }

    TimeTag Bundle::requestedTime() const { return requestedTime_; }

    const std::vector<Message> &Bundle::messages() const { return messages_; }

    size_t Bundle::size() const { return messages_.size(); }

    bool Bundle::isEmpty() const { return messages_.empty(); }

    // Serialize the bundle to OSC binary format
    std::vector<std::byte> Bundle::serialize() const {
        std::vector<std::byte> result;
        result.reserve(512);

        // 1. "#bundle" OSC-string, exactly 8 bytes with its terminator
        appendPaddedString(result, BUNDLE_MARKER);

        // 2. Time tag, high word then low word
        uint64_t ntp = getTimeTag().toNTP();
        appendUInt32(result, static_cast<uint32_t>(ntp >> 32));
        appendUInt32(result, static_cast<uint32_t>(ntp & 0xFFFFFFFF));

        // 3. Size-prefixed elements
        for (const auto &message : messages_) {
            auto messageData = message.serialize();
            appendUInt32(result, static_cast<uint32_t>(messageData.size()));
            result.insert(result.end(), messageData.begin(), messageData.end());
        }

        return result;
    }

    // Deserialize a bundle from binary data
    Bundle Bundle::deserialize(const std::byte *data, size_t size) {
        if (!data) {
            throw InvalidArgumentException("Null data pointer provided to deserialize");
        }

        if (size < BUNDLE_HEADER_SIZE) {
            throw MalformedPacketException("Bundle data too small: " + std::to_string(size) +
                                           " bytes (minimum required: 16 bytes)");
        }

        const char *cdata = reinterpret_cast<const char *>(data);
        if (std::memcmp(cdata, BUNDLE_MARKER, sizeof(BUNDLE_MARKER)) != 0) {
            throw MalformedPacketException("Not an OSC bundle (missing #bundle identifier)");
        }

        TimeTag timeTag(readUInt32(data + 8), readUInt32(data + 12));
        Bundle bundle(timeTag);

        size_t pos = BUNDLE_HEADER_SIZE;
        while (pos < size) {
            if (pos + 4 > size) {
                throw MalformedPacketException("Truncated element size at offset " +
                                               std::to_string(pos));
            }
            uint32_t elementSize = readUInt32(data + pos);
            pos += 4;

            if (elementSize == 0 || elementSize > size - pos) {
                throw MalformedPacketException("Invalid element size " +
                                               std::to_string(elementSize) + " at offset " +
                                               std::to_string(pos - 4));
            }

            if (elementSize >= 8 &&
                std::memcmp(cdata + pos, BUNDLE_MARKER, sizeof(BUNDLE_MARKER)) == 0) {
                throw MalformedPacketException("Nested bundles are not supported");
            }

            try {
                bundle.addMessage(Message::deserialize(data + pos, elementSize));
            } catch (const BridgeException &e) {
                throw DeserializationException("Error in bundled message: " +
                                               std::string(e.what()));
            }

            pos += elementSize;
        }

        return bundle;
    }

    void Bundle::forEach(const std::function<void(const Message &)> &callback) const {
        for (const auto &message : messages_) {
            callback(message);
        }
    }

}  // namespace tuiobridge
