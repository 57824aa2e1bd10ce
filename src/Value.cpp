/*
 * TuioBridge - WebSocket JSON to OSC/TUIO relay.
 * This file contains the implementation of the Value class and the
 * byte-level helpers shared by the message and bundle codecs.
 */

#include <cstdint>
#include <cstring>
#include <vector>

#include "tuiobridge/Exceptions.h"
#include "tuiobridge/Types.h"

#include <arpa/inet.h>  // For htonl, ntohl

namespace tuiobridge {

    void appendPaddedString(std::vector<std::byte> &buffer, const std::string &str) {
        const size_t strSize = str.size() + 1;  // Include null terminator
        const size_t paddedSize = padSize(strSize);

        const std::byte *bytes = reinterpret_cast<const std::byte *>(str.c_str());
        buffer.insert(buffer.end(), bytes, bytes + strSize);

        for (size_t i = strSize; i < paddedSize; ++i) {
            buffer.push_back(std::byte{0});
        }
    }

    void appendUInt32(std::vector<std::byte> &buffer, uint32_t value) {
        uint32_t be = htonl(value);
        const std::byte *bytes = reinterpret_cast<const std::byte *>(&be);
        buffer.insert(buffer.end(), bytes, bytes + sizeof(uint32_t));
    }

    uint32_t readUInt32(const std::byte *data) {
        uint32_t be;
        std::memcpy(&be, data, sizeof(uint32_t));
        return ntohl(be);
    }

    Value::Value(Int32 value) : value_(value) {}

    Value::Value(Float value) : value_(value) {}

    Value::Value(const char *value) : value_(String(value)) {}

    Value::Value(String value) : value_(std::move(value)) {}

    bool Value::isInt32() const { return std::holds_alternative<Int32>(value_); }
    bool Value::isFloat() const { return std::holds_alternative<Float>(value_); }
    bool Value::isString() const { return std::holds_alternative<String>(value_); }

    Value::Int32 Value::asInt32() const {
        if (!isInt32()) throw TypeMismatchException("Value is not an Int32");
        return std::get<Int32>(value_);
    }

    Value::Float Value::asFloat() const {
        if (!isFloat()) throw TypeMismatchException("Value is not a Float");
        return std::get<Float>(value_);
    }

    const Value::String &Value::asString() const {
        if (!isString()) throw TypeMismatchException("Value is not a String");
        return std::get<String>(value_);
    }

    char Value::typeTag() const {
        if (isInt32()) return INT32_TAG;
        if (isFloat()) return FLOAT_TAG;
        return STRING_TAG;
    }

    void Value::serialize(std::vector<std::byte> &buffer) const {
        switch (typeTag()) {
            case INT32_TAG:
                appendUInt32(buffer, static_cast<uint32_t>(asInt32()));
                break;
            case FLOAT_TAG: {
                uint32_t bits;
                Float val = asFloat();
                std::memcpy(&bits, &val, sizeof(bits));
                appendUInt32(buffer, bits);
                break;
            }
            case STRING_TAG:
                appendPaddedString(buffer, asString());
                break;
            default:
                throw UnknownTypeException("Cannot serialize unknown type '" +
                                           std::string(1, typeTag()) + "'");
        }
    }

    Value Value::deserialize(const std::byte *&data, size_t &remainingSize, char typeTag) {
        if (!data) {
            throw InvalidArgumentException("Null data pointer in Value::deserialize");
        }

        switch (typeTag) {
            case INT32_TAG: {
                if (remainingSize < sizeof(Int32)) {
                    throw BufferOverflowException("Not enough data for Int32");
                }
                auto val = static_cast<Int32>(readUInt32(data));
                data += sizeof(Int32);
                remainingSize -= sizeof(Int32);
                return Value(val);
            }
            case FLOAT_TAG: {
                if (remainingSize < sizeof(Float)) {
                    throw BufferOverflowException("Not enough data for Float");
                }
                uint32_t bits = readUInt32(data);
                Float val;
                std::memcpy(&val, &bits, sizeof(val));
                data += sizeof(Float);
                remainingSize -= sizeof(Float);
                return Value(val);
            }
            case STRING_TAG: {
                const char *cdata = reinterpret_cast<const char *>(data);
                size_t length = 0;
                while (length < remainingSize && cdata[length] != '\0') {
                    length++;
                }
                if (length >= remainingSize) {
                    throw BufferOverflowException("String argument is not null-terminated");
                }
                size_t consumed = padSize(length + 1);
                if (consumed > remainingSize) {
                    throw BufferOverflowException("String argument padding is truncated");
                }
                String val(cdata, length);
                data += consumed;
                remainingSize -= consumed;
                return Value(std::move(val));
            }
            default:
                throw UnknownTypeException("Unsupported OSC type tag '" + std::string(1, typeTag) +
                                           "'");
        }
    }

}  // namespace tuiobridge
