/*
 *  TuioBridge - WebSocket JSON to OSC/TUIO relay.
 *  This header file defines the OSC value and time types used by the encoders.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "tuiobridge/Exceptions.h"

namespace tuiobridge {

    /**
     * @brief Class representing an OSC Time Tag
     *
     * OSC Time Tags are 64-bit fixed-point numbers representing
     * time in NTP format (seconds since Jan 1, 1900).
     */
    class TimeTag {
       public:
        /**
         * @brief Default constructor (creates an immediate time tag)
         */
        TimeTag();

        /**
         * @brief Construct from NTP format (64-bit)
         * @param ntp NTP timestamp
         */
        explicit TimeTag(uint64_t ntp);

        /**
         * @brief Construct from seconds and fraction
         * @param seconds Seconds since Jan 1, 1900
         * @param fraction Fractional seconds (0-0xFFFFFFFF)
         */
        TimeTag(uint32_t seconds, uint32_t fraction);

        /**
         * @brief Construct from std::chrono::system_clock::time_point
         * @param tp Time point
         */
        explicit TimeTag(std::chrono::system_clock::time_point tp);

        /**
         * @brief Get current time as TimeTag
         */
        static TimeTag now();

        /**
         * @brief Get immediate execution time tag (special value)
         */
        static TimeTag immediate();

        /**
         * @brief Build a time tag from milliseconds since the Unix epoch
         *
         * Browser producers stamp envelopes with Date.now(); this is the
         * conversion used when such a value is logged.
         */
        static TimeTag fromUnixMilliseconds(int64_t milliseconds);

        uint64_t toNTP() const;

        std::chrono::system_clock::time_point toTimePoint() const;

        uint32_t seconds() const;

        uint32_t fraction() const;

        bool isImmediate() const;

        bool operator==(const TimeTag &other) const;
        bool operator!=(const TimeTag &other) const;
        bool operator<(const TimeTag &other) const;

       private:
        uint32_t seconds_;   ///< Seconds since Jan 1, 1900
        uint32_t fraction_;  ///< Fractional seconds (0-0xFFFFFFFF)
    };

    /**
     * @brief Class representing an OSC argument value
     *
     * The bridge only emits the three core OSC 1.0 types, so the variant is
     * restricted to int32, float32 and string.
     */
    class Value {
       public:
        // Type tag constants
        static constexpr char INT32_TAG = 'i';
        static constexpr char FLOAT_TAG = 'f';
        static constexpr char STRING_TAG = 's';

        using Int32 = int32_t;
        using Float = float;
        using String = std::string;

        using Variant = std::variant<Int32,  // i
                                     Float,  // f
                                     String  // s
                                     >;

        // Default constructor (Int32 zero)
        Value() : value_(Int32{0}) {}

        explicit Value(Variant value) : value_(std::move(value)) {}
        explicit Value(Int32 value);
        explicit Value(Float value);
        explicit Value(const char *value);
        explicit Value(String value);

        // Type checking
        bool isInt32() const;
        bool isFloat() const;
        bool isString() const;

        // Value accessors (with type checking)
        Int32 asInt32() const;
        Float asFloat() const;
        const String &asString() const;

        // Get the type tag for this value
        char typeTag() const;

        // Serialization methods
        void serialize(std::vector<std::byte> &buffer) const;
        static Value deserialize(const std::byte *&data, size_t &remainingSize, char typeTag);

        bool operator==(const Value &other) const { return value_ == other.value_; }
        bool operator!=(const Value &other) const { return !(*this == other); }

       private:
        Variant value_;
    };

    // Helper to pad a length to the 4-byte OSC boundary
    inline size_t padSize(size_t size) { return (size + 3) & ~static_cast<size_t>(3); }

    /**
     * @brief Append an OSC-string (NUL terminated, padded to 4 bytes)
     *
     * At least one NUL is always written, so a string whose length is already
     * a multiple of four gains four NUL bytes.
     */
    void appendPaddedString(std::vector<std::byte> &buffer, const std::string &str);

    /**
     * @brief Append a 32-bit unsigned integer in big-endian byte order
     */
    void appendUInt32(std::vector<std::byte> &buffer, uint32_t value);

    /**
     * @brief Read a big-endian 32-bit unsigned integer
     */
    uint32_t readUInt32(const std::byte *data);

}  // namespace tuiobridge
