/*
 *  TuioBridge - WebSocket JSON to OSC/TUIO relay.
 *  This header declares the classification of JSON scalars into OSC values.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "tuiobridge/Types.h"

namespace tuiobridge {

    /**
     * @brief Maps a JSON argument onto exactly one of the OSC int32, float32
     * or string types
     *
     * Rules are tried in a fixed order and the first match wins:
     *  1. string  -> 's' (never sniffed for numeric content)
     *  2. boolean -> 'i' with 1 or 0
     *  3. integer -> 'i', truncated to the low 32 bits
     *  4. float   -> 'f', narrowed to single precision
     *  5. anything else -> its compact JSON text read as a number ('i' when
     *     whole, 'f' otherwise), or 's' with that text when it is not numeric
     *
     * Classification never throws; rule 5 falling back to a string logs a
     * warning and the argument is still encoded.
     */
    class TypeCoercion {
       public:
        /**
         * @brief Classify one JSON value
         * @param value Any JSON value
         * @return The typed OSC value (typeTag() and serialize() give the wire form)
         */
        static Value classify(const nlohmann::json &value);

        /**
         * @brief Interpret text as a number
         * @param text Candidate numeric text; the whole string must be consumed
         * @return Int32 for whole numbers, Float otherwise, or nullopt when the
         *         text is not a finite number
         */
        static std::optional<Value> parseNumeric(const std::string &text);

        /**
         * @brief Truncate a 64-bit integer to its low 32 bits, two's-complement
         */
        static int32_t truncateToInt32(uint64_t value);
    };

}  // namespace tuiobridge
