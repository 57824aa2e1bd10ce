/*
 *  TuioBridge - WebSocket JSON to OSC/TUIO relay.
 *  This header declares Packet, the normalized unit handed from the JSON
 *  envelope normalizer to the OSC encoders.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace tuiobridge {

    /**
     * @brief One pre-encoding OSC message: an address and its raw JSON arguments
     *
     * Arguments stay as JSON scalars until the encoder classifies them, so the
     * producer's original types drive the chosen OSC type tags.
     */
    struct Packet {
        std::string address;
        nlohmann::json args = nlohmann::json::array();

        /**
         * @brief Build a Packet from a packet-shaped JSON object
         * @param object JSON object with an "address" string and optional "args"
         * @return The extracted packet
         * @throws ShapeException if the object is not packet-shaped
         */
        static Packet fromJson(const nlohmann::json &object);
    };

}  // namespace tuiobridge
