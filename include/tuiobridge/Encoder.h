/*
 *  TuioBridge - WebSocket JSON to OSC/TUIO relay.
 *  Entry points that turn normalized packets into OSC wire bytes.
 */

#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "tuiobridge/Packet.h"
#include "tuiobridge/Types.h"

namespace tuiobridge {

    /**
     * @brief Encode one OSC message
     * @param address OSC address, sent verbatim
     * @param args JSON array of arguments, classified one by one
     * @return Message bytes, length a multiple of four
     * @throws InvalidArgumentException if the address is empty
     */
    std::vector<std::byte> encodeMessage(const std::string &address, const nlohmann::json &args);

    std::vector<std::byte> encodeMessage(const Packet &packet);

    /**
     * @brief Encode packets as one OSC bundle
     * @param packets Messages in the order they must appear
     * @param requestedTime Accepted for the caller's convenience and discarded;
     *        the bundle always carries the immediate time tag
     */
    std::vector<std::byte> encodeBundle(const std::vector<Packet> &packets,
                                        const TimeTag &requestedTime = TimeTag::immediate());

}  // namespace tuiobridge
