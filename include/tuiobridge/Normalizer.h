/*
 *  TuioBridge - WebSocket JSON to OSC/TUIO relay.
 *  This header declares the Normalizer, which reduces the accepted JSON
 *  envelope shapes to an ordered list of packets.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "tuiobridge/Packet.h"
#include "tuiobridge/Types.h"

namespace tuiobridge {

    /**
     * @brief Envelope shapes, listed in matching priority
     *
     * A document is matched against these in order and only the first match
     * is used. New shapes must be added to this list explicitly.
     */
    enum class Envelope {
        SingleMessage,  ///< {"address": ..., "args": [...]}
        FlaggedBundle,  ///< {"bundle": true, "packets": ...}
        TimedBundle,    ///< {"timeTag": ..., "packets": [...]}
        PacketList,     ///< {"packets": [...]}
        BareArray,      ///< [{...}, {...}]
        Unrecognized
    };

    class Normalizer {
       public:
        /**
         * @brief Determine which envelope shape a document has
         */
        static Envelope classify(const nlohmann::json &document);

        /**
         * @brief Extract packets from a parsed document
         * @param document Parsed inbound JSON
         * @return Packets in document order (possibly empty)
         * @throws ShapeException if the document or one of its packets is not recognized
         */
        static std::vector<Packet> normalize(const nlohmann::json &document);

        /**
         * @brief Parse inbound text
         * @throws ParseException if the text is not valid JSON
         */
        static nlohmann::json parse(const std::string &jsonText);

        /**
         * @brief Parse and normalize inbound text
         * @throws ParseException if the text is not valid JSON
         * @throws ShapeException if the document is not recognized
         */
        static std::vector<Packet> normalize(const std::string &jsonText);

        /**
         * @brief Read the producer's time tag from a timed envelope
         *
         * The value is informational only and is never encoded.
         *
         * @return The time (Unix milliseconds) as a TimeTag, or nullopt when
         *         the document carries no numeric "timeTag" in [0, 1e15)
         */
        static std::optional<TimeTag> requestedTime(const nlohmann::json &document);

        static const char *envelopeName(Envelope envelope);
    };

}  // namespace tuiobridge
