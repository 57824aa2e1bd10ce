/*
 *  TuioBridge - WebSocket JSON to OSC/TUIO relay.
 *  This header file declares the Bridge class, which drives one connection's
 *  frames through parsing, normalization, encoding and the UDP send.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "tuiobridge/Packet.h"

namespace tuiobridge {

    /**
     * @brief Outcome of one inbound frame
     */
    enum class FrameResult {
        Sent,             ///< Exactly one datagram was sent
        ParseFailed,      ///< Text was not valid JSON
        ShapeRejected,    ///< JSON did not match any envelope shape
        Empty,            ///< Envelope carried no packets
        EncodeFailed,     ///< Packets could not be turned into OSC bytes
        TransportFailed,  ///< The datagram could not be sent
        BinaryRejected    ///< Non-text frame
    };

    const char *frameResultName(FrameResult result);

    /**
     * @brief Counters kept for one connection
     */
    struct BridgeStats {
        uint64_t framesReceived = 0;
        uint64_t datagramsSent = 0;
        uint64_t bytesSent = 0;
        uint64_t parseFailures = 0;
        uint64_t shapeRejections = 0;
        uint64_t emptyFrames = 0;
        uint64_t encodeFailures = 0;
        uint64_t transportFailures = 0;
        uint64_t binaryRejections = 0;

        std::string toString() const;
    };

    /**
     * @brief Function that puts one datagram on the wire
     *
     * Implementations report failure by throwing TransportException.
     */
    using DatagramSender = std::function<void(const std::vector<std::byte> &)>;

    /**
     * @brief Per-connection frame driver
     *
     * A Bridge is owned by exactly one connection and is only ever called from
     * that connection's thread. Every failure is logged and reported through
     * the returned FrameResult; nothing is thrown back to the caller.
     */
    class Bridge {
       public:
        /**
         * @brief Construct a Bridge
         * @param sender Sink for encoded datagrams
         * @param destination Human readable destination used in debug logging
         */
        explicit Bridge(DatagramSender sender, std::string destination = std::string());

        /**
         * @brief Process one inbound text frame
         * @param text UTF-8 frame payload
         * @return What happened to the frame
         */
        FrameResult handleText(const std::string &text);

        /**
         * @brief Reject one inbound binary frame
         * @param size Payload size, for the log line
         */
        FrameResult handleBinary(size_t size);

        /**
         * @brief Encode normalized packets for a single datagram
         *
         * One packet becomes a bare message, more than one a bundle stamped with
         * the current time (which the encoder replaces with "immediate").
         *
         * @throws InvalidArgumentException if packets is empty
         * @throws BridgeException if a packet cannot be encoded
         */
        static std::vector<std::byte> encodePackets(const std::vector<Packet> &packets);

        const BridgeStats &stats() const { return stats_; }

       private:
        void logRequestedTime(const nlohmann::json &document) const;
        void logTuioPackets(const std::vector<Packet> &packets) const;

        DatagramSender sender_;
        std::string destination_;
        BridgeStats stats_;
    };

}  // namespace tuiobridge
