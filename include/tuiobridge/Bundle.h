/*
 *  TuioBridge - WebSocket JSON to OSC/TUIO relay.
 *  This header file declares the Bundle class, an ordered group of OSC messages.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include "tuiobridge/Message.h"
#include "tuiobridge/Types.h"

namespace tuiobridge {

    /**
     * @brief The Bundle class represents an OSC bundle of messages
     *
     * Scheduled delivery is not supported: whatever time the caller requests
     * is kept only for diagnostics and the encoded time tag is always the
     * immediate sentinel (0x0000000000000001).
     */
    class Bundle {
       public:
        /**
         * @brief Construct a new Bundle
         * @param requestedTime Time the producer associated with the bundle
         */
        explicit Bundle(const TimeTag &requestedTime = TimeTag::immediate());

        /**
         * @brief Add a message to this bundle
         * @return Reference to this bundle for method chaining
         */
        Bundle &addMessage(const Message &message);

        /**
         * @brief Get the time tag that is encoded (always immediate)
         */
        TimeTag getTimeTag() const;

        /**
         * @brief Get the time the producer asked for
         */
        TimeTag requestedTime() const;

        const std::vector<Message> &messages() const;

        size_t size() const;

        bool isEmpty() const;

        /**
         * @brief Serialize the bundle to the OSC binary format
         *
         * Layout: "#bundle\0", the 8-byte time tag, then every message in
         * insertion order prefixed by its big-endian 32-bit length.
         */
        std::vector<std::byte> serialize() const;

        /**
         * @brief Deserialize a bundle from OSC binary format
         * @throws BridgeException if the data is invalid or contains nested bundles
         */
        static Bundle deserialize(const std::byte *data, size_t size);

        /**
         * @brief Execute a function for each message in the bundle
         */
        void forEach(const std::function<void(const Message &)> &callback) const;

       private:
        TimeTag requestedTime_;
        std::vector<Message> messages_;
    };

}  // namespace tuiobridge
