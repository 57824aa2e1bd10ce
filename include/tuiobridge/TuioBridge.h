/*
 *  TuioBridge - WebSocket JSON to OSC/TUIO relay.
 *
 *  Accepts JSON-encoded OSC packets from browser clients over WebSocket and
 *  forwards them as binary OSC 1.0 datagrams to a TUIO client over UDP.
 */

#pragma once

/**
 * @file TuioBridge.h
 * @brief Main include file for the TuioBridge library
 *
 * Example usage:
 *
 * ```cpp
 * // Encode a TUIO cursor message
 * auto bytes = tuiobridge::encodeMessage("/tuio/2Dcur", {"alive", 1});
 *
 * // Relay WebSocket clients to a UDP destination
 * tuiobridge::Address udp("127.0.0.1", "3333");
 * tuiobridge::BridgeServer server("0.0.0.0", 8080,
 *     [&udp](const std::vector<std::byte>& datagram) { udp.send(datagram); });
 * server.start();
 * ```
 */

#include <string>

#include "tuiobridge/Address.h"
#include "tuiobridge/Bridge.h"
#include "tuiobridge/BridgeServer.h"
#include "tuiobridge/Bundle.h"
#include "tuiobridge/Configuration.h"
#include "tuiobridge/ConfigurationParser.h"
#include "tuiobridge/Encoder.h"
#include "tuiobridge/Exceptions.h"
#include "tuiobridge/Logging.h"
#include "tuiobridge/Message.h"
#include "tuiobridge/Normalizer.h"
#include "tuiobridge/Packet.h"
#include "tuiobridge/TypeCoercion.h"
#include "tuiobridge/Types.h"

// Version information
#define TUIOBRIDGE_VERSION_MAJOR 1
#define TUIOBRIDGE_VERSION_MINOR 0
#define TUIOBRIDGE_VERSION_PATCH 0
#define TUIOBRIDGE_VERSION_STRING "1.0.0"

/**
 * @namespace tuiobridge
 * @brief Namespace containing all TuioBridge components
 */
namespace tuiobridge {

    /**
     * @brief Get the library version as a string
     * @return Version string in format "major.minor.patch"
     */
    inline std::string getVersionString() { return TUIOBRIDGE_VERSION_STRING; }

}  // namespace tuiobridge
