#include "tuiobridge/Configuration.h"

namespace tuiobridge {

    Configuration::Configuration()
        : m_wsHost(DEFAULT_WS_HOST),
          m_wsPort(DEFAULT_WS_PORT),
          m_udpHost(DEFAULT_UDP_HOST),
          m_udpPort(DEFAULT_UDP_PORT),
          m_debug(false),
          m_helpRequested(false) {}

    bool Configuration::validate(std::string &error) const {
        if (m_wsHost.empty()) {
            error = "WebSocket host must not be empty";
            return false;
        }
        if (!isValidPort(m_wsPort)) {
            error = "WebSocket port " + std::to_string(m_wsPort) + " is out of range (1-65535)";
            return false;
        }
        if (m_udpHost.empty()) {
            error = "UDP host must not be empty";
            return false;
        }
        if (!isValidPort(m_udpPort)) {
            error = "UDP port " + std::to_string(m_udpPort) + " is out of range (1-65535)";
            return false;
        }
        return true;
    }

    nlohmann::json Configuration::toJson() const {
        nlohmann::json json;
        json["wsHost"] = m_wsHost;
        json["wsPort"] = m_wsPort;
        json["udpHost"] = m_udpHost;
        json["udpPort"] = m_udpPort;
        json["debug"] = m_debug;
        return json;
    }

}  // namespace tuiobridge
