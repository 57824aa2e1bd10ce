/*
 *  TuioBridge - WebSocket JSON to OSC/TUIO relay.
 *  This header file declares the Configuration class holding the listener and
 *  destination settings of a bridge process.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace tuiobridge {

    /**
     * @brief Runtime settings of the bridge
     *
     * Defaults match the usual TUIO setup: accept WebSocket clients on every
     * interface, port 8080, and send to a tracker client on 127.0.0.1:3333.
     */
    class Configuration {
       public:
        static constexpr const char *DEFAULT_WS_HOST = "0.0.0.0";
        static constexpr int DEFAULT_WS_PORT = 8080;
        static constexpr const char *DEFAULT_UDP_HOST = "127.0.0.1";
        static constexpr int DEFAULT_UDP_PORT = 3333;  // TUIO standard port

        Configuration();

        const std::string &getWsHost() const { return m_wsHost; }
        void setWsHost(const std::string &host) { m_wsHost = host; }

        int getWsPort() const { return m_wsPort; }
        void setWsPort(int port) { m_wsPort = port; }

        const std::string &getUdpHost() const { return m_udpHost; }
        void setUdpHost(const std::string &host) { m_udpHost = host; }

        int getUdpPort() const { return m_udpPort; }
        void setUdpPort(int port) { m_udpPort = port; }

        bool isDebug() const { return m_debug; }
        void setDebug(bool debug) { m_debug = debug; }

        /**
         * @brief Whether --help was given; the process should print usage and exit
         */
        bool isHelpRequested() const { return m_helpRequested; }
        void setHelpRequested(bool requested) { m_helpRequested = requested; }

        /**
         * @brief Check hosts are set and ports are in 1..65535
         *
         * @param error Receives a description of the first problem found
         * @return bool True if the configuration can be used
         */
        bool validate(std::string &error) const;

        /**
         * @brief Serialize the effective settings, using the configuration file keys
         */
        nlohmann::json toJson() const;

        static bool isValidPort(int port) { return port >= 1 && port <= 65535; }

       private:
        std::string m_wsHost;
        int m_wsPort;
        std::string m_udpHost;
        int m_udpPort;
        bool m_debug;
        bool m_helpRequested;
    };

}  // namespace tuiobridge
