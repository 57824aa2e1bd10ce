/*
 *  TuioBridge - WebSocket JSON to OSC/TUIO relay.
 *  This header file declares the BridgeServer class, the WebSocket listener
 *  that gives every client connection its own Bridge.
 */

#pragma once

#include <atomic>
#include <ixwebsocket/IXConnectionState.h>
#include <ixwebsocket/IXWebSocket.h>
#include <ixwebsocket/IXWebSocketServer.h>
#include <memory>
#include <string>

#include "tuiobridge/Bridge.h"

namespace tuiobridge {

    /**
     * @brief Connection state carrying the connection's Bridge
     *
     * Created by the server for every accepted client; lives as long as the
     * connection thread does.
     */
    class BridgeConnectionState : public ix::ConnectionState {
       public:
        BridgeConnectionState(DatagramSender sender, std::string destination);

        Bridge &bridge() { return bridge_; }

        std::string peer();

       private:
        Bridge bridge_;
    };

    class BridgeServer {
       public:
        /**
         * @brief Construct a server
         *
         * @param host Interface to bind
         * @param port TCP port to listen on
         * @param sender Shared sink for encoded datagrams; called concurrently
         *        from every connection thread
         * @param destination Description of the datagram destination, for logging
         */
        BridgeServer(const std::string &host, int port, DatagramSender sender,
                     std::string destination = std::string());

        ~BridgeServer();

        BridgeServer(const BridgeServer &) = delete;
        BridgeServer &operator=(const BridgeServer &) = delete;

        /**
         * @brief Bind the listener and start accepting clients
         * @throws ServerException if the socket cannot be bound
         */
        void start();

        /**
         * @brief Close every connection and stop listening
         */
        void stop();

        bool isRunning() const { return running_; }

        int getPort();

        std::string getHost();

        /**
         * @brief Number of clients currently connected
         */
        int connectionCount() const { return connections_; }

       private:
        void onClientMessage(const std::shared_ptr<ix::ConnectionState> &connectionState,
                             const ix::WebSocketMessagePtr &msg);

        ix::WebSocketServer server_;
        DatagramSender sender_;
        std::string destination_;
        std::atomic<bool> running_{false};
        std::atomic<int> connections_{0};
    };

}  // namespace tuiobridge
