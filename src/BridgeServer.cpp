#include "tuiobridge/BridgeServer.h"

#include "tuiobridge/Exceptions.h"
#include "tuiobridge/Logging.h"

namespace tuiobridge {

    BridgeConnectionState::BridgeConnectionState(DatagramSender sender, std::string destination)
        : bridge_(std::move(sender), std::move(destination)) {}

    std::string BridgeConnectionState::peer() {
        const std::string &ip = getRemoteIp();
        if (ip.empty()) {
            return "unknown";
        }
        return ip + ":" + std::to_string(getRemotePort());
    }

    BridgeServer::BridgeServer(const std::string &host, int port, DatagramSender sender,
                               std::string destination)
        : server_(port, host), sender_(std::move(sender)), destination_(std::move(destination)) {
        if (!sender_) {
            throw InvalidArgumentException("BridgeServer requires a datagram sender");
        }

        server_.setConnectionStateFactory([this]() -> std::shared_ptr<ix::ConnectionState> {
            return std::make_shared<BridgeConnectionState>(sender_, destination_);
        });

        server_.setOnClientMessageCallback(
            [this](std::shared_ptr<ix::ConnectionState> connectionState, ix::WebSocket &,
                   const ix::WebSocketMessagePtr &msg) { onClientMessage(connectionState, msg); });
    }

    BridgeServer::~BridgeServer() { stop(); }

    void BridgeServer::start() {
        if (running_) {
            return;
        }

        auto result = server_.listen();
        if (!result.first) {
            throw ServerException("Failed to listen on " + server_.getHost() + ":" +
                                  std::to_string(server_.getPort()) + ": " + result.second);
        }

        server_.start();
        running_ = true;
        logInfo("WebSocket server listening on " + server_.getHost() + ":" +
                std::to_string(server_.getPort()));
    }

    void BridgeServer::stop() {
        if (!running_.exchange(false)) {
            return;
        }

        server_.stop();
        logInfo("WebSocket server stopped");
    }

    int BridgeServer::getPort() { return server_.getPort(); }

    std::string BridgeServer::getHost() { return server_.getHost(); }

    void BridgeServer::onClientMessage(const std::shared_ptr<ix::ConnectionState> &connectionState,
                                       const ix::WebSocketMessagePtr &msg) {
        auto state = std::dynamic_pointer_cast<BridgeConnectionState>(connectionState);
        if (!state) {
            logError("Connection " + connectionState->getId() + " has no bridge state");
            return;
        }

        switch (msg->type) {
            case ix::WebSocketMessageType::Open:
                ++connections_;
                logInfo("Client connected: " + state->peer() + " (id " + state->getId() + ")");
                break;

            case ix::WebSocketMessageType::Message:
                if (msg->binary) {
                    state->bridge().handleBinary(msg->str.size());
                } else {
                    state->bridge().handleText(msg->str);
                }
                break;

            case ix::WebSocketMessageType::Close:
                --connections_;
                logInfo("Client disconnected: " + state->peer() + " (code " +
                        std::to_string(msg->closeInfo.code) + ", " +
                        state->bridge().stats().toString() + ")");
                break;

            case ix::WebSocketMessageType::Error:
                logError("Connection error from " + state->peer() + ": " + msg->errorInfo.reason);
                break;

            default:
                // Ping, pong and fragments need no handling
                break;
        }
    }

}  // namespace tuiobridge
