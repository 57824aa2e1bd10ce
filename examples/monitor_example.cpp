#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "tuiobridge/Bundle.h"
#include "tuiobridge/Exceptions.h"
#include "tuiobridge/Message.h"

namespace {
    std::atomic<bool> g_shutdown_requested(false);

    void signal_handler(int) { g_shutdown_requested.store(true); }

    std::string describe(const tuiobridge::Message &message) {
        std::ostringstream ss;
        ss << message.getPath() << " " << message.typeTags();
        for (const auto &value : message.getArguments()) {
            ss << " ";
            if (value.isInt32()) {
                ss << value.asInt32();
            } else if (value.isFloat()) {
                ss << value.asFloat();
            } else {
                ss << "\"" << value.asString() << "\"";
            }
        }
        return ss.str();
    }
}  // namespace

// Prints the OSC traffic arriving on a UDP port (default 3333, the TUIO port)
int main(int argc, char *argv[]) {
    int port = argc > 1 ? std::atoi(argv[1]) : 3333;
    if (port < 1 || port > 65535) {
        std::cerr << "Invalid port: " << (argc > 1 ? argv[1] : "") << std::endl;
        return 1;
    }

    int sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        std::cerr << "Failed to create socket: " << std::strerror(errno) << std::endl;
        return 1;
    }

    sockaddr_in local;
    std::memset(&local, 0, sizeof(local));
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = htons(static_cast<uint16_t>(port));
    if (bind(sock, reinterpret_cast<sockaddr *>(&local), sizeof(local)) < 0) {
        std::cerr << "Failed to bind UDP port " << port << ": " << std::strerror(errno)
                  << std::endl;
        close(sock);
        return 1;
    }

    // Wake up periodically to check for Ctrl+C
    timeval timeout;
    timeout.tv_sec = 0;
    timeout.tv_usec = 200000;
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << "Listening for OSC on UDP port " << port << ". Press Ctrl+C to stop."
              << std::endl;

    std::vector<std::byte> buffer(65536);
    while (!g_shutdown_requested.load()) {
        ssize_t received = recv(sock, buffer.data(), buffer.size(), 0);
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            std::cerr << "Receive failed: " << std::strerror(errno) << std::endl;
            break;
        }

        size_t size = static_cast<size_t>(received);
        try {
            if (size > 0 && buffer[0] == std::byte{'#'}) {
                tuiobridge::Bundle bundle = tuiobridge::Bundle::deserialize(buffer.data(), size);
                std::cout << "bundle (" << size << " bytes, " << bundle.size() << " messages)"
                          << std::endl;
                bundle.forEach([](const tuiobridge::Message &message) {
                    std::cout << "  " << describe(message) << std::endl;
                });
            } else {
                tuiobridge::Message message = tuiobridge::Message::deserialize(buffer.data(), size);
                std::cout << describe(message) << " (" << size << " bytes)" << std::endl;
            }
        } catch (const tuiobridge::BridgeException &e) {
            std::cerr << "Malformed datagram (" << size << " bytes): " << e.what() << std::endl;
        }
    }

    close(sock);
    std::cout << "Monitor stopped." << std::endl;
    return 0;
}
