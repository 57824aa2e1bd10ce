/*
 *  TuioBridge - WebSocket JSON to OSC/TUIO relay.
 *  This file declares the AddressImpl class, which owns the UDP socket and the
 *  resolved destination behind Address.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

#define TUIOBRIDGE_INVALID_SOCKET (-1)

namespace tuiobridge {

    // Largest payload a single UDP datagram can carry
    constexpr size_t MAX_DATAGRAM_SIZE = 65507;

    class AddressImpl {
       public:
        /**
         * @brief Construct a new Address Implementation object
         *
         * @param host The hostname or IP address to send to
         * @param port The port to send to
         * @throws BridgeException if the address cannot be resolved or the socket cannot be created
         */
        AddressImpl(std::string host, std::string port);

        ~AddressImpl();

        AddressImpl(const AddressImpl &) = delete;
        AddressImpl &operator=(const AddressImpl &) = delete;

        /**
         * @brief Send one datagram to the address
         * @throws TransportException if the data cannot be sent
         */
        void send(const std::vector<std::byte> &data);

        std::string url() const;

        const std::string &host() const { return host_; }

        const std::string &port() const { return port_; }

       private:
        void resolveAddress();
        void initializeSocket();
        void cleanup();
        static std::string getSystemErrorMessage();

        std::string host_;
        std::string port_;
        int socket_ = TUIOBRIDGE_INVALID_SOCKET;
        struct addrinfo *addrInfo_ = nullptr;
        struct addrinfo *target_ = nullptr;  // Entry of addrInfo_ the socket was created for
    };

}  // namespace tuiobridge
