/*
 *  TuioBridge - WebSocket JSON to OSC/TUIO relay.
 *  This header file declares the Address class, the UDP destination every
 *  encoded packet is sent to.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace tuiobridge {

    // Forward declarations
    class AddressImpl;

    /**
     * @brief A resolved UDP destination with its own send socket
     *
     * The socket is opened once, on construction, and written from any number
     * of connection threads; each send() is a single sendto() call.
     */
    class Address {
       public:
        /**
         * @brief Resolve the destination and open the socket
         * @param host Hostname or IP address.
         * @param port Port number or service name.
         * @throws AddressException if the host cannot be resolved
         * @throws SocketException if the socket cannot be created
         */
        Address(const std::string &host, const std::string &port);

        ~Address();

        Address(const Address &) = delete;
        Address &operator=(const Address &) = delete;

        Address(Address &&other) noexcept;
        Address &operator=(Address &&other) noexcept;

        /**
         * @brief Send one datagram
         * @param data The datagram payload
         * @throws TransportException if the datagram could not be sent
         */
        void send(const std::vector<std::byte> &data);

        /**
         * @brief Get the URL of this address, "osc.udp://host:port/"
         */
        std::string url() const;

        std::string host() const;

        std::string port() const;

       private:
        std::unique_ptr<AddressImpl> impl_;
    };

}  // namespace tuiobridge
