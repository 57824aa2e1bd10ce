#include "AddressImpl.h"

#include <cerrno>
#include <cstring>

#include "tuiobridge/Exceptions.h"

namespace tuiobridge {

    AddressImpl::AddressImpl(std::string host, std::string port)
        : host_(std::move(host)), port_(std::move(port)) {
        try {
            resolveAddress();
            initializeSocket();
        } catch (const BridgeException &) {
            // Release whatever was allocated before the failure
            cleanup();
            throw;
        }
    }

    AddressImpl::~AddressImpl() { cleanup(); }

    void AddressImpl::cleanup() {
        if (socket_ != TUIOBRIDGE_INVALID_SOCKET) {
            close(socket_);
            socket_ = TUIOBRIDGE_INVALID_SOCKET;
        }

        if (addrInfo_) {
            freeaddrinfo(addrInfo_);
            addrInfo_ = nullptr;
            target_ = nullptr;
        }
    }

    void AddressImpl::resolveAddress() {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_DGRAM;

        int result = getaddrinfo(host_.c_str(), port_.c_str(), &hints, &addrInfo_);
        if (result != 0) {
            addrInfo_ = nullptr;
            throw AddressException("Failed to resolve host '" + host_ + "' with port '" + port_ +
                                   "': " + gai_strerror(result));
        }
    }

    void AddressImpl::initializeSocket() {
        // Try each address until we successfully create a socket
        for (struct addrinfo *addr = addrInfo_; addr != nullptr; addr = addr->ai_next) {
            socket_ = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
            if (socket_ != TUIOBRIDGE_INVALID_SOCKET) {
                // Send-only socket; the OS picks the local port on first sendto
                target_ = addr;
                return;
            }
        }

        throw SocketException("Failed to create UDP socket for " + host_ + ":" + port_ + ": " +
                              getSystemErrorMessage());
    }

    void AddressImpl::send(const std::vector<std::byte> &data) {
        if (socket_ == TUIOBRIDGE_INVALID_SOCKET || !target_) {
            throw TransportException("Cannot send datagram: socket not initialized");
        }

        if (data.size() > MAX_DATAGRAM_SIZE) {
            throw TransportException("Datagram exceeds maximum UDP payload (" +
                                     std::to_string(data.size()) + " > " +
                                     std::to_string(MAX_DATAGRAM_SIZE) + " bytes)");
        }

        ssize_t bytesSent = sendto(socket_, reinterpret_cast<const char *>(data.data()),
                                   data.size(), 0, target_->ai_addr, target_->ai_addrlen);
        if (bytesSent < 0) {
            throw TransportException("UDP send to " + host_ + ":" + port_ +
                                     " failed: " + getSystemErrorMessage());
        }
        if (static_cast<size_t>(bytesSent) != data.size()) {
            throw TransportException("UDP send to " + host_ + ":" + port_ + " was truncated (" +
                                     std::to_string(bytesSent) + " of " +
                                     std::to_string(data.size()) + " bytes)");
        }
    }

    std::string AddressImpl::url() const {
        // IPv6 literals need brackets
        if (host_.find(':') != std::string::npos) {
            return "osc.udp://[" + host_ + "]:" + port_ + "/";
        }
        return "osc.udp://" + host_ + ":" + port_ + "/";
    }

    std::string AddressImpl::getSystemErrorMessage() { return std::strerror(errno); }

}  // namespace tuiobridge
