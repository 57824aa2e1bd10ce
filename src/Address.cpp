#include "tuiobridge/Address.h"

#include "AddressImpl.h"

namespace tuiobridge {

    Address::Address(const std::string &host, const std::string &port)
        : impl_(std::make_unique<AddressImpl>(host, port)) {}

    Address::~Address() = default;

    Address::Address(Address &&other) noexcept = default;

    Address &Address::operator=(Address &&other) noexcept = default;

    void Address::send(const std::vector<std::byte> &data) { impl_->send(data); }

    std::string Address::url() const { return impl_->url(); }

    std::string Address::host() const { return impl_->host(); }

    std::string Address::port() const { return impl_->port(); }

}  // namespace tuiobridge
