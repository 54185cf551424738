#include "Endpoint.hpp"

#include <stdexcept>
#include <utility>

namespace transport {

std::string to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::Tcp:     return "tcp";
        case TransportKind::Virtual: return "inproc";
        default:                     return "unknown";
    }
}

Endpoint::Endpoint(TransportKind transport, std::string host, std::uint16_t port, std::string name)
    : transport_(transport), host_(std::move(host)), port_(port), name_(std::move(name)) {}

Endpoint Endpoint::tcp(const std::string& host, std::uint16_t port) {
    if (host.empty()) {
        throw std::invalid_argument("Endpoint::tcp: host must not be empty");
    }
    return Endpoint(TransportKind::Tcp, host, port, {});
}

Endpoint Endpoint::virtual_endpoint(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("Endpoint::virtual_endpoint: name must not be empty");
    }
    return Endpoint(TransportKind::Virtual, {}, 0, name);
}

Endpoint Endpoint::with_port(std::uint16_t port) const {
    Endpoint copy = *this;
    if (copy.is_tcp()) copy.port_ = port;
    return copy;
}

std::string Endpoint::to_string() const {
    if (is_virtual()) {
        return transport::to_string(transport_) + "://" + name_;
    }
    // Bracket IPv6 literals so the port separator stays unambiguous
    const bool v6 = host_.find(':') != std::string::npos;
    return transport::to_string(transport_) + "://" + (v6 ? "[" + host_ + "]" : host_) +
           ":" + std::to_string(port_);
}

} // namespace transport
