/**
 * \file Endpoint.hpp
 * \brief Immutable transport address used for bind, connect and registry lookups.
 * \ingroup transport_endpoint
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace transport {

/** \brief Transport kinds an endpoint can address. */
enum class TransportKind : std::uint8_t {
    Tcp,
    Virtual ///< In-process, brokered by VirtualTransportRegistry.
};

std::string to_string(TransportKind kind);

/**
 * \brief Address value: `{transport, host, port}` for TCP, `{transport, name}` for virtual.
 * \details Build through the factories; they reject fields that are malformed
 * for the chosen kind. Fields irrelevant to the kind stay empty/zero so
 * equality and hashing behave as a plain value.
 */
class Endpoint {
public:
    /**
     * \brief TCP endpoint. Port 0 asks the OS for an ephemeral port on bind.
     * \throws std::invalid_argument if host is empty.
     */
    static Endpoint tcp(const std::string& host, std::uint16_t port);

    /**
     * \brief In-process endpoint identified by name.
     * \throws std::invalid_argument if name is empty.
     */
    static Endpoint virtual_endpoint(const std::string& name);

    TransportKind transport() const noexcept { return transport_; }
    const std::string& host() const noexcept { return host_; }
    std::uint16_t port() const noexcept { return port_; }
    const std::string& name() const noexcept { return name_; }

    bool is_tcp() const noexcept { return transport_ == TransportKind::Tcp; }
    bool is_virtual() const noexcept { return transport_ == TransportKind::Virtual; }

    /** \brief Same endpoint with another port (used to report an ephemeral bind). */
    Endpoint with_port(std::uint16_t port) const;

    /** \brief `tcp://host:port` or `inproc://name`. */
    std::string to_string() const;

    friend bool operator==(const Endpoint& a, const Endpoint& b) noexcept {
        return a.transport_ == b.transport_ && a.host_ == b.host_ &&
               a.port_ == b.port_ && a.name_ == b.name_;
    }
    friend bool operator!=(const Endpoint& a, const Endpoint& b) noexcept { return !(a == b); }

private:
    Endpoint(TransportKind transport, std::string host, std::uint16_t port, std::string name);

    TransportKind transport_;
    std::string host_;
    std::uint16_t port_;
    std::string name_;
};

} // namespace transport

namespace std {
template <>
struct hash<transport::Endpoint> {
    std::size_t operator()(const transport::Endpoint& e) const noexcept {
        std::size_t h = std::hash<int>{}(static_cast<int>(e.transport()));
        auto mix = [&h](std::size_t v) { h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2); };
        mix(std::hash<std::string>{}(e.host()));
        mix(std::hash<std::uint16_t>{}(e.port()));
        mix(std::hash<std::string>{}(e.name()));
        return h;
    }
};
} // namespace std
