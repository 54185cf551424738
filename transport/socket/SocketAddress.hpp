/**
 * \file SocketAddress.hpp
 * \brief Host resolution and sockaddr formatting for the TCP backend.
 * \ingroup socket_backend
 */
#pragma once

#include <sys/socket.h>

#include <string>
#include <system_error>
#include <vector>

#include "transport/endpoint/Endpoint.hpp"

namespace transport {

/** \brief One candidate address produced by resolve_endpoint(). */
struct ResolvedAddress {
    int family{AF_UNSPEC};
    sockaddr_storage storage{};
    socklen_t length{0};

    const sockaddr* addr() const { return reinterpret_cast<const sockaddr*>(&storage); }
};

/**
 * \brief Resolve a TCP endpoint's host to stream socket addresses.
 * \param passive true for bind (`"*"` / `"0.0.0.0"` map to the wildcard address).
 * \param error Set to `invalid_transport` for non-TCP endpoints, or to the
 *  resolver failure (message carries the gai_strerror text).
 * \return Candidates in resolver order; empty when \p error is set.
 */
std::vector<ResolvedAddress> resolve_endpoint(const Endpoint& endpoint, bool passive,
                                              std::error_code& error);

/** \brief "ip:port" (IPv6 bracketed) or empty when the family is not IP. */
std::string format_sockaddr(const sockaddr* addr);

/** \brief Port carried by an IPv4/IPv6 sockaddr, 0 otherwise. */
unsigned short sockaddr_port(const sockaddr* addr);

} // namespace transport
