#include "SocketAddress.hpp"
#include "transport/TransportErrors.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>

#include <cstring>

namespace transport {

namespace {

class ResolverCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "getaddrinfo"; }
    std::string message(int value) const override { return ::gai_strerror(value); }
};

const std::error_category& resolver_category() {
    static const ResolverCategory category;
    return category;
}

} // namespace

std::vector<ResolvedAddress> resolve_endpoint(const Endpoint& endpoint, bool passive,
                                              std::error_code& error) {
    error.clear();
    std::vector<ResolvedAddress> result;
    if (!endpoint.is_tcp()) {
        error = make_error_code(transport_errc::invalid_transport);
        return result;
    }

    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    hints.ai_flags = AI_NUMERICSERV | (passive ? AI_PASSIVE : 0);

    const std::string& host = endpoint.host();
    const bool wildcard = passive && (host == "*" || host == "0.0.0.0");
    const char* node = wildcard ? nullptr : host.c_str();
    if (wildcard) hints.ai_family = AF_INET;
    const std::string service = std::to_string(endpoint.port());

    addrinfo* list = nullptr;
    const int rc = ::getaddrinfo(node, service.c_str(), &hints, &list);
    if (rc != 0) {
        error = std::error_code(rc, resolver_category());
        return result;
    }
    for (addrinfo* ai = list; ai != nullptr; ai = ai->ai_next) {
        if (ai->ai_addrlen > sizeof(sockaddr_storage)) continue;
        ResolvedAddress entry;
        entry.family = ai->ai_family;
        std::memcpy(&entry.storage, ai->ai_addr, ai->ai_addrlen);
        entry.length = static_cast<socklen_t>(ai->ai_addrlen);
        result.push_back(entry);
    }
    ::freeaddrinfo(list);
    if (result.empty()) {
        error = std::make_error_code(std::errc::address_not_available);
    }
    return result;
}

std::string format_sockaddr(const sockaddr* addr) {
    char ip[INET6_ADDRSTRLEN] = {0};
    if (addr->sa_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(addr);
        if (!::inet_ntop(AF_INET, &in->sin_addr, ip, sizeof(ip))) return "";
        return std::string(ip) + ":" + std::to_string(ntohs(in->sin_port));
    }
    if (addr->sa_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(addr);
        if (!::inet_ntop(AF_INET6, &in6->sin6_addr, ip, sizeof(ip))) return "";
        return "[" + std::string(ip) + "]:" + std::to_string(ntohs(in6->sin6_port));
    }
    return "";
}

unsigned short sockaddr_port(const sockaddr* addr) {
    if (addr->sa_family == AF_INET) {
        return ntohs(reinterpret_cast<const sockaddr_in*>(addr)->sin_port);
    }
    if (addr->sa_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(addr)->sin6_port);
    }
    return 0;
}

} // namespace transport
