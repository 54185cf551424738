/**
 * \file SocketConfiguration.hpp
 * \brief Per-connection socket policy supplied at bind/connect time.
 * \ingroup socket_backend
 */
#pragma once

#include <chrono>
#include <cstddef>

namespace transport {

/**
 * \brief Immutable socket parameters applied to every accepted or connected socket.
 * \ingroup socket_backend
 * \details A zero timeout means "no timeout". The receive timeout is applied
 * only when the connection's NodeType policy asks for it
 * (see node_type_has_receive_timeout()).
 */
struct SocketConfiguration {
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds send_timeout{5000};
    std::chrono::milliseconds receive_timeout{5000};
    int send_buffer_size{65536};
    int receive_buffer_size{65536};

    /** \brief Library defaults (also the defaults of the `--socket-*` options). */
    static SocketConfiguration defaults() { return SocketConfiguration{}; }

    friend bool operator==(const SocketConfiguration& a, const SocketConfiguration& b) {
        return a.connect_timeout == b.connect_timeout && a.send_timeout == b.send_timeout &&
               a.receive_timeout == b.receive_timeout && a.send_buffer_size == b.send_buffer_size &&
               a.receive_buffer_size == b.receive_buffer_size;
    }
};

} // namespace transport
