/**
 * \file ConnectionFactory.hpp
 * \brief Client connect and accept-loop construction for either transport kind.
 * \ingroup transport_connection
 * \details Picks the TCP or in-process backend from the endpoint so callers
 * can stay transport-neutral.
 */
#pragma once

#include <memory>

#include "cancellation.hpp"
#include "transport/accept/IAcceptLoop.hpp"
#include "transport/connection/IConnection.hpp"
#include "transport/socket/NodeType.hpp"
#include "transport/socket/SocketConfiguration.hpp"

class Logger;

namespace transport {

class VirtualTransportRegistry;

/** \brief Static factory for connections and accept loops.
 *  \ingroup transport_connection
 */
class ConnectionFactory {
public:
    /**
     * \brief Connect to \p endpoint.
     * \details TCP endpoints get a NetworkConnection configured from \p config
     * (receive timeout per \p node_type); virtual endpoints are connected through
     * \p registry.
     * \throws std::system_error on failure: the OS code for TCP, `not_listening`
     *  or `invalid_transport` for virtual endpoints, `cancelled` if \p cancel fired.
     */
    static std::shared_ptr<IConnection> connect(const Endpoint& endpoint, const SocketConfiguration& config,
                                                NodeType node_type, VirtualTransportRegistry& registry,
                                                std::shared_ptr<Logger> logger = nullptr,
                                                const CancellationToken& cancel = {});

    /** \brief Same, using VirtualTransportRegistry::instance(). */
    static std::shared_ptr<IConnection> connect(const Endpoint& endpoint, const SocketConfiguration& config,
                                                NodeType node_type, std::shared_ptr<Logger> logger = nullptr);

    /** \brief Unbound accept loop matching \p kind. */
    static std::unique_ptr<IAcceptLoop> create_accept_loop(TransportKind kind, VirtualTransportRegistry& registry,
                                                           std::shared_ptr<Logger> logger = nullptr);

private:
    // Static-only: prevent instantiation
    ConnectionFactory() = delete;
};

} // namespace transport
