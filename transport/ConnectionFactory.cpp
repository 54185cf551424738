/**
 * \file ConnectionFactory.cpp
 * \brief Backend selection for client connects and accept loops.
 * \ingroup transport_connection
 */
#include "ConnectionFactory.hpp"
#include "transport/TransportErrors.hpp"
#include "transport/accept/TcpAcceptLoop.hpp"
#include "transport/accept/VirtualAcceptLoop.hpp"
#include "transport/socket/NetworkConnection.hpp"
#include "transport/virtual/VirtualTransportRegistry.hpp"
#include "logger.hpp"

#include <stdexcept>

namespace transport {

std::shared_ptr<IConnection> ConnectionFactory::connect(const Endpoint& endpoint, const SocketConfiguration& config,
                                                        NodeType node_type, VirtualTransportRegistry& registry,
                                                        std::shared_ptr<Logger> logger,
                                                        const CancellationToken& cancel) {
    switch (endpoint.transport()) {
        case TransportKind::Tcp: {
            std::error_code ec;
            auto connection = NetworkConnection::connect(endpoint, config, node_type_has_receive_timeout(node_type),
                                                         ec, logger, cancel);
            if (!connection) {
                throw std::system_error(ec, "ConnectionFactory: connect to " + endpoint.to_string());
            }
            return connection;
        }
        case TransportKind::Virtual: {
            auto connection = registry.connect(endpoint);
            if (logger) logger->debug("ConnectionFactory: connected to " + endpoint.to_string());
            return connection;
        }
    }
    throw_transport_error(transport_errc::invalid_transport, "ConnectionFactory: " + endpoint.to_string());
}

std::shared_ptr<IConnection> ConnectionFactory::connect(const Endpoint& endpoint, const SocketConfiguration& config,
                                                        NodeType node_type, std::shared_ptr<Logger> logger) {
    return connect(endpoint, config, node_type, VirtualTransportRegistry::instance(), std::move(logger));
}

std::unique_ptr<IAcceptLoop> ConnectionFactory::create_accept_loop(TransportKind kind,
                                                                   VirtualTransportRegistry& registry,
                                                                   std::shared_ptr<Logger> logger) {
    switch (kind) {
        case TransportKind::Tcp:
            return std::make_unique<TcpAcceptLoop>(std::move(logger));
        case TransportKind::Virtual:
            return std::make_unique<VirtualAcceptLoop>(registry, std::move(logger));
    }
    throw std::invalid_argument("ConnectionFactory: unsupported transport kind");
}

} // namespace transport
