/**
 * \file IAcceptLoop.hpp
 * \brief Listener abstraction shared by the TCP and in-process accept loops.
 * \ingroup transport_accept
 */
#pragma once

#include "transport/connection/IConnection.hpp"
#include "transport/endpoint/Endpoint.hpp"
#include "transport/socket/NodeType.hpp"
#include "transport/socket/SocketConfiguration.hpp"

#include <functional>
#include <memory>
#include <string>

class Logger;

namespace transport {

/** \brief Called on the accept thread for every new connection. */
using ClientConnectedHandler =
    std::function<void(const std::shared_ptr<IConnection>&, const SocketConfiguration&)>;

/** \brief Called once per connection when it disconnects. */
using ClientDisconnectedHandler = std::function<void(const std::shared_ptr<IConnection>&)>;

/**
 * \brief Listens on one endpoint and yields established connections.
 * \ingroup transport_accept
 * \details Handlers are invoked on the loop's own thread; an exception thrown by
 * a handler is logged and never stops the loop. The connection handed to
 * on_connected belongs to the application from then on.
 */
struct IAcceptLoop {
    virtual ~IAcceptLoop() = default;

    /**
     * \brief Start listening and launch the background accept thread.
     * \details Returns once the endpoint accepts connections; does not wait for
     * the first one.
     * \throws std::system_error `already_bound` while a previous bind is active
     *  or its loop has not fully stopped; `invalid_transport` for an endpoint of
     *  the wrong kind; OS errors from bind/listen.
     */
    virtual void bind(const Endpoint& endpoint, NodeType node_type, const SocketConfiguration& config,
                      ClientConnectedHandler on_connected = nullptr,
                      ClientDisconnectedHandler on_disconnected = nullptr) = 0;

    /**
     * \brief Stop listening. A second call is a no-op.
     * \param wait_for_exit Block until the accept thread has exited (ignored when
     *  called from a handler running on that thread).
     */
    virtual void unbind(bool wait_for_exit = true) = 0;

    /** \brief True between a successful bind() and the matching unbind(). */
    virtual bool is_bound() const = 0;
};

/**
 * \brief Hand a new connection to the application.
 * \details Subscribes \p on_disconnected to the connection's one-shot
 * disconnect event (holding it weakly), then calls \p on_connected. Exceptions
 * from either handler are logged under \p component and never propagate.
 */
void deliver_connection(const std::shared_ptr<IConnection>& connection, const SocketConfiguration& config,
                        const ClientConnectedHandler& on_connected,
                        const ClientDisconnectedHandler& on_disconnected,
                        const std::shared_ptr<Logger>& logger, const std::string& component);

} // namespace transport
