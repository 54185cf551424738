/**
 * \file VirtualTransportRegistry.hpp
 * \brief Directory pairing in-process connectors with registered accepters.
 * \ingroup virtual_backend
 */
#pragma once

#include "transport/virtual/VirtualConnection.hpp"
#include "transport/endpoint/Endpoint.hpp"
#include "threadSafeQueue.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

class Logger;

namespace transport {

/**
 * \brief Maps virtual endpoints to the pending-connection queue of their accepter.
 * \ingroup virtual_backend
 * \details At most one accepter per endpoint. All operations are mutex-guarded
 * and may be called from any thread. Configuration errors are thrown as
 * `std::system_error` carrying a transport_errc code.
 */
class VirtualTransportRegistry {
public:
    using PendingQueue = ThreadSafeQueue<std::shared_ptr<VirtualConnection>>;

    explicit VirtualTransportRegistry(std::shared_ptr<Logger> logger = nullptr);

    VirtualTransportRegistry(const VirtualTransportRegistry&) = delete;
    VirtualTransportRegistry& operator=(const VirtualTransportRegistry&) = delete;

    /** \brief Process-wide default registry. */
    static VirtualTransportRegistry& instance();

    /**
     * \brief Install an empty pending queue for \p endpoint.
     * \throws std::system_error `invalid_transport` if \p endpoint is not virtual,
     *  `already_registered` if an accepter already exists.
     */
    std::shared_ptr<PendingQueue> register_accepter(const Endpoint& endpoint);

    /**
     * \brief Create a connection pair and hand the accepter end to the listener.
     * \details Never blocks: the accepter end is queued and the connector end
     * returned immediately.
     * \throws std::system_error `invalid_transport` or `not_listening`.
     */
    std::shared_ptr<VirtualConnection> connect(const Endpoint& endpoint);

    /**
     * \brief Remove the accepter, shutting its queue down so a waiting accept wakes.
     * \details Connections already handed out are not affected; ends still queued
     * and never accepted are closed.
     * \return true if a registration existed.
     */
    bool unregister_accepter(const Endpoint& endpoint);

    bool is_registered(const Endpoint& endpoint) const;

    std::vector<Endpoint> registered_endpoints() const;

private:
    std::shared_ptr<Logger> logger_;
    mutable std::mutex mutex_;
    std::unordered_map<Endpoint, std::shared_ptr<PendingQueue>> accepters_;
};

} // namespace transport
