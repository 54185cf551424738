/**
 * \file VirtualAcceptLoop.hpp
 * \brief Accept loop for in-process endpoints.
 * \ingroup transport_accept
 */
#pragma once

#include "transport/accept/IAcceptLoop.hpp"
#include "transport/virtual/VirtualTransportRegistry.hpp"
#include "cancellation.hpp"

#include <memory>
#include <optional>
#include <thread>

class Logger;

namespace transport {

/**
 * \brief Registers as the accepter of a virtual endpoint and drains its pending queue.
 * \ingroup transport_accept
 * \details Same contract as TcpAcceptLoop. The node type and socket
 * configuration are passed through to on_connected unchanged; they have no
 * effect on in-memory streams.
 */
class VirtualAcceptLoop : public IAcceptLoop {
public:
    explicit VirtualAcceptLoop(VirtualTransportRegistry& registry = VirtualTransportRegistry::instance(),
                               std::shared_ptr<Logger> logger = nullptr);
    ~VirtualAcceptLoop() override;

    VirtualAcceptLoop(const VirtualAcceptLoop&) = delete;
    VirtualAcceptLoop& operator=(const VirtualAcceptLoop&) = delete;

    /**
     * \copydoc IAcceptLoop::bind
     * \details Also throws `already_registered` when another accepter owns the endpoint.
     */
    void bind(const Endpoint& endpoint, NodeType node_type, const SocketConfiguration& config,
              ClientConnectedHandler on_connected = nullptr,
              ClientDisconnectedHandler on_disconnected = nullptr) override;
    void unbind(bool wait_for_exit = true) override;
    bool is_bound() const override;

    std::optional<Endpoint> bound_endpoint() const;

private:
    struct Shared;

    static void run(std::shared_ptr<Shared> shared,
                    std::shared_ptr<VirtualTransportRegistry::PendingQueue> pending, SocketConfiguration config,
                    ClientConnectedHandler on_connected, ClientDisconnectedHandler on_disconnected,
                    CancellationToken cancel);
    bool on_loop_thread() const;

    VirtualTransportRegistry& registry_;
    std::shared_ptr<Shared> shared_;
    std::thread thread_;  // guarded by Shared::mutex
};

} // namespace transport
