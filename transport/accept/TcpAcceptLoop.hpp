/**
 * \file TcpAcceptLoop.hpp
 * \brief Accept loop for TCP endpoints on a dedicated acceptor thread.
 * \ingroup transport_accept
 */
#pragma once

#include "transport/accept/IAcceptLoop.hpp"
#include "cancellation.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <thread>

class Logger;

namespace transport {

/**
 * \brief Listening socket plus the thread that accepts from it.
 * \ingroup transport_accept
 * \details The listener descriptor is handed to the loop thread at bind() and
 * closed by that thread when it exits; unbind() only takes it out of the
 * object (so a racing bind() sees a clean state), cancels the loop and shuts
 * the socket down to wake a pending accept. The loop object may be destroyed
 * from its own connect handler.
 */
class TcpAcceptLoop : public IAcceptLoop {
public:
    /** \brief Back-off after a transient accept() failure. */
    static constexpr std::chrono::milliseconds kAcceptRetryDelay{50};

    explicit TcpAcceptLoop(std::shared_ptr<Logger> logger = nullptr, int backlog = 128);
    ~TcpAcceptLoop() override;

    TcpAcceptLoop(const TcpAcceptLoop&) = delete;
    TcpAcceptLoop& operator=(const TcpAcceptLoop&) = delete;

    void bind(const Endpoint& endpoint, NodeType node_type, const SocketConfiguration& config,
              ClientConnectedHandler on_connected = nullptr,
              ClientDisconnectedHandler on_disconnected = nullptr) override;
    void unbind(bool wait_for_exit = true) override;
    bool is_bound() const override;

    /** \brief Port the listener is bound to (resolves an ephemeral 0); 0 when unbound. */
    std::uint16_t local_port() const;

    /** \brief Bound endpoint with the actual port filled in. */
    std::optional<Endpoint> bound_endpoint() const;

private:
    struct LoopContext {
        int listen_fd;
        Endpoint endpoint;
        NodeType node_type;
        SocketConfiguration config;
        ClientConnectedHandler on_connected;
        ClientDisconnectedHandler on_disconnected;
        CancellationToken cancel;
    };

    struct Shared;

    int open_listener(const Endpoint& endpoint, std::uint16_t& bound_port);
    static void run(std::shared_ptr<Shared> shared, LoopContext context);
    static void handle_accepted(int fd, const LoopContext& context, const std::shared_ptr<Logger>& logger);
    bool on_loop_thread() const;

    const int backlog_;
    std::shared_ptr<Shared> shared_;
    std::thread thread_;  // guarded by Shared::mutex
};

/** \brief accept() errors retried after kAcceptRetryDelay instead of ending the loop. */
bool is_transient_accept_error(int err) noexcept;

} // namespace transport
