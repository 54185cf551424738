/**
 * \file TcpAcceptLoop.cpp
 * \brief Listener setup and the acceptor thread body.
 * \ingroup transport_accept
 */
#include "TcpAcceptLoop.hpp"
#include "transport/TransportErrors.hpp"
#include "transport/socket/NetworkConnection.hpp"
#include "transport/socket/SocketAddress.hpp"
#include "logger.hpp"
#include "processUtils.hpp"

#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <utility>

#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace transport {

bool is_transient_accept_error(int err) noexcept {
    switch (err) {
        case ECONNABORTED:
        case EINTR:
        case EPROTO:
        case EMFILE:
        case ENFILE:
        case ENOBUFS:
        case ENOMEM:
        case EPERM:
            return true;
        default:
            return false;
    }
}

// Held by the loop thread as well, so a handler may destroy the loop object.
struct TcpAcceptLoop::Shared {
    explicit Shared(std::shared_ptr<Logger> l) : logger(std::move(l)) {}

    std::shared_ptr<Logger> logger;

    std::mutex mutex;
    std::condition_variable stopped_cv;
    int listen_fd{-1};
    bool loop_running{false};
    std::uint16_t local_port{0};
    std::optional<Endpoint> bound_endpoint;
    std::unique_ptr<CancellationSource> cancel;
};

TcpAcceptLoop::TcpAcceptLoop(std::shared_ptr<Logger> logger, int backlog)
    : backlog_(backlog), shared_(std::make_shared<Shared>(std::move(logger))) {}

TcpAcceptLoop::~TcpAcceptLoop() {
    unbind(true);
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (thread_.joinable()) {
        if (on_loop_thread()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

void TcpAcceptLoop::bind(const Endpoint& endpoint, NodeType node_type, const SocketConfiguration& config,
                         ClientConnectedHandler on_connected, ClientDisconnectedHandler on_disconnected) {
    if (!endpoint.is_tcp()) {
        throw_transport_error(transport_errc::invalid_transport,
                              "TcpAcceptLoop: cannot bind " + endpoint.to_string());
    }

    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->listen_fd >= 0 || shared_->loop_running) {
            throw_transport_error(transport_errc::already_bound,
                                  "TcpAcceptLoop: already bound, unbind first");
        }
        previous = std::move(thread_);
    }
    // Loop already exited; only the OS thread is left to reap.
    if (previous.joinable()) previous.join();

    std::uint16_t port = 0;
    const int fd = open_listener(endpoint, port);
    const Endpoint bound = endpoint.with_port(port);

    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (shared_->listen_fd >= 0 || shared_->loop_running || thread_.joinable()) {
        ::close(fd);
        throw_transport_error(transport_errc::already_bound,
                              "TcpAcceptLoop: already bound, unbind first");
    }
    shared_->cancel = std::make_unique<CancellationSource>();
    shared_->listen_fd = fd;
    shared_->local_port = port;
    shared_->bound_endpoint = bound;
    shared_->loop_running = true;
    thread_ = std::thread(&TcpAcceptLoop::run, shared_,
                          LoopContext{fd, bound, node_type, config, std::move(on_connected),
                                      std::move(on_disconnected), shared_->cancel->token()});
    if (shared_->logger) {
        shared_->logger->info("TcpAcceptLoop: listening on " + bound.to_string() + " as " + to_string(node_type));
    }
}

void TcpAcceptLoop::unbind(bool wait_for_exit) {
    std::thread to_join;
    {
        std::unique_lock<std::mutex> lock(shared_->mutex);
        const int fd = std::exchange(shared_->listen_fd, -1);
        if (fd >= 0) {
            shared_->cancel->cancel();
            // Wakes accept(); the loop thread closes the descriptor on its way out.
            ::shutdown(fd, SHUT_RDWR);
            if (shared_->logger && shared_->bound_endpoint) {
                shared_->logger->info("TcpAcceptLoop: unbinding " + shared_->bound_endpoint->to_string());
            }
            shared_->bound_endpoint.reset();
            shared_->local_port = 0;
        }
        if (!wait_for_exit || on_loop_thread()) return;
        shared_->stopped_cv.wait(lock, [this]() { return !shared_->loop_running; });
        to_join = std::move(thread_);
    }
    if (to_join.joinable()) to_join.join();
}

bool TcpAcceptLoop::is_bound() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->listen_fd >= 0;
}

std::uint16_t TcpAcceptLoop::local_port() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->local_port;
}

std::optional<Endpoint> TcpAcceptLoop::bound_endpoint() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->bound_endpoint;
}

int TcpAcceptLoop::open_listener(const Endpoint& endpoint, std::uint16_t& bound_port) {
    std::error_code ec;
    auto candidates = resolve_endpoint(endpoint, true, ec);
    if (ec) {
        throw std::system_error(ec, "TcpAcceptLoop: cannot resolve " + endpoint.to_string());
    }

    int last_error = EADDRNOTAVAIL;
    for (const auto& candidate : candidates) {
        int fd = ::socket(candidate.family, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
        if (fd < 0) {
            last_error = errno;
            continue;
        }
        int reuse = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
        if (::bind(fd, candidate.addr(), candidate.length) < 0 || ::listen(fd, backlog_) < 0) {
            last_error = errno;
            ::close(fd);
            continue;
        }
        // Non-blocking so a connection reset between poll() and accept() cannot stall the loop.
        const int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            last_error = errno;
            ::close(fd);
            continue;
        }
        sockaddr_storage local{};
        socklen_t len = sizeof(local);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) == 0) {
            bound_port = sockaddr_port(reinterpret_cast<sockaddr*>(&local));
        } else {
            bound_port = endpoint.port();
        }
        return fd;
    }
    throw std::system_error(std::error_code(last_error, std::system_category()),
                            "TcpAcceptLoop: cannot listen on " + endpoint.to_string());
}

void TcpAcceptLoop::run(std::shared_ptr<Shared> shared, LoopContext context) {
    ProcessUtils::set_current_thread_name("AcceptLoop");
    const auto slice = static_cast<int>(NetworkConnection::kPollSlice.count());

    while (!context.cancel.is_cancelled()) {
        pollfd pfd{context.listen_fd, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, slice);
        if (rc == 0) continue;
        if (rc < 0) {
            if (errno == EINTR) continue;
            if (shared->logger) {
                shared->logger->error(std::string("TcpAcceptLoop: poll failed: ") + std::strerror(errno));
            }
            break;
        }
        if (context.cancel.is_cancelled()) break;

        const int fd = ::accept4(context.listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (fd < 0) {
            const int err = errno;
            // Listener shut down or closed by unbind(): normal shutdown.
            if (context.cancel.is_cancelled() || err == EBADF || err == EINVAL) break;
            if (err == EAGAIN || err == EWOULDBLOCK) continue;
            if (is_transient_accept_error(err)) {
                if (shared->logger) {
                    shared->logger->warning(std::string("TcpAcceptLoop: accept failed, retrying: ") +
                                            std::strerror(err));
                }
                std::this_thread::sleep_for(kAcceptRetryDelay);
                continue;
            }
            if (shared->logger) {
                shared->logger->error(std::string("TcpAcceptLoop: accept failed, stopping: ") + std::strerror(err));
            }
            break;
        }
        handle_accepted(fd, context, shared->logger);
    }

    if (shared->logger) {
        shared->logger->debug("TcpAcceptLoop: accept loop exited for " + context.endpoint.to_string());
    }
    std::lock_guard<std::mutex> lock(shared->mutex);
    if (shared->listen_fd == context.listen_fd) {
        // Loop ended on its own; detach the listener so bind() can be called again.
        shared->listen_fd = -1;
        shared->bound_endpoint.reset();
        shared->local_port = 0;
    }
    ::close(context.listen_fd);
    shared->loop_running = false;
    shared->stopped_cv.notify_all();
}

void TcpAcceptLoop::handle_accepted(int fd, const LoopContext& context, const std::shared_ptr<Logger>& logger) {
    auto connection = std::make_shared<NetworkConnection>(fd, context.endpoint, logger);
    connection->apply_configuration(context.config, node_type_has_receive_timeout(context.node_type));
    if (logger) {
        logger->info("TcpAcceptLoop: accepted " + connection->remote_endpoint() + " on " +
                     context.endpoint.to_string());
    }

    deliver_connection(connection, context.config, context.on_connected, context.on_disconnected,
                       logger, "TcpAcceptLoop");
}

bool TcpAcceptLoop::on_loop_thread() const {
    return thread_.get_id() == std::this_thread::get_id();
}

} // namespace transport
