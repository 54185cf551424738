/**
 * \file VirtualAcceptLoop.cpp
 * \brief Pending-queue consumer thread for in-process endpoints.
 * \ingroup transport_accept
 */
#include "VirtualAcceptLoop.hpp"
#include "transport/TransportErrors.hpp"
#include "logger.hpp"
#include "processUtils.hpp"

#include <condition_variable>
#include <mutex>
#include <utility>

namespace transport {

// Held by the loop thread as well, so a handler may destroy the loop object.
struct VirtualAcceptLoop::Shared {
    explicit Shared(std::shared_ptr<Logger> l) : logger(std::move(l)) {}

    std::shared_ptr<Logger> logger;

    std::mutex mutex;
    std::condition_variable stopped_cv;
    std::optional<Endpoint> bound_endpoint;
    bool loop_running{false};
    std::unique_ptr<CancellationSource> cancel;
};

VirtualAcceptLoop::VirtualAcceptLoop(VirtualTransportRegistry& registry, std::shared_ptr<Logger> logger)
    : registry_(registry), shared_(std::make_shared<Shared>(std::move(logger))) {}

VirtualAcceptLoop::~VirtualAcceptLoop() {
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

void VirtualAcceptLoop::bind(const Endpoint& endpoint, NodeType node_type, const SocketConfiguration& config,
                             ClientConnectedHandler on_connected, ClientDisconnectedHandler on_disconnected) {
    if (!endpoint.is_virtual()) {
        throw_transport_error(transport_errc::invalid_transport,
                              "VirtualAcceptLoop: cannot bind " + endpoint.to_string());
    }

    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->bound_endpoint || shared_->loop_running) {
            throw_transport_error(transport_errc::already_bound,
                                  "VirtualAcceptLoop: already bound, unbind first");
        }
        previous = std::move(thread_);
    }
    if (previous.joinable()) previous.join();

    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (shared_->bound_endpoint || shared_->loop_running || thread_.joinable()) {
        throw_transport_error(transport_errc::already_bound,
                              "VirtualAcceptLoop: already bound, unbind first");
    }
    auto pending = registry_.register_accepter(endpoint);
    shared_->cancel = std::make_unique<CancellationSource>();
    shared_->bound_endpoint = endpoint;
    shared_->loop_running = true;
    thread_ = std::thread(&VirtualAcceptLoop::run, shared_, std::move(pending), config,
                          std::move(on_connected), std::move(on_disconnected), shared_->cancel->token());
    if (shared_->logger) {
        shared_->logger->info("VirtualAcceptLoop: listening on " + endpoint.to_string() + " as " +
                              to_string(node_type));
    }
}

void VirtualAcceptLoop::unbind(bool wait_for_exit) {
    std::thread to_join;
    {
        std::unique_lock<std::mutex> lock(shared_->mutex);
        if (shared_->bound_endpoint) {
            const Endpoint endpoint = *shared_->bound_endpoint;
            shared_->bound_endpoint.reset();
            shared_->cancel->cancel();
            registry_.unregister_accepter(endpoint);
            if (shared_->logger) shared_->logger->info("VirtualAcceptLoop: unbinding " + endpoint.to_string());
        }
        if (!wait_for_exit || on_loop_thread()) return;
        shared_->stopped_cv.wait(lock, [this]() { return !shared_->loop_running; });
        to_join = std::move(thread_);
    }
    if (to_join.joinable()) to_join.join();
}

bool VirtualAcceptLoop::is_bound() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->bound_endpoint.has_value();
}

std::optional<Endpoint> VirtualAcceptLoop::bound_endpoint() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->bound_endpoint;
}

void VirtualAcceptLoop::run(std::shared_ptr<Shared> shared,
                            std::shared_ptr<VirtualTransportRegistry::PendingQueue> pending,
                            SocketConfiguration config, ClientConnectedHandler on_connected,
                            ClientDisconnectedHandler on_disconnected, CancellationToken cancel) {
    ProcessUtils::set_current_thread_name("VirtualAccept");
    while (auto connection = pending->pop(cancel)) {
        if (shared->logger) {
            shared->logger->info("VirtualAcceptLoop: accepted " + (*connection)->remote_endpoint());
        }
        deliver_connection(*connection, config, on_connected, on_disconnected, shared->logger,
                           "VirtualAcceptLoop");
    }

    if (shared->logger) shared->logger->debug("VirtualAcceptLoop: accept loop exited");
    std::lock_guard<std::mutex> lock(shared->mutex);
    shared->loop_running = false;
    shared->stopped_cv.notify_all();
}

bool VirtualAcceptLoop::on_loop_thread() const {
    return thread_.get_id() == std::this_thread::get_id();
}

} // namespace transport
