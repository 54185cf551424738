#include "ReceiveLoop.hpp"
#include "serialize/registry/SerializationRegistry.hpp"
#include "transport/TransportErrors.hpp"
#include "logger.hpp"
#include "processUtils.hpp"

#include <condition_variable>
#include <exception>
#include <stdexcept>
#include <utility>

namespace session {

using FrameMessenger::Messaging::Frame;
using FrameMessenger::Messaging::FrameReceiver;
using FrameMessenger::Messaging::IMessage;
using FrameMessenger::Messaging::SerializationRegistry;

// Outlives the ReceiveLoop object when the thread has to be detached.
struct ReceiveLoop::Shared {
    Shared(std::shared_ptr<transport::IConnection> c, SerializationRegistry& r, ReceiveLoopCallbacks cb,
           std::shared_ptr<Logger> l, FrameReceiver fr)
        : connection(std::move(c)), registry(r), callbacks(std::move(cb)), logger(std::move(l)), receiver(fr) {}

    std::shared_ptr<transport::IConnection> connection;
    SerializationRegistry& registry;
    ReceiveLoopCallbacks callbacks;
    std::shared_ptr<Logger> logger;
    FrameReceiver receiver;

    std::mutex mutex;
    std::condition_variable state_cv;
    ReceiveLoopState state{ReceiveLoopState::IDLE};
    std::unique_ptr<CancellationSource> cancel;
    std::thread::id loop_thread_id;

    void report(const std::system_error& error) {
        if (!callbacks.on_socket_exception) {
            if (logger) logger->warning(std::string("ReceiveLoop: unhandled socket error: ") + error.what());
            return;
        }
        try {
            callbacks.on_socket_exception(connection, error);
        } catch (const std::exception& e) {
            if (logger) logger->error(std::string("ReceiveLoop: socket exception handler threw: ") + e.what());
        } catch (...) {
            if (logger) logger->error("ReceiveLoop: socket exception handler threw an unknown exception");
        }
    }

    void dispatch(const std::shared_ptr<IMessage>& message) {
        try {
            callbacks.on_message_received(connection, message);
        } catch (const std::exception& e) {
            if (logger) logger->error(std::string("ReceiveLoop: message handler threw: ") + e.what());
        } catch (...) {
            if (logger) logger->error("ReceiveLoop: message handler threw an unknown exception");
        }
    }
};

ReceiveLoop::ReceiveLoop(std::shared_ptr<transport::IConnection> connection,
                         SerializationRegistry& registry,
                         ReceiveLoopCallbacks callbacks,
                         std::shared_ptr<Logger> logger,
                         FrameReceiver receiver) {
    if (!connection) throw std::invalid_argument("ReceiveLoop: connection is null");
    if (!callbacks.on_message_received) throw std::invalid_argument("ReceiveLoop: on_message_received is required");
    shared_ = std::make_shared<Shared>(std::move(connection), registry, std::move(callbacks), std::move(logger),
                                       receiver);
}

ReceiveLoop::~ReceiveLoop() {
    dispose();
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        worker = std::move(thread_);
    }
    if (worker.joinable()) {
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else {
            worker.join();
        }
    }
}

void ReceiveLoop::start() {
    if (is_disposed()) throw std::logic_error("ReceiveLoop: start() after dispose()");

    std::thread previous;
    {
        std::unique_lock<std::mutex> lock(shared_->mutex);
        if (shared_->state == ReceiveLoopState::STARTING || shared_->state == ReceiveLoopState::RUNNING) return;
        if (shared_->state == ReceiveLoopState::STOPPING) {
            if (shared_->loop_thread_id == std::this_thread::get_id()) {
                throw std::logic_error("ReceiveLoop: start() from the loop thread while stopping");
            }
            shared_->state_cv.wait(lock, [this]() { return shared_->state == ReceiveLoopState::IDLE; });
        }
        previous = std::move(thread_);
    }
    if (previous.joinable()) previous.join();

    std::unique_lock<std::mutex> lock(shared_->mutex);
    // Lost a race with a concurrent start().
    if (shared_->state != ReceiveLoopState::IDLE || thread_.joinable()) return;
    shared_->cancel = std::make_unique<CancellationSource>();
    shared_->state = ReceiveLoopState::STARTING;
    thread_ = std::thread(&ReceiveLoop::run, shared_, shared_->cancel->token());
    shared_->state_cv.wait(lock, [this]() { return shared_->state != ReceiveLoopState::STARTING; });
    if (shared_->logger) {
        shared_->logger->debug("ReceiveLoop: started on " + shared_->connection->endpoint().to_string());
    }
}

void ReceiveLoop::stop(bool wait_for_exit) {
    std::thread finished;
    {
        std::unique_lock<std::mutex> lock(shared_->mutex);
        if (shared_->state == ReceiveLoopState::STARTING || shared_->state == ReceiveLoopState::RUNNING) {
            shared_->state = ReceiveLoopState::STOPPING;
            shared_->cancel->cancel();
        }
        if (!wait_for_exit || shared_->loop_thread_id == std::this_thread::get_id()) return;
        shared_->state_cv.wait(lock, [this]() { return shared_->state == ReceiveLoopState::IDLE; });
        finished = std::move(thread_);
    }
    if (finished.joinable()) finished.join();
}

void ReceiveLoop::dispose() {
    {
        std::lock_guard<std::mutex> lock(dispose_mutex_);
        if (disposed_) return;
        disposed_ = true;
    }
    shared_->connection->close();
    stop(false);
}

ReceiveLoopState ReceiveLoop::state() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->state;
}

std::string ReceiveLoop::get_state() const {
    switch (state()) {
        case ReceiveLoopState::IDLE: return "IDLE";
        case ReceiveLoopState::STARTING: return "STARTING";
        case ReceiveLoopState::RUNNING: return "RUNNING";
        case ReceiveLoopState::STOPPING: return "STOPPING";
        default: return "UNKNOWN";
    }
}

bool ReceiveLoop::is_disposed() const {
    std::lock_guard<std::mutex> lock(dispose_mutex_);
    return disposed_;
}

const std::shared_ptr<transport::IConnection>& ReceiveLoop::connection() const {
    return shared_->connection;
}

void ReceiveLoop::run(std::shared_ptr<Shared> shared, CancellationToken cancel) {
    ProcessUtils::set_current_thread_name("ReceiveLoop");
    {
        std::lock_guard<std::mutex> lock(shared->mutex);
        shared->loop_thread_id = std::this_thread::get_id();
        // stop() may already have moved STARTING to STOPPING.
        if (shared->state == ReceiveLoopState::STARTING) shared->state = ReceiveLoopState::RUNNING;
        shared->state_cv.notify_all();
    }

    while (!cancel.is_cancelled()) {
        Frame frame;
        try {
            frame = shared->receiver.receive(*shared->connection, cancel);
        } catch (const std::system_error& e) {
            if (!transport::is_expected_shutdown(e.code())) shared->report(e);
            break;
        } catch (const std::exception& e) {
            shared->report(std::system_error(transport::make_error_code(transport::transport_errc::io_error),
                                             e.what()));
            break;
        } catch (...) {
            shared->report(std::system_error(transport::make_error_code(transport::transport_errc::io_error),
                                             "unknown exception while receiving"));
            break;
        }

        std::shared_ptr<IMessage> message;
        try {
            message = shared->registry.deserialize(frame.type_id(), frame.payload());
        } catch (const std::system_error& e) {
            shared->report(e);
            // Frame dropped; the stream is still aligned on the next header.
            if (transport::is_frame_recoverable(e.code())) continue;
            break;
        }
        shared->dispatch(message);
    }

    if (shared->logger) {
        shared->logger->debug("ReceiveLoop: exited on " + shared->connection->endpoint().to_string());
    }
    std::lock_guard<std::mutex> lock(shared->mutex);
    shared->state = ReceiveLoopState::IDLE;
    shared->loop_thread_id = std::thread::id();
    shared->state_cv.notify_all();
}

} // namespace session
