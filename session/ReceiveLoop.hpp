// ReceiveLoop.hpp - Per-connection frame receive and dispatch loop
#pragma once

#include "message/FrameReceiver.hpp"
#include "serialize/registry/IMessage.hpp"
#include "transport/connection/IConnection.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>

class Logger;

namespace FrameMessenger::Messaging { class SerializationRegistry; }

namespace session {

/**
 * \defgroup session_module Session Module
 * \brief Background receive loops that turn frames into application messages.
 */

/**
 * \file session/ReceiveLoop.hpp
 * \brief Defines the per-connection receive loop and its callbacks.
 * \ingroup session_module
 */

/**
 * \brief Receive loop lifecycle.
 * \ingroup session_module
 */
enum class ReceiveLoopState {
    IDLE,
    STARTING,
    RUNNING,
    STOPPING
};

/**
 * \brief Application hooks invoked on the loop thread.
 * \ingroup session_module
 */
struct ReceiveLoopCallbacks {
    /** Required. Exceptions are logged and do not stop the loop. */
    std::function<void(const std::shared_ptr<transport::IConnection>&,
                       const std::shared_ptr<FrameMessenger::Messaging::IMessage>&)> on_message_received;

    /**
     * Optional. Receives per-frame failures (`unknown_type`, `malformed_payload`,
     * loop continues) and connection-fatal failures (loop then exits).
     */
    std::function<void(const std::shared_ptr<transport::IConnection>&, const std::system_error&)> on_socket_exception;
};

/**
 * \brief Reads frames from one connection and dispatches the decoded messages.
 * \ingroup session_module
 *
 * Responsibilities:
 * - Deterministic start: start() returns once the loop thread is consuming frames.
 * - Deterministic stop: stop(true) returns once no further message callback can run.
 * - Error isolation: handler exceptions are logged, per-frame failures reported
 *   and skipped, expected shutdown (close, cancellation) is silent.
 *
 * The loop keeps the connection alive while it runs but only closes it from
 * dispose(). The registry must outlive the loop.
 */
class ReceiveLoop {
public:
    /**
     * \brief Create an idle loop.
     * \throws std::invalid_argument if \p connection is null or
     *  `callbacks.on_message_received` is empty.
     */
    ReceiveLoop(std::shared_ptr<transport::IConnection> connection,
                FrameMessenger::Messaging::SerializationRegistry& registry,
                ReceiveLoopCallbacks callbacks,
                std::shared_ptr<Logger> logger = nullptr,
                FrameMessenger::Messaging::FrameReceiver receiver = FrameMessenger::Messaging::FrameReceiver{});

    /** \brief Disposes the loop and reaps its thread. */
    ~ReceiveLoop();

    ReceiveLoop(const ReceiveLoop&) = delete;
    ReceiveLoop& operator=(const ReceiveLoop&) = delete;

    /**
     * \brief Launch the loop thread and block until it is RUNNING.
     * \details No-op while already starting or running. Waits for a pending
     * stop to finish before restarting.
     * \throws std::logic_error after dispose(), or when called from the loop's own
     *  thread while it is stopping.
     */
    void start();

    /**
     * \brief Cancel the loop; a blocked frame read wakes immediately.
     * \param wait_for_exit Block until the loop is IDLE. Ignored on the loop's
     *  own thread, where waiting would deadlock.
     */
    void stop(bool wait_for_exit = true);

    /** \brief Close the connection and stop without waiting. Idempotent. */
    void dispose();

    ReceiveLoopState state() const;

    /** \brief Current state as a descriptive string. */
    std::string get_state() const;

    bool is_disposed() const;

    const std::shared_ptr<transport::IConnection>& connection() const;

private:
    struct Shared;

    static void run(std::shared_ptr<Shared> shared, CancellationToken cancel);

    std::shared_ptr<Shared> shared_;
    std::thread thread_;  // guarded by Shared::mutex

    mutable std::mutex dispose_mutex_;
    bool disposed_{false};
};

} // namespace session
