/**
 * \file DisconnectNotifier.hpp
 * \brief One-shot, first-caller-wins disconnect event shared by connection backends.
 * \ingroup transport_connection
 */
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

class Logger;

namespace transport {

/**
 * \brief Delivers the disconnect event exactly once to every subscriber.
 * \details fire() may be reached from several paths at once (local close, a
 * reader seeing end of stream, a failed write); only the first call
 * notifies. Subscribers are invoked outside the lock so they may call back
 * into the connection.
 */
class DisconnectNotifier {
public:
    explicit DisconnectNotifier(std::shared_ptr<Logger> logger = nullptr);

    /** \brief Add a subscriber; runs it right away if the event already fired. */
    void subscribe(std::function<void()> callback);

    /** \brief Fire the event. \return true for the call that actually notified. */
    bool fire();

    bool fired() const;

private:
    std::shared_ptr<Logger> logger_;
    mutable std::mutex mutex_;
    bool fired_{false};
    std::vector<std::function<void()>> subscribers_;

    void invoke(const std::function<void()>& callback) const;
};

} // namespace transport
