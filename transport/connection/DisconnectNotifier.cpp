#include "DisconnectNotifier.hpp"
#include "logger.hpp"

#include <exception>
#include <string>
#include <utility>

namespace transport {

DisconnectNotifier::DisconnectNotifier(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {}

void DisconnectNotifier::subscribe(std::function<void()> callback) {
    if (!callback) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!fired_) {
            subscribers_.push_back(std::move(callback));
            return;
        }
    }
    invoke(callback);
}

bool DisconnectNotifier::fire() {
    std::vector<std::function<void()>> to_notify;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fired_) return false;
        fired_ = true;
        to_notify.swap(subscribers_);
    }
    for (const auto& cb : to_notify) {
        invoke(cb);
    }
    return true;
}

bool DisconnectNotifier::fired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
}

void DisconnectNotifier::invoke(const std::function<void()>& callback) const {
    // A throwing subscriber must not keep the others from being told.
    try {
        callback();
    } catch (const std::exception& e) {
        if (logger_) logger_->error(std::string("DisconnectNotifier: subscriber threw: ") + e.what());
    } catch (...) {
        if (logger_) logger_->error("DisconnectNotifier: subscriber threw an unknown exception");
    }
}

} // namespace transport
