#ifndef CANCELLATION_HPP
#define CANCELLATION_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

/**
 * @brief Cooperative cancellation shared between a controller and a background loop.
 *
 * A CancellationSource owns the flag; loops receive CancellationTokens. Blocking
 * waits register a wake-up callback with on_cancel() so cancel() interrupts
 * them immediately instead of being noticed on the next iteration.
 *
 * Callbacks run on the cancelling thread while the internal lock is held; they
 * must be short (notify a condition variable) and must not register or
 * unregister callbacks themselves.
 */
namespace detail {

struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::map<std::uint64_t, std::function<void()>> callbacks;
    std::uint64_t next_id{1};

    void cancel() {
        std::lock_guard<std::mutex> lock(mutex);
        if (cancelled.exchange(true)) return;
        for (auto& [id, cb] : callbacks) {
            if (cb) cb();
        }
        callbacks.clear();
    }
};

} // namespace detail

class CancellationToken {
public:
    /** \brief RAII handle; destroying it removes the wake-up callback. */
    class Registration {
    public:
        Registration() = default;
        Registration(std::shared_ptr<detail::CancellationState> state, std::uint64_t id)
            : state_(std::move(state)), id_(id) {}
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;
        Registration(Registration&& other) noexcept
            : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}
        Registration& operator=(Registration&& other) noexcept {
            if (this != &other) {
                reset();
                state_ = std::move(other.state_);
                id_ = std::exchange(other.id_, 0);
            }
            return *this;
        }
        ~Registration() { reset(); }

        void reset() {
            if (state_ && id_ != 0) {
                std::lock_guard<std::mutex> lock(state_->mutex);
                state_->callbacks.erase(id_);
            }
            state_.reset();
            id_ = 0;
        }

    private:
        std::shared_ptr<detail::CancellationState> state_;
        std::uint64_t id_{0};
    };

    /** \brief A token that is never cancelled. */
    CancellationToken() = default;

    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    bool is_cancelled() const noexcept {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    bool can_be_cancelled() const noexcept { return static_cast<bool>(state_); }

    /**
     * \brief Register a wake-up callback.
     * \details Runs immediately (on the calling thread) if already cancelled.
     */
    [[nodiscard]] Registration on_cancel(std::function<void()> callback) const {
        if (!state_) return {};
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.load(std::memory_order_acquire)) {
            callback();
            return {};
        }
        const auto id = state_->next_id++;
        state_->callbacks.emplace(id, std::move(callback));
        return Registration(state_, id);
    }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

    CancellationToken token() const { return CancellationToken(state_); }

    void cancel() { state_->cancel(); }

    bool is_cancelled() const noexcept { return state_->cancelled.load(std::memory_order_acquire); }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

#endif // CANCELLATION_HPP
