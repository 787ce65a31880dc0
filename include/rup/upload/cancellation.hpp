#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace rup::upload {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
};

} // namespace detail

/**
 * @brief Read side of a cancellation signal, cheap to copy
 *
 * A default-constructed token can never be cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const {
        if (!state_) {
            return false;
        }
        std::lock_guard lock(state_->mutex);
        return state_->cancelled;
    }

    /**
     * @brief Sleep for the given duration unless cancelled first
     *
     * @return true if the wait ended because of cancellation
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& duration) const {
        if (!state_) {
            std::this_thread::sleep_for(duration);
            return false;
        }
        std::unique_lock lock(state_->mutex);
        return state_->cv.wait_for(lock, duration, [this] { return state_->cancelled; });
    }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @brief Write side, owned by the scheduler for one task run
 */
class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

    void cancel() {
        {
            std::lock_guard lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] bool is_cancelled() const {
        std::lock_guard lock(state_->mutex);
        return state_->cancelled;
    }

    [[nodiscard]] CancellationToken token() const { return CancellationToken(state_); }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace rup::upload
