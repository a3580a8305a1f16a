#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace foundry {

/// Shared cancellation flag. Copies observe the same state; cancel() is
/// sticky and wakes every waiter.
class CancelToken {
public:
    CancelToken() : state_(std::make_shared<State>()) {}

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    /// Sleep up to `timeout`; returns true as soon as the token is cancelled.
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
    }

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };
    std::shared_ptr<State> state_;
};

} // namespace foundry
