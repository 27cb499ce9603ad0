#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace wopan {

/**
 * @brief Shared abort flag for long-running sessions
 *
 * Copies share the same state, so a caller can keep one copy and hand
 * another to the uploader. wait_for() doubles as the backoff sleep: it
 * returns early (with false) as soon as cancel() is called.
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() {
        {
            std::lock_guard lock(state_->mutex);
            state_->cancelled.store(true);
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return state_->cancelled.load();
    }

    /**
     * @brief Sleep for @p duration unless cancelled first
     * @return true if the full duration elapsed, false if cancelled
     */
    bool wait_for(std::chrono::milliseconds duration) const {
        std::unique_lock lock(state_->mutex);
        return !state_->cv.wait_for(lock, duration, [this] { return state_->cancelled.load(); });
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    std::shared_ptr<State> state_;
};

} // namespace wopan
