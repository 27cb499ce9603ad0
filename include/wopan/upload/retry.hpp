#pragma once

#include "wopan/core/cancellation.hpp"
#include "wopan/core/error.hpp"
#include "wopan/upload/types.hpp"

#include <chrono>
#include <functional>

namespace wopan::upload {

enum class AttemptState {
    Attempting,
    Accepted,
    RetryableFailure,
    FatalFailure
};

const char* to_string(AttemptState state);

enum class FailureClass {
    Transport,
    Application
};

/**
 * @brief Decides how long to wait before the next attempt of a chunk
 */
class BackoffStrategy {
public:
    virtual ~BackoffStrategy() = default;

    /**
     * @param failure What kind of failure ended the attempt
     * @param failed_attempt 1-based number of the attempt that failed
     */
    virtual std::chrono::milliseconds delay_for(FailureClass failure, int failed_attempt) const = 0;
};

/**
 * @brief Transport failures: 2^(failed_attempt - 1) seconds. Application errors: 2 seconds.
 */
class DefaultBackoff final : public BackoffStrategy {
public:
    std::chrono::milliseconds delay_for(FailureClass failure, int failed_attempt) const override;
};

/// Blocks for the given duration; returns false if cancelled while waiting
using Sleeper = std::function<bool(std::chrono::milliseconds, const CancellationToken&)>;

/// Sleeper backed by CancellationToken::wait_for
Sleeper cancellable_sleeper();

FailureClass classify_failure(ErrorKind kind);

/**
 * @brief Bounded retry procedure for one chunk
 *
 * State machine:
 *   Attempting -> Accepted | RetryableFailure | FatalFailure
 *   RetryableFailure -> Attempting | FatalFailure
 *
 * Accepted and FatalFailure are terminal. Retryable errors never leave run():
 * they either lead to another attempt or, once max_attempts is reached, are
 * wrapped into a FatalProtocol error carrying the last message.
 */
class ChunkRetryMachine {
public:
    using AttemptFn = std::function<Expected<RemoteResponse>(int attempt)>;

    /// Observers for the session's event stream
    struct Hooks {
        std::function<void(int attempt, const Error& error)> on_failure;
        std::function<void(int next_attempt, std::chrono::milliseconds delay)> on_retry;
    };

    ChunkRetryMachine(std::uint32_t part_index,
                      int max_attempts,
                      const BackoffStrategy& backoff,
                      Sleeper sleeper);

    /**
     * @brief Run attempts until one is accepted or the chunk is given up
     *
     * Non-retryable errors (Internal, Cancelled, ...) fail immediately and are
     * returned unchanged. A cancelled token is honored before every sleep.
     */
    Expected<RemoteResponse> run(const AttemptFn& attempt,
                                 const CancellationToken& token,
                                 const Hooks& hooks = {});

    [[nodiscard]] AttemptState state() const noexcept { return state_; }
    [[nodiscard]] int attempts() const noexcept { return attempts_; }

private:
    bool can_transition(AttemptState target) const noexcept;
    Expected<void> transition_to(AttemptState next_state);
    Expected<RemoteResponse> fail(Error error);

    std::uint32_t part_index_;
    int max_attempts_;
    const BackoffStrategy& backoff_;
    Sleeper sleeper_;
    AttemptState state_ = AttemptState::Attempting;
    int attempts_ = 0;
};

} // namespace wopan::upload
