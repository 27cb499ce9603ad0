#include "wopan/upload/retry.hpp"

#include <unordered_map>
#include <vector>

namespace wopan::upload {

namespace {

bool is_allowed(AttemptState current, AttemptState target) {
    static const std::unordered_map<AttemptState, std::vector<AttemptState>> transitions {
        {AttemptState::Attempting, {AttemptState::Accepted, AttemptState::RetryableFailure, AttemptState::FatalFailure}},
        {AttemptState::RetryableFailure, {AttemptState::Attempting, AttemptState::FatalFailure}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    for (const auto state : it->second) {
        if (state == target) {
            return true;
        }
    }
    return false;
}

} // namespace

const char* to_string(AttemptState state) {
    switch (state) {
        case AttemptState::Attempting: return "attempting";
        case AttemptState::Accepted: return "accepted";
        case AttemptState::RetryableFailure: return "retryable_failure";
        case AttemptState::FatalFailure: return "fatal_failure";
    }
    return "unknown";
}

std::chrono::milliseconds DefaultBackoff::delay_for(FailureClass failure, int failed_attempt) const {
    if (failure == FailureClass::Application) {
        return std::chrono::seconds(2);
    }
    const int exponent = failed_attempt > 1 ? failed_attempt - 1 : 0;
    return std::chrono::seconds(1LL << exponent);
}

Sleeper cancellable_sleeper() {
    return [](std::chrono::milliseconds delay, const CancellationToken& token) {
        return token.wait_for(delay);
    };
}

FailureClass classify_failure(ErrorKind kind) {
    return kind == ErrorKind::ApplicationProtocol ? FailureClass::Application : FailureClass::Transport;
}

ChunkRetryMachine::ChunkRetryMachine(std::uint32_t part_index,
                                     int max_attempts,
                                     const BackoffStrategy& backoff,
                                     Sleeper sleeper)
    : part_index_(part_index),
      max_attempts_(max_attempts > 0 ? max_attempts : 1),
      backoff_(backoff),
      sleeper_(sleeper ? std::move(sleeper) : cancellable_sleeper()) {}

Expected<RemoteResponse> ChunkRetryMachine::run(const AttemptFn& attempt,
                                                const CancellationToken& token,
                                                const Hooks& hooks) {
    if (state_ != AttemptState::Attempting || attempts_ != 0) {
        return Err<RemoteResponse>(make_error(ErrorKind::Internal,
                                              "Retry machine for part " + std::to_string(part_index_) + " already ran"));
    }

    while (true) {
        ++attempts_;
        auto result = attempt(attempts_);

        if (result.is_ok()) {
            if (auto moved = transition_to(AttemptState::Accepted); moved.is_error()) {
                return Err<RemoteResponse>(moved.error());
            }
            return result;
        }

        Error error = result.error();
        if (hooks.on_failure) {
            hooks.on_failure(attempts_, error);
        }

        if (!is_retryable(error.kind)) {
            return fail(std::move(error));
        }

        if (attempts_ >= max_attempts_) {
            return fail(make_error(ErrorKind::FatalProtocol,
                                   "Part " + std::to_string(part_index_) + " failed after " +
                                   std::to_string(attempts_) + " attempts: " + error.message));
        }

        if (auto moved = transition_to(AttemptState::RetryableFailure); moved.is_error()) {
            return Err<RemoteResponse>(moved.error());
        }

        if (token.is_cancelled()) {
            return fail(make_error(ErrorKind::Cancelled,
                                   "Upload cancelled before retrying part " + std::to_string(part_index_)));
        }

        const auto delay = backoff_.delay_for(classify_failure(error.kind), attempts_);
        if (hooks.on_retry) {
            hooks.on_retry(attempts_ + 1, delay);
        }
        if (!sleeper_(delay, token)) {
            return fail(make_error(ErrorKind::Cancelled,
                                   "Upload cancelled while waiting to retry part " + std::to_string(part_index_)));
        }

        if (auto moved = transition_to(AttemptState::Attempting); moved.is_error()) {
            return Err<RemoteResponse>(moved.error());
        }
    }
}

bool ChunkRetryMachine::can_transition(AttemptState target) const noexcept {
    if (state_ == target) {
        return true;
    }

    if (state_ == AttemptState::Accepted || state_ == AttemptState::FatalFailure) {
        return false;
    }

    return is_allowed(state_, target);
}

Expected<void> ChunkRetryMachine::transition_to(AttemptState next_state) {
    if (!can_transition(next_state)) {
        return Err<void>(make_error(ErrorKind::Internal,
                                    std::string("Illegal attempt state transition ") +
                                    to_string(state_) + " -> " + to_string(next_state)));
    }
    state_ = next_state;
    return Ok<Error>();
}

Expected<RemoteResponse> ChunkRetryMachine::fail(Error error) {
    state_ = AttemptState::FatalFailure;
    return Err<RemoteResponse>(std::move(error));
}

} // namespace wopan::upload
