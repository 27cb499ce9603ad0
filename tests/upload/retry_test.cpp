#include "wopan/upload/retry.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace std::chrono_literals;
using wopan::CancellationToken;
using wopan::Error;
using wopan::ErrorKind;
using wopan::Expected;
using wopan::make_error;
using wopan::upload::AttemptState;
using wopan::upload::ChunkRetryMachine;
using wopan::upload::DefaultBackoff;
using wopan::upload::FailureClass;
using wopan::upload::RemoteResponse;

namespace {

/// Records requested delays instead of sleeping
struct RecordingSleeper {
    std::vector<std::chrono::milliseconds> delays;
    bool keep_going = true;

    wopan::upload::Sleeper as_sleeper() {
        return [this](std::chrono::milliseconds delay, const CancellationToken&) {
            delays.push_back(delay);
            return keep_going;
        };
    }
};

Expected<RemoteResponse> accepted() {
    RemoteResponse response;
    response.code = "0000";
    return wopan::Ok<RemoteResponse, Error>(response);
}

Expected<RemoteResponse> failure(ErrorKind kind, const std::string& message) {
    return wopan::Err<RemoteResponse>(make_error(kind, message));
}

} // namespace

TEST(DefaultBackoffTest, TransportFailuresDoubleApplicationErrorsAreFlat) {
    DefaultBackoff backoff;
    EXPECT_EQ(backoff.delay_for(FailureClass::Transport, 1), 1s);
    EXPECT_EQ(backoff.delay_for(FailureClass::Transport, 2), 2s);
    EXPECT_EQ(backoff.delay_for(FailureClass::Transport, 3), 4s);
    EXPECT_EQ(backoff.delay_for(FailureClass::Application, 1), 2s);
    EXPECT_EQ(backoff.delay_for(FailureClass::Application, 2), 2s);
}

TEST(ChunkRetryMachineTest, FirstAttemptAccepted) {
    DefaultBackoff backoff;
    RecordingSleeper sleeper;
    ChunkRetryMachine machine(1, 3, backoff, sleeper.as_sleeper());

    auto result = machine.run([](int) { return accepted(); }, CancellationToken{});

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(machine.state(), AttemptState::Accepted);
    EXPECT_EQ(machine.attempts(), 1);
    EXPECT_TRUE(sleeper.delays.empty());
}

TEST(ChunkRetryMachineTest, RecoversAfterTransientFailures) {
    DefaultBackoff backoff;
    RecordingSleeper sleeper;
    ChunkRetryMachine machine(2, 3, backoff, sleeper.as_sleeper());

    std::vector<int> failed_attempts;
    std::vector<int> retried_attempts;
    ChunkRetryMachine::Hooks hooks;
    hooks.on_failure = [&](int attempt, const Error&) { failed_attempts.push_back(attempt); };
    hooks.on_retry = [&](int next, std::chrono::milliseconds) { retried_attempts.push_back(next); };

    auto result = machine.run(
        [](int attempt) {
            return attempt < 3 ? failure(ErrorKind::TransientTransport, "connection reset") : accepted();
        },
        CancellationToken{}, hooks);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(machine.attempts(), 3);
    EXPECT_EQ(sleeper.delays, (std::vector<std::chrono::milliseconds>{1s, 2s}));
    EXPECT_EQ(failed_attempts, (std::vector<int>{1, 2}));
    EXPECT_EQ(retried_attempts, (std::vector<int>{2, 3}));
}

TEST(ChunkRetryMachineTest, ApplicationErrorsWaitTwoSeconds) {
    DefaultBackoff backoff;
    RecordingSleeper sleeper;
    ChunkRetryMachine machine(1, 3, backoff, sleeper.as_sleeper());

    auto result = machine.run(
        [](int attempt) {
            return attempt == 1 ? failure(ErrorKind::ApplicationProtocol, "Wopan API Error: busy") : accepted();
        },
        CancellationToken{});

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(sleeper.delays, (std::vector<std::chrono::milliseconds>{2s}));
}

TEST(ChunkRetryMachineTest, ExhaustionIsFatalWithLastMessage) {
    DefaultBackoff backoff;
    RecordingSleeper sleeper;
    ChunkRetryMachine machine(4, 3, backoff, sleeper.as_sleeper());

    int calls = 0;
    auto result = machine.run(
        [&](int attempt) {
            ++calls;
            return failure(ErrorKind::ApplicationProtocol, "Wopan API Error: attempt " + std::to_string(attempt));
        },
        CancellationToken{});

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::FatalProtocol);
    EXPECT_EQ(result.error().message, "Part 4 failed after 3 attempts: Wopan API Error: attempt 3");
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(machine.state(), AttemptState::FatalFailure);
    // No sleep after the final attempt
    EXPECT_EQ(sleeper.delays.size(), 2u);
}

TEST(ChunkRetryMachineTest, NonRetryableErrorPassesThrough) {
    DefaultBackoff backoff;
    RecordingSleeper sleeper;
    ChunkRetryMachine machine(1, 3, backoff, sleeper.as_sleeper());

    auto result = machine.run([](int) { return failure(ErrorKind::Internal, "disk on fire"); },
                              CancellationToken{});

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Internal);
    EXPECT_EQ(result.error().message, "disk on fire");
    EXPECT_EQ(machine.attempts(), 1);
    EXPECT_TRUE(sleeper.delays.empty());
}

TEST(ChunkRetryMachineTest, CancelledTokenStopsBeforeSleeping) {
    DefaultBackoff backoff;
    RecordingSleeper sleeper;
    ChunkRetryMachine machine(1, 3, backoff, sleeper.as_sleeper());

    CancellationToken token;
    auto result = machine.run(
        [&](int) {
            token.cancel();
            return failure(ErrorKind::TransientTransport, "timeout");
        },
        token);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
    EXPECT_TRUE(sleeper.delays.empty());
}

TEST(ChunkRetryMachineTest, InterruptedSleepIsCancellation) {
    DefaultBackoff backoff;
    RecordingSleeper sleeper;
    sleeper.keep_going = false;
    ChunkRetryMachine machine(7, 3, backoff, sleeper.as_sleeper());

    auto result = machine.run([](int) { return failure(ErrorKind::TransientTransport, "timeout"); },
                              CancellationToken{});

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
    EXPECT_EQ(result.error().message, "Upload cancelled while waiting to retry part 7");
    EXPECT_EQ(machine.attempts(), 1);
}

TEST(ChunkRetryMachineTest, MachineRunsOnlyOnce) {
    DefaultBackoff backoff;
    RecordingSleeper sleeper;
    ChunkRetryMachine machine(1, 3, backoff, sleeper.as_sleeper());

    ASSERT_TRUE(machine.run([](int) { return accepted(); }, CancellationToken{}).is_ok());

    auto again = machine.run([](int) { return accepted(); }, CancellationToken{});
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, ErrorKind::Internal);
}

TEST(CancellableSleeperTest, ReturnsFalseWhenAlreadyCancelled) {
    auto sleep = wopan::upload::cancellable_sleeper();
    CancellationToken token;
    token.cancel();

    EXPECT_FALSE(sleep(std::chrono::seconds(30), token));
    EXPECT_TRUE(sleep(std::chrono::milliseconds(1), CancellationToken{}));
}
