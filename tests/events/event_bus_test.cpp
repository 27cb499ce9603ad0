#include "wopan/events/event_bus.hpp"
#include "wopan/events/events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace wopan::events;

TEST(EventBus, DeliversEventToSubscriber) {
    EventBus bus;

    std::string seen_id;
    std::uint32_t seen_part = 0;
    bus.subscribe<ChunkAcceptedEvent>([&](const ChunkAcceptedEvent& e) {
        seen_id = e.unique_id;
        seen_part = e.part_index;
    });

    bus.emit(ChunkAcceptedEvent{"1700000000000_abcDEF", 2, 3, 1024, 1});

    EXPECT_EQ(seen_id, "1700000000000_abcDEF");
    EXPECT_EQ(seen_part, 2u);
}

TEST(EventBus, RoutesByEventType) {
    EventBus bus;

    int accepted = 0;
    int failed = 0;
    bus.subscribe<ChunkAcceptedEvent>([&](const ChunkAcceptedEvent&) { accepted++; });
    bus.subscribe<UploadFailedEvent>([&](const UploadFailedEvent&) { failed++; });

    bus.emit(ChunkAcceptedEvent{"id", 1, 2, 10, 1});
    bus.emit(UploadFailedEvent{"id", "clip.mp4", wopan::ErrorKind::FatalProtocol, "boom"});
    bus.emit(ChunkAcceptedEvent{"id", 2, 2, 10, 1});

    EXPECT_EQ(accepted, 2);
    EXPECT_EQ(failed, 1);
}

TEST(EventBus, UnsubscribedHandlerIsNotCalled) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<UploadStartedEvent>([&](const UploadStartedEvent&) { count++; });

    bus.emit(UploadStartedEvent{});
    bus.unsubscribe<UploadStartedEvent>(id);
    bus.emit(UploadStartedEvent{});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<UploadStartedEvent>(), 0u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int reached = 0;
    bus.subscribe<UploadUnconfirmedEvent>([](const UploadUnconfirmedEvent&) {
        throw std::runtime_error("sink failed");
    });
    bus.subscribe<UploadUnconfirmedEvent>([&](const UploadUnconfirmedEvent&) { reached++; });

    EXPECT_NO_THROW(bus.emit(UploadUnconfirmedEvent{}));
    EXPECT_EQ(reached, 1);
}

TEST(EventBus, HandlerMaySubscribeDuringEmit) {
    EventBus bus;

    int late_calls = 0;
    bus.subscribe<ServerStartedEvent>([&](const ServerStartedEvent&) {
        bus.subscribe<ServerStartedEvent>([&](const ServerStartedEvent&) { late_calls++; });
    });

    bus.emit(ServerStartedEvent{8000});
    EXPECT_EQ(late_calls, 0);

    bus.emit(ServerStartedEvent{8000});
    EXPECT_EQ(late_calls, 1);
}

TEST(EventBus, ConcurrentSessionsEmitSafely) {
    EventBus bus;
    std::atomic<std::uint64_t> bytes{0};

    bus.subscribe<ChunkAcceptedEvent>([&bytes](const ChunkAcceptedEvent& e) {
        bytes += e.part_size;
    });

    std::vector<std::thread> sessions;
    for (int i = 0; i < 8; ++i) {
        sessions.emplace_back([&bus, i]() {
            for (std::uint32_t part = 1; part <= 25; ++part) {
                bus.emit(ChunkAcceptedEvent{"session-" + std::to_string(i), part, 25, 100, 1});
            }
        });
    }
    for (auto& t : sessions) {
        t.join();
    }

    EXPECT_EQ(bytes.load(), 8u * 25u * 100u);
}

TEST(EventBus, ClearRemovesAllHandlers) {
    EventBus bus;

    bus.subscribe<ChunkRetryScheduledEvent>([](const ChunkRetryScheduledEvent&) {});
    bus.subscribe<ChunkAttemptFailedEvent>([](const ChunkAttemptFailedEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<ChunkRetryScheduledEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<ChunkAttemptFailedEvent>(), 0u);
}
