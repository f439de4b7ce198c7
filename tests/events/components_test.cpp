#include "ofs/events/components.hpp"
#include "ofs/events/event_bus.hpp"
#include "ofs/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using ofs::events::EventBus;
using ofs::events::LoggerComponent;
using ofs::events::MetricsComponent;
using ofs::events::Subscriptions;
namespace events = ofs::events;

TEST(MetricsComponentTest, TracksSyncAndUploadCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(events::OperationQueuedEvent{"op-1", ofs::oplog::OperationType::CreateDraft, "draft", "1"});
    bus.emit(events::OperationSyncedEvent{"op-1", ofs::oplog::OperationType::CreateDraft, "1", std::nullopt});
    bus.emit(events::OperationFailedEvent{"op-2", ofs::Error{ofs::ErrorKind::Network, "down"}, 1, false});
    bus.emit(events::SyncCompletedEvent{1, 1, 0, false, std::chrono::milliseconds{15}});

    ofs::upload::FileInfo info;
    info.file_id = "file-1";
    info.size = 4096;
    bus.emit(events::UploadCompletedEvent{"upload-1", info, std::chrono::milliseconds{200}});
    bus.emit(events::UploadFailedEvent{"upload-2", ofs::Error{ofs::ErrorKind::Network, "reset"}});
    bus.emit(events::UploadCancelledEvent{"upload-3"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.operations_queued.load(), 1u);
    EXPECT_EQ(stats.operations_synced.load(), 1u);
    EXPECT_EQ(stats.operations_failed.load(), 1u);
    EXPECT_EQ(stats.sync_cycles.load(), 1u);
    EXPECT_EQ(stats.uploads_completed.load(), 1u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 4096u);
    EXPECT_EQ(stats.uploads_failed.load(), 1u);
    EXPECT_EQ(stats.uploads_cancelled.load(), 1u);
}

TEST(MetricsComponentTest, CountsConflictsStaleReadsAndTransitions) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(events::ConflictDetectedEvent{"op-1", "draft", "1", ofs::sync::ConflictPolicy::Manual, "{}", "{}"});
    bus.emit(events::ConflictResolvedEvent{"op-1", ofs::sync::ConflictChoice::UseRemote});
    bus.emit(events::StaleDataServedEvent{"posts_{}", ofs::TimePoint{}, ofs::Error{ofs::ErrorKind::Network, "offline"}});

    ofs::network::NetworkStatus offline;
    offline.online = false;
    bus.emit(events::NetworkStatusChangedEvent{offline, true});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.conflicts_detected.load(), 1u);
    EXPECT_EQ(stats.conflicts_resolved.load(), 1u);
    EXPECT_EQ(stats.stale_reads.load(), 1u);
    EXPECT_EQ(stats.network_transitions.load(), 1u);
}

TEST(SubscriptionsTest, DetachOnDestruction) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        LoggerComponent logger(bus);
        EXPECT_GT(bus.total_subscribers(), 0u);
    }
    EXPECT_EQ(bus.total_subscribers(), 0u);
}

TEST(SubscriptionsTest, ResetDetachesEverything) {
    EventBus bus;
    Subscriptions subs(bus);
    int calls = 0;

    subs.add<events::UploadCancelledEvent>([&](const events::UploadCancelledEvent&) { calls++; });
    subs.add<events::SyncStartedEvent>([&](const events::SyncStartedEvent&) { calls++; });
    EXPECT_EQ(subs.size(), 2u);

    bus.emit(events::UploadCancelledEvent{"upload-1"});
    subs.reset();
    bus.emit(events::UploadCancelledEvent{"upload-1"});

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bus.total_subscribers(), 0u);
}
