#include "ofs/engine/engine.hpp"
#include "ofs/events/events.hpp"
#include "ofs/remote/loopback_remote.hpp"
#include "ofs/upload/file_source.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <thread>

using namespace ofs;
using namespace std::chrono_literals;
using oplog::OperationType;

namespace {

EngineConfig test_config() {
    EngineConfig config;
    config.storage.database_path = ":memory:";
    config.logging.level = "warn";
    config.sync.auto_sync = false;
    config.sync.reconnect_delay = Millis{20};
    config.upload.retry_delay = Millis{1};
    return config;
}

} // namespace

TEST(OfflineEngineTest, InitializeAndDispose) {
    remote::LoopbackRemoteApi remote;
    OfflineEngine engine(test_config(), remote);
    EXPECT_FALSE(engine.initialized());

    ASSERT_TRUE(engine.initialize().is_ok());
    ASSERT_TRUE(engine.initialize().is_ok());
    EXPECT_TRUE(engine.initialized());
    EXPECT_TRUE(engine.network().running());

    engine.dispose();
    EXPECT_FALSE(engine.initialized());
    EXPECT_FALSE(engine.network().running());
    engine.dispose();
}

TEST(OfflineEngineTest, UnknownLogLevelFailsInitialize) {
    auto config = test_config();
    config.logging.level = "chatty";
    remote::LoopbackRemoteApi remote;
    OfflineEngine engine(config, remote);

    auto r = engine.initialize();
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, ErrorKind::Validation);
    EXPECT_FALSE(engine.initialized());
}

TEST(OfflineEngineTest, QueueThenSyncNow) {
    remote::LoopbackRemoteApi remote;
    OfflineEngine engine(test_config(), remote);
    ASSERT_TRUE(engine.initialize().is_ok());

    ASSERT_TRUE(engine.queue_operation(OperationType::CreateDraft, "draft", "1", R"({"title":"a"})").is_ok());
    ASSERT_TRUE(engine.queue_operation(OperationType::UpdateDraft, "draft", "1", R"({"title":"b"})").is_ok());

    auto summary = engine.sync_now();
    ASSERT_TRUE(summary.is_ok()) << summary.error();
    EXPECT_EQ(summary.value().synced_count, 2u);
    EXPECT_EQ(remote.entity("draft", "1").value_or(""), R"({"title":"b"})");

    auto status = engine.offline_status();
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().pending_operations, 0u);
    EXPECT_TRUE(status.value().last_sync.has_value());
    EXPECT_EQ(engine.metrics().get_stats().operations_synced.load(), 2u);
    EXPECT_EQ(engine.metrics().get_stats().sync_cycles.load(), 1u);
}

TEST(OfflineEngineTest, OfflineStatusReflectsState) {
    remote::LoopbackRemoteApi remote;
    auto config = test_config();
    OfflineEngine engine(config, remote);
    ASSERT_TRUE(engine.initialize().is_ok());

    ASSERT_TRUE(engine.cache().set(cache::entity_key("draft", "1"), "{}").is_ok());
    ASSERT_TRUE(engine.cache().set(cache::entity_key("draft", "2"), "{}").is_ok());
    ASSERT_TRUE(engine.cache().set(cache::entity_key("settings", "theme"), "{}").is_ok());
    ASSERT_TRUE(engine.queue_operation(OperationType::CreateDraft, "draft", "3", "{}").is_ok());

    engine.network().update_status(network::NetworkStatus{false});

    auto status = engine.offline_status();
    ASSERT_TRUE(status.is_ok());
    const auto& s = status.value();
    EXPECT_EQ(s.pending_operations, 1u);
    EXPECT_EQ(s.failed_operations, 0u);
    EXPECT_EQ(s.cached_items.at("draft"), 2u);
    EXPECT_EQ(s.cached_items.at("settings"), 1u);
    EXPECT_GT(s.storage_used, 0u);
    EXPECT_EQ(s.storage_quota, config.offline.max_storage_bytes);
    EXPECT_GT(s.storage_percentage, 0.0);
    EXPECT_LT(s.storage_percentage, 100.0);
    EXPECT_FALSE(s.online);
    EXPECT_TRUE(s.offline_mode);
    EXPECT_FALSE(s.last_sync.has_value());

    auto refused = engine.sync_now();
    ASSERT_TRUE(refused.is_error());
    EXPECT_EQ(refused.error().kind, ErrorKind::Offline);
}

TEST(OfflineEngineTest, ReconnectReplaysQueue) {
    remote::LoopbackRemoteApi remote;
    OfflineEngine engine(test_config(), remote);
    ASSERT_TRUE(engine.initialize().is_ok());

    engine.network().update_status(network::NetworkStatus{false});
    ASSERT_TRUE(engine.queue_operation(OperationType::CreateDraft, "draft", "1", "{}").is_ok());
    ASSERT_TRUE(engine.queue_operation(OperationType::UpdateSettings, "settings", "theme", "{}").is_ok());

    engine.network().update_status(network::NetworkStatus{true, "wifi"});

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (engine.operations().pending_count().value() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(engine.operations().pending_count().value(), 0u);
    EXPECT_EQ(remote.applied_operations().size(), 2u);
}

TEST(OfflineEngineTest, UploadAttachmentReachesRemoteOnSync) {
    remote::LoopbackRemoteApi remote;
    remote.put_entity("draft", "1", "{}");
    OfflineEngine engine(test_config(), remote);
    ASSERT_TRUE(engine.initialize().is_ok());

    upload::UploadOptions options;
    options.attach_to = upload::AttachTarget{"draft", "1"};
    auto id = engine.uploads().enqueue(upload::FileSource::from_memory("cover.png", std::string(4096, 'x'),
                                                                       "image/png"),
                                       options);
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(engine.uploads().wait_idle(10s));
    EXPECT_EQ(engine.metrics().get_stats().uploads_completed.load(), 1u);

    auto summary = engine.sync_now();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().synced_count, 1u);
    EXPECT_EQ(remote.attachments("draft", "1").size(), 1u);
}

TEST(OfflineEngineTest, QueuedOperationsSurviveRestart) {
    auto path = std::filesystem::temp_directory_path() / "ofs_engine_restart.db";
    std::filesystem::remove(path);

    auto config = test_config();
    config.storage.database_path = path.string();
    remote::LoopbackRemoteApi remote;
    {
        OfflineEngine engine(config, remote);
        ASSERT_TRUE(engine.initialize().is_ok());
        ASSERT_TRUE(engine.queue_operation(OperationType::DeleteDraft, "draft", "9", "").is_ok());
        engine.dispose();
    }
    {
        OfflineEngine engine(config, remote);
        ASSERT_TRUE(engine.initialize().is_ok());
        auto pending = engine.operations().list_pending();
        ASSERT_TRUE(pending.is_ok());
        ASSERT_EQ(pending.value().size(), 1u);
        EXPECT_EQ(pending.value()[0].entity_id, "9");
    }
    std::filesystem::remove(path);
}

TEST(OfflineEngineTest, InitializeAfterDisposeIsRefused) {
    remote::LoopbackRemoteApi remote;
    OfflineEngine engine(test_config(), remote);
    ASSERT_TRUE(engine.initialize().is_ok());
    engine.dispose();

    auto again = engine.initialize();
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, ErrorKind::InvalidState);
    EXPECT_FALSE(engine.initialized());
    EXPECT_FALSE(engine.network().running());
}

TEST(OfflineEngineTest, DisposeCancelsBackgroundSyncCycle) {
    remote::LoopbackRemoteApi remote;
    OfflineEngine engine(test_config(), remote);
    ASSERT_TRUE(engine.initialize().is_ok());

    engine.network().update_status(network::NetworkStatus{false});
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(engine.queue_operation(OperationType::UpdateSettings, "settings", "k" + std::to_string(i), "{}")
                        .is_ok());
    }
    remote.set_latency(Millis{100});

    std::atomic<bool> started{false};
    engine.bus().subscribe<events::SyncStartedEvent>([&](const events::SyncStartedEvent&) { started = true; });
    engine.network().update_status(network::NetworkStatus{true, "wifi"});

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!started && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(started.load());
    std::this_thread::sleep_for(50ms);

    auto before = std::chrono::steady_clock::now();
    engine.dispose();
    auto took = std::chrono::steady_clock::now() - before;

    EXPECT_LT(remote.applied_operations().size(), 10u);
    EXPECT_LT(took, 800ms);
    EXPECT_GT(engine.operations().pending_count().value(), 0u);
}

TEST(OfflineEngineTest, FullStoreEvictsCacheToKeepQueueing) {
    auto config = test_config();
    config.offline.max_storage_bytes = 512 * 1024;
    remote::LoopbackRemoteApi remote;
    OfflineEngine engine(config, remote);
    ASSERT_TRUE(engine.initialize().is_ok());

    const std::string payload(16 * 1024, 'c');
    bool full = false;
    for (std::int64_t i = 0; i < 200 && !full; ++i) {
        auto r = engine.store().execute(
            "INSERT INTO cache(key, data, timestamp, expires_at) VALUES(?, ?, ?, NULL)",
            {"draft:" + std::to_string(i), store::Blob{payload}, i});
        if (r.is_error()) {
            ASSERT_EQ(r.error().kind, ErrorKind::Quota) << r.error();
            full = true;
        }
    }
    ASSERT_TRUE(full);
    auto cached_before = engine.cache().stats().value().total_items;

    auto queued = engine.queue_operation(OperationType::UpdateDraft, "draft", "1", std::string(20 * 1024, 'd'));
    ASSERT_TRUE(queued.is_ok()) << queued.error();
    EXPECT_LT(engine.cache().stats().value().total_items, cached_before);
    EXPECT_EQ(engine.operations().pending_count().value(), 1u);
}
