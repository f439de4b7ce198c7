/**
 * @file offline_sync_demo.cpp
 * @brief Walks through one offline session against an in-process backend
 *
 * WHAT IT SHOWS:
 * - Reading through the cache, and serving stale data when the backend is down
 * - Queueing draft edits while offline
 * - Reconnecting and replaying the queue in order
 * - Uploading a generated 5 MiB file in 2 MiB chunks and attaching it to a draft
 *
 * Run with:
 *   ./build/offline_sync_demo [config.json]
 */

#include "ofs/core/config.hpp"
#include "ofs/engine/engine.hpp"
#include "ofs/remote/loopback_remote.hpp"
#include "ofs/upload/file_source.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <string>
#include <thread>

using namespace ofs;
using json = nlohmann::json;

namespace {

void print_status(OfflineEngine& engine) {
    auto status = engine.offline_status();
    if (status.is_error()) {
        spdlog::error("Cannot read status: {}", status.error().message);
        return;
    }

    const auto& s = status.value();
    spdlog::info("Status: {} | pending={} failed={} uploads={} storage={:.2f}%",
                 s.offline_mode ? "OFFLINE" : "online", s.pending_operations, s.failed_operations,
                 s.active_uploads, s.storage_percentage);
    for (const auto& [type, count] : s.cached_items) {
        spdlog::info("  cached {}: {}", type, count);
    }
}

void section(const char* title) {
    spdlog::info("");
    spdlog::info("════════════════════════════════════════════════════════");
    spdlog::info("  {}", title);
    spdlog::info("════════════════════════════════════════════════════════");
}

} // namespace

int main(int argc, char* argv[]) {
    EngineConfig config;
    if (argc > 1) {
        auto loaded = load_config(argv[1]);
        if (loaded.is_error()) {
            spdlog::error("Cannot load {}: {}", argv[1], describe(loaded.error()));
            return 1;
        }
        config = loaded.value();
    } else {
        config.storage.database_path = ":memory:";
        config.sync.reconnect_delay = Millis{200};
        config.upload.retry_delay = Millis{100};
    }

    remote::LoopbackRemoteApi backend;
    backend.put_resource("/drafts", R"([{"id":"1","title":"Welcome"}])");
    backend.put_entity("draft", "1", R"({"id":"1","title":"Welcome"})");

    OfflineEngine engine(config, backend);
    auto ready = engine.initialize();
    if (ready.is_error()) {
        spdlog::error("Engine failed to start: {}", describe(ready.error()));
        return 1;
    }

    // ────────────────────────────────────────
    section("1. Read through the cache");
    // ────────────────────────────────────────
    const auto key = cache::fingerprint("/drafts", R"({"page":1})");
    auto fetch_drafts = [&]() {
        return backend.fetch("/drafts", R"({"page":1})", remote::CallOptions{config.network.request_timeout});
    };

    auto first = engine.cache().fetch_with_cache(fetch_drafts, key);
    if (first.is_ok()) {
        spdlog::info("Fetched drafts (from_cache={}): {}", first.value().from_cache, first.value().payload);
    }

    // ────────────────────────────────────────
    section("2. Go offline and keep working");
    // ────────────────────────────────────────
    backend.set_online(false);
    engine.network().update_status(network::NetworkStatus{false});

    cache::FetchOptions refresh;
    refresh.force_refresh = true;
    auto stale = engine.cache().fetch_with_cache(fetch_drafts, key, refresh);
    if (stale.is_ok()) {
        spdlog::info("Backend down, served {} copy: {}", stale.value().stale ? "stale" : "fresh",
                     stale.value().payload);
    }

    auto queue = [&](oplog::OperationType op, const char* type, const char* id, const json& data) {
        auto queued = engine.queue_operation(op, type, id, data.dump());
        if (queued.is_error()) {
            spdlog::error("Could not queue {} {}/{}: {}", oplog::to_string(op), type, id, queued.error().message);
        }
    };
    queue(oplog::OperationType::CreateDraft, "draft", "2", json{{"id", "2"}, {"title", "Written offline"}});
    queue(oplog::OperationType::UpdateDraft, "draft", "1", json{{"id", "1"}, {"title", "Welcome (edited)"}});
    queue(oplog::OperationType::UpdateSettings, "settings", "theme", json{{"theme", "dark"}});

    auto attempt = engine.sync_now();
    if (attempt.is_error()) {
        spdlog::info("Sync while offline refused: {}", describe(attempt.error()));
    }
    print_status(engine);

    // ────────────────────────────────────────
    section("3. Reconnect");
    // ────────────────────────────────────────
    backend.set_online(true);
    engine.network().update_status(network::NetworkStatus{true, "wifi", "4g", 50.0, 40});

    // The observer replays the queue after the reconnect delay
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        auto pending = engine.operations().pending_count();
        if (pending.is_ok() && pending.value() == 0) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    spdlog::info("Remote draft 1 is now: {}", backend.entity("draft", "1").value_or("<missing>"));
    print_status(engine);

    // ────────────────────────────────────────
    section("4. Upload an attachment");
    // ────────────────────────────────────────
    std::string image(5 * 1024 * 1024, '\0');
    for (std::size_t i = 0; i < image.size(); ++i) {
        image[i] = static_cast<char>(i % 251);
    }
    auto source = upload::FileSource::from_memory("cover.png", std::move(image), "image/png");

    upload::UploadOptions options;
    options.attach_to = upload::AttachTarget{"draft", "2"};
    auto task_id = engine.uploads().enqueue(source, options);
    if (task_id.is_error()) {
        spdlog::error("Upload rejected: {}", describe(task_id.error()));
    } else {
        if (!engine.uploads().wait_idle(std::chrono::seconds(30))) {
            spdlog::warn("Upload still running after 30s");
        }
        auto task = engine.uploads().task(task_id.value());
        if (task && task->result) {
            spdlog::info("Uploaded {} in {} chunks as {}", task->file_name,
                         task->chunk_info ? task->chunk_info->total_chunks : 1, task->result->url);
        }

        // The attachment was queued as an upload_image operation
        auto replay = engine.sync_now();
        if (replay.is_ok()) {
            spdlog::info("Attachment sync: {} synced", replay.value().synced_count);
        }
    }

    print_status(engine);
    engine.metrics().print_stats();
    engine.dispose();
    return 0;
}
