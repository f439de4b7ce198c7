#include "ofs/events/events.hpp"
#include "ofs/oplog/operation_log.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace ofs;
using namespace ofs::oplog;
using namespace std::chrono_literals;

class OperationLogTest : public ::testing::Test {
protected:
    store::LocalStore store{":memory:"};
    events::EventBus bus;
    ManualClock clock;
    OperationLog log{store, bus, clock};
};

TEST(OperationTypes, NamesRoundTrip) {
    for (auto type : {OperationType::CreateDraft, OperationType::UpdateDraft, OperationType::DeleteDraft,
                      OperationType::UploadImage, OperationType::DeleteImage, OperationType::UpdateSettings}) {
        auto parsed = parse_operation_type(to_string(type));
        ASSERT_TRUE(parsed.has_value()) << to_string(type);
        EXPECT_EQ(*parsed, type);
    }
    EXPECT_FALSE(parse_operation_type("publish_post").has_value());
    EXPECT_STREQ(to_string(OperationStatus::Failed), "failed");
}

TEST_F(OperationLogTest, AppendCreatesPendingRecord) {
    std::vector<events::OperationQueuedEvent> queued;
    bus.subscribe<events::OperationQueuedEvent>([&](const events::OperationQueuedEvent& e) { queued.push_back(e); });

    auto appended = log.append(OperationType::CreateDraft, "draft", "d1", R"({"title":"x"})");
    ASSERT_TRUE(appended.is_ok()) << appended.error();

    const auto& record = appended.value();
    EXPECT_EQ(record.id.rfind("op-", 0), 0u);
    EXPECT_EQ(record.status, OperationStatus::Pending);
    EXPECT_EQ(record.retry_count, 0u);
    EXPECT_EQ(record.data, R"({"title":"x"})");
    EXPECT_FALSE(record.error.has_value());
    EXPECT_EQ(to_epoch_ms(record.timestamp), to_epoch_ms(clock.now()));

    auto pending = log.list_pending();
    ASSERT_TRUE(pending.is_ok());
    ASSERT_EQ(pending.value().size(), 1u);
    EXPECT_EQ(pending.value()[0].id, record.id);

    ASSERT_EQ(queued.size(), 1u);
    EXPECT_EQ(queued[0].id, record.id);
    EXPECT_EQ(queued[0].entity_id, "d1");
}

TEST_F(OperationLogTest, EmptyEntityTypeIsRejected) {
    auto appended = log.append(OperationType::UpdateDraft, "", "d1", "{}");
    ASSERT_TRUE(appended.is_error());
    EXPECT_EQ(appended.error().kind, ErrorKind::Validation);
    EXPECT_EQ(log.pending_count().value(), 0u);
}

TEST_F(OperationLogTest, PayloadIsStoredOpaquely) {
    std::string bytes("a\0b\xff", 4);
    auto appended = log.append(OperationType::UploadImage, "draft", "d1", bytes);
    ASSERT_TRUE(appended.is_ok());

    auto loaded = log.get(appended.value().id);
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_EQ(loaded.value()->data, bytes);
}

TEST_F(OperationLogTest, PendingIsListedInInsertionOrder) {
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        // Same timestamp for every record: order must come from insertion
        auto appended = log.append(OperationType::UpdateDraft, "draft", std::to_string(i), "{}");
        ASSERT_TRUE(appended.is_ok());
        ids.push_back(appended.value().id);
    }

    auto pending = log.list_pending();
    ASSERT_TRUE(pending.is_ok());
    ASSERT_EQ(pending.value().size(), ids.size());
    for (std::size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(pending.value()[i].id, ids[i]);
        if (i > 0) {
            EXPECT_LT(pending.value()[i - 1].sequence, pending.value()[i].sequence);
        }
    }
}

TEST_F(OperationLogTest, MarkSyncedIsTerminal) {
    auto id = log.append(OperationType::CreateDraft, "draft", "d1", "{}").value().id;

    ASSERT_TRUE(log.mark_synced(id).is_ok());
    EXPECT_EQ(log.pending_count().value(), 0u);
    EXPECT_EQ(log.get(id).value()->status, OperationStatus::Synced);

    auto again = log.mark_synced(id);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, ErrorKind::InvalidState);

    auto fail = log.mark_failed(id, "late failure");
    ASSERT_TRUE(fail.is_error());
    EXPECT_EQ(fail.error().kind, ErrorKind::InvalidState);
}

TEST_F(OperationLogTest, MarkSyncedKeepsNote) {
    auto id = log.append(OperationType::DeleteDraft, "draft", "gone", "").value().id;
    ASSERT_TRUE(log.mark_synced(id, std::string("already deleted remotely")).is_ok());
    EXPECT_EQ(log.get(id).value()->error.value_or(""), "already deleted remotely");
}

TEST_F(OperationLogTest, MarkSyncedUnknownIdIsNotFound) {
    auto r = log.mark_synced("op-missing");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, ErrorKind::NotFound);
}

TEST_F(OperationLogTest, MarkFailedCountsAttempt) {
    auto id = log.append(OperationType::UpdateDraft, "draft", "d1", "{}").value().id;

    auto failed = log.mark_failed(id, "HTTP 500");
    ASSERT_TRUE(failed.is_ok());
    EXPECT_EQ(failed.value().status, OperationStatus::Failed);
    EXPECT_EQ(failed.value().retry_count, 1u);
    EXPECT_EQ(failed.value().error.value_or(""), "HTTP 500");

    EXPECT_EQ(log.pending_count().value(), 0u);
    EXPECT_EQ(log.failed_count().value(), 1u);
    ASSERT_EQ(log.list_failed().value().size(), 1u);
}

TEST_F(OperationLogTest, MarkFailedWithoutCountingAttempt) {
    auto id = log.append(OperationType::UpdateDraft, "draft", "d1", "{}").value().id;
    auto failed = log.mark_failed(id, "conflict needs a decision", false);
    ASSERT_TRUE(failed.is_ok());
    EXPECT_EQ(failed.value().retry_count, 0u);
}

TEST_F(OperationLogTest, RecordAttemptFailureKeepsPending) {
    auto id = log.append(OperationType::UpdateDraft, "draft", "d1", "{}").value().id;

    auto first = log.record_attempt_failure(id, "timeout");
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().status, OperationStatus::Pending);
    EXPECT_EQ(first.value().retry_count, 1u);

    auto second = log.record_attempt_failure(id, "timeout");
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().retry_count, 2u);
}

TEST_F(OperationLogTest, RequeueReturnsFailedToPending) {
    auto id = log.append(OperationType::UpdateDraft, "draft", "d1", "{}").value().id;
    ASSERT_TRUE(log.mark_failed(id, "boom").is_ok());

    ASSERT_TRUE(log.requeue(id).is_ok());
    auto record = log.get(id).value();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, OperationStatus::Pending);
    EXPECT_EQ(record->retry_count, 1u);
    EXPECT_FALSE(record->error.has_value());
}

TEST_F(OperationLogTest, RequeueRequiresFailedStatus) {
    auto id = log.append(OperationType::UpdateDraft, "draft", "d1", "{}").value().id;
    auto r = log.requeue(id);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidState);
}

TEST_F(OperationLogTest, RemoveDeletesRecord) {
    auto id = log.append(OperationType::UpdateSettings, "settings", "theme", "{}").value().id;

    int removed_events = 0;
    bus.subscribe<events::OperationRemovedEvent>([&](const events::OperationRemovedEvent&) { ++removed_events; });

    ASSERT_TRUE(log.remove(id).is_ok());
    EXPECT_FALSE(log.get(id).value().has_value());
    EXPECT_EQ(removed_events, 1);

    auto again = log.remove(id);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, ErrorKind::NotFound);
}

namespace {

void store_conflict(store::LocalStore& store, const std::string& operation_id) {
    auto r = store.execute(
        "INSERT INTO conflicts(operation_id, entity_type, entity_id, local_version, remote_version, detected_at) "
        "VALUES(?, 'draft', 'd1', '1', '2', 0)",
        {operation_id});
    ASSERT_TRUE(r.is_ok()) << r.error();
}

std::int64_t count_rows(store::LocalStore& store, const std::string& table) {
    auto rows = store.query("SELECT COUNT(*) FROM " + table);
    return rows.is_ok() ? store::as_int(rows.value().front().at(0)) : -1;
}

// Inserts 16 KiB cache rows until the store refuses with Quota
std::int64_t fill_with_cache_rows(store::LocalStore& store) {
    const std::string payload(16 * 1024, 'c');
    for (std::int64_t i = 0; i < 200; ++i) {
        auto r = store.execute("INSERT INTO cache(key, data, timestamp, expires_at) VALUES(?, ?, ?, NULL)",
                               {"filler:" + std::to_string(i), store::Blob{payload}, i});
        if (r.is_error()) {
            EXPECT_EQ(r.error().kind, ErrorKind::Quota) << r.error();
            return i;
        }
    }
    ADD_FAILURE() << "store never reported Quota";
    return 0;
}

} // namespace

TEST_F(OperationLogTest, RemoveDropsStoredConflict) {
    auto id = log.append(OperationType::UpdateDraft, "draft", "d1", "{}").value().id;
    store_conflict(store, id);
    ASSERT_EQ(count_rows(store, "conflicts"), 1);

    ASSERT_TRUE(log.remove(id).is_ok());
    EXPECT_EQ(count_rows(store, "conflicts"), 0);
}

TEST_F(OperationLogTest, MarkSyncedDropsStoredConflict) {
    auto kept = log.append(OperationType::UpdateDraft, "draft", "d1", "{}").value().id;
    auto synced = log.append(OperationType::UpdateDraft, "draft", "d2", "{}").value().id;
    store_conflict(store, kept);
    store_conflict(store, synced);

    ASSERT_TRUE(log.mark_failed(synced, "conflict").is_ok());
    ASSERT_TRUE(log.requeue(synced).is_ok());
    ASSERT_TRUE(log.mark_synced(synced).is_ok());

    auto rows = store.query("SELECT operation_id FROM conflicts");
    ASSERT_TRUE(rows.is_ok());
    ASSERT_EQ(rows.value().size(), 1u);
    EXPECT_EQ(store::as_text(rows.value()[0].at(0)), kept);
}

TEST_F(OperationLogTest, AppendReclaimsSpaceOnceWhenStoreIsFull) {
    ASSERT_TRUE(store.set_size_limit(512 * 1024).is_ok());
    ASSERT_GT(fill_with_cache_rows(store), 0);

    int reclaims = 0;
    log.set_space_reclaimer([&]() -> Result<std::size_t> {
        ++reclaims;
        auto r = store.execute("DELETE FROM cache", {});
        if (r.is_error()) {
            return Err<std::size_t>(r.error());
        }
        return Ok(static_cast<std::size_t>(r.value()));
    });

    auto appended = log.append(OperationType::CreateDraft, "draft", "big", std::string(20 * 1024, 'd'));
    ASSERT_TRUE(appended.is_ok()) << appended.error();
    EXPECT_EQ(reclaims, 1);
    EXPECT_EQ(count_rows(store, "cache"), 0);
    EXPECT_EQ(log.pending_count().value(), 1u);
}

TEST_F(OperationLogTest, AppendReportsQuotaWhenNothingCanBeReclaimed) {
    ASSERT_TRUE(store.set_size_limit(512 * 1024).is_ok());
    ASSERT_GT(fill_with_cache_rows(store), 0);

    int reclaims = 0;
    log.set_space_reclaimer([&]() -> Result<std::size_t> {
        ++reclaims;
        return Ok(std::size_t{0});
    });

    auto appended = log.append(OperationType::CreateDraft, "draft", "big", std::string(20 * 1024, 'd'));
    ASSERT_TRUE(appended.is_error());
    EXPECT_EQ(appended.error().kind, ErrorKind::Quota);
    EXPECT_EQ(reclaims, 1);
    EXPECT_EQ(log.pending_count().value(), 0u);
}

TEST_F(OperationLogTest, PurgeSyncedRemovesOnlyOldSyncedRecords) {
    auto old_synced = log.append(OperationType::CreateDraft, "draft", "a", "{}").value().id;
    auto old_pending = log.append(OperationType::CreateDraft, "draft", "b", "{}").value().id;
    ASSERT_TRUE(log.mark_synced(old_synced).is_ok());

    clock.advance(std::chrono::hours(48));
    auto recent_synced = log.append(OperationType::CreateDraft, "draft", "c", "{}").value().id;
    ASSERT_TRUE(log.mark_synced(recent_synced).is_ok());

    auto purged = log.purge_synced(clock.now() - std::chrono::hours(24));
    ASSERT_TRUE(purged.is_ok());
    EXPECT_EQ(purged.value(), 1u);

    EXPECT_FALSE(log.get(old_synced).value().has_value());
    EXPECT_TRUE(log.get(old_pending).value().has_value());
    EXPECT_TRUE(log.get(recent_synced).value().has_value());
}

TEST_F(OperationLogTest, RecordsSurviveReopen) {
    auto id = log.append(OperationType::CreateDraft, "draft", "d1", "{}").value().id;

    OperationLog reopened(store, bus, clock);
    auto all = reopened.list_all();
    ASSERT_TRUE(all.is_ok());
    ASSERT_EQ(all.value().size(), 1u);
    EXPECT_EQ(all.value()[0].id, id);
}
