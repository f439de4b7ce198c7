#include "ofs/oplog/operation_log.hpp"

#include "ofs/core/ids.hpp"
#include "ofs/events/events.hpp"

#include <spdlog/spdlog.h>

namespace ofs::oplog {

namespace {

constexpr const char* kColumns =
    "id, operation, entity_type, entity_id, data, status, timestamp, retry_count, error, rowid";

Result<OperationRecord> record_from_row(const store::Row& row) {
    OperationRecord record;
    record.id = store::as_text(row.at(0));

    auto operation = parse_operation_type(store::as_text(row.at(1)));
    auto status = parse_operation_status(store::as_text(row.at(5)));
    if (!operation || !status) {
        return Fail<OperationRecord>(ErrorKind::Storage, "corrupt operation_log row " + record.id);
    }

    record.operation = *operation;
    record.entity_type = store::as_text(row.at(2));
    record.entity_id = store::as_text(row.at(3));
    record.data = store::as_text(row.at(4));
    record.status = *status;
    record.timestamp = from_epoch_ms(store::as_int(row.at(6)));
    record.retry_count = static_cast<std::uint32_t>(store::as_int(row.at(7)));
    record.error = store::as_optional_text(row.at(8));
    record.sequence = store::as_int(row.at(9));
    return Ok(std::move(record));
}

} // namespace

OperationLog::OperationLog(store::LocalStore& store, events::EventBus& bus, const Clock& clock)
    : store_(store),
      bus_(bus),
      clock_(clock) {}

Result<OperationRecord> OperationLog::append(OperationType operation,
                                             std::string entity_type,
                                             std::string entity_id,
                                             std::string data) {
    if (entity_type.empty()) {
        return Fail<OperationRecord>(ErrorKind::Validation, "entity_type must not be empty");
    }

    OperationRecord record;
    record.id = generate_id("op");
    record.operation = operation;
    record.entity_type = std::move(entity_type);
    record.entity_id = std::move(entity_id);
    record.data = std::move(data);
    record.status = OperationStatus::Pending;
    record.timestamp = clock_.now();

    auto insert = [&]() {
        return store_.execute(
            "INSERT INTO operation_log(id, operation, entity_type, entity_id, data, status, timestamp, retry_count, error) "
            "VALUES(?, ?, ?, ?, ?, ?, ?, 0, NULL)",
            {record.id, std::string(to_string(record.operation)), record.entity_type, record.entity_id,
             store::Blob{record.data}, std::string(to_string(record.status)), to_epoch_ms(record.timestamp)});
    };

    auto r = insert();
    if (r.failed_with(ErrorKind::Quota) && reclaim_) {
        // Intents outrank cached reads: free cache rows, then try once more
        auto freed = reclaim_();
        if (freed.is_error()) {
            spdlog::warn("Could not reclaim space for {}: {}", record.id, freed.error().message);
        } else {
            spdlog::info("Reclaimed {} cache entries to append {}", freed.value(), record.id);
            r = insert();
        }
    }
    if (r.is_error()) {
        spdlog::error("Failed to append {} for {}/{}: {}", to_string(operation),
                      record.entity_type, record.entity_id, r.error().message);
        return Err<OperationRecord>(r.error());
    }

    auto stored = require(record.id);
    if (stored.is_error()) {
        return stored;
    }

    bus_.emit(events::OperationQueuedEvent{record.id, record.operation, record.entity_type, record.entity_id});
    return stored;
}

Result<std::vector<OperationRecord>> OperationLog::list_pending() {
    return select("WHERE status = ?", {std::string(to_string(OperationStatus::Pending))});
}

Result<std::vector<OperationRecord>> OperationLog::list_failed() {
    return select("WHERE status = ?", {std::string(to_string(OperationStatus::Failed))});
}

Result<std::vector<OperationRecord>> OperationLog::list_all() {
    return select("", {});
}

Result<std::optional<OperationRecord>> OperationLog::get(const std::string& id) {
    auto records = select("WHERE id = ?", {id});
    if (records.is_error()) {
        return Err<std::optional<OperationRecord>>(records.error());
    }
    if (records.value().empty()) {
        return Ok(std::optional<OperationRecord>());
    }
    return Ok(std::optional<OperationRecord>(std::move(records.value().front())));
}

Result<std::size_t> OperationLog::pending_count() {
    return count_status(OperationStatus::Pending);
}

Result<std::size_t> OperationLog::failed_count() {
    return count_status(OperationStatus::Failed);
}

Result<void> OperationLog::mark_synced(const std::string& id, std::optional<std::string> note) {
    auto current = require(id);
    if (current.is_error()) {
        return Err<void>(current.error());
    }
    if (current.value().status == OperationStatus::Synced) {
        return Fail<void>(ErrorKind::InvalidState, "operation " + id + " is already synced");
    }

    store::Value note_value = note ? store::Value(*note) : store::Value(std::monostate{});
    // A synced record has nothing left to resolve
    return store_.transaction([&]() -> Result<void> {
        auto r = store_.execute("UPDATE operation_log SET status = ?, error = ? WHERE id = ? AND status <> ?",
                                {std::string(to_string(OperationStatus::Synced)), note_value, id,
                                 std::string(to_string(OperationStatus::Synced))});
        if (r.is_error()) {
            return Err<void>(r.error());
        }
        if (r.value() == 0) {
            return Fail<void>(ErrorKind::InvalidState, "operation " + id + " is already synced");
        }
        return drop_conflict(id);
    });
}

Result<OperationRecord> OperationLog::mark_failed(const std::string& id, const std::string& error, bool count_attempt) {
    auto current = require(id);
    if (current.is_error()) {
        return current;
    }
    if (current.value().status == OperationStatus::Synced) {
        return Fail<OperationRecord>(ErrorKind::InvalidState, "operation " + id + " is already synced");
    }

    auto r = store_.execute(
        "UPDATE operation_log SET status = ?, error = ?, retry_count = retry_count + ? WHERE id = ?",
        {std::string(to_string(OperationStatus::Failed)), error,
         static_cast<std::int64_t>(count_attempt ? 1 : 0), id});
    if (r.is_error()) {
        return Err<OperationRecord>(r.error());
    }
    return require(id);
}

Result<OperationRecord> OperationLog::record_attempt_failure(const std::string& id, const std::string& error) {
    auto current = require(id);
    if (current.is_error()) {
        return current;
    }
    if (current.value().status != OperationStatus::Pending) {
        return Fail<OperationRecord>(ErrorKind::InvalidState,
                                     "operation " + id + " is " + to_string(current.value().status));
    }

    auto r = store_.execute("UPDATE operation_log SET error = ?, retry_count = retry_count + 1 WHERE id = ?",
                            {error, id});
    if (r.is_error()) {
        return Err<OperationRecord>(r.error());
    }
    return require(id);
}

Result<void> OperationLog::requeue(const std::string& id) {
    auto current = require(id);
    if (current.is_error()) {
        return Err<void>(current.error());
    }
    if (current.value().status != OperationStatus::Failed) {
        return Fail<void>(ErrorKind::InvalidState,
                          "only failed operations can be requeued, " + id + " is " +
                          to_string(current.value().status));
    }

    auto r = store_.execute("UPDATE operation_log SET status = ?, error = NULL WHERE id = ?",
                            {std::string(to_string(OperationStatus::Pending)), id});
    if (r.is_error()) {
        return Err<void>(r.error());
    }
    spdlog::info("Requeued operation {} (retries so far: {})", id, current.value().retry_count);
    return Ok();
}

Result<void> OperationLog::remove(const std::string& id) {
    auto removed = store_.transaction([&]() -> Result<void> {
        auto r = store_.execute("DELETE FROM operation_log WHERE id = ?", {id});
        if (r.is_error()) {
            return Err<void>(r.error());
        }
        if (r.value() == 0) {
            return Fail<void>(ErrorKind::NotFound, "no operation " + id);
        }
        return drop_conflict(id);
    });
    if (removed.is_error()) {
        return removed;
    }
    bus_.emit(events::OperationRemovedEvent{id});
    return Ok();
}

Result<void> OperationLog::drop_conflict(const std::string& id) {
    auto r = store_.execute("DELETE FROM conflicts WHERE operation_id = ?", {id});
    if (r.is_error()) {
        return Err<void>(r.error());
    }
    if (r.value() > 0) {
        spdlog::debug("Dropped stored conflict for operation {}", id);
    }
    return Ok();
}

Result<std::size_t> OperationLog::purge_synced(TimePoint older_than) {
    auto r = store_.execute("DELETE FROM operation_log WHERE status = ? AND timestamp < ?",
                            {std::string(to_string(OperationStatus::Synced)), to_epoch_ms(older_than)});
    if (r.is_error()) {
        return Err<std::size_t>(r.error());
    }
    if (r.value() > 0) {
        spdlog::debug("Purged {} synced operations", r.value());
    }
    return Ok(static_cast<std::size_t>(r.value()));
}

Result<std::vector<OperationRecord>> OperationLog::select(const std::string& where,
                                                          const std::vector<store::Value>& params) {
    // rowid grows with every insert, so it is the insertion order
    auto rows = store_.query(std::string("SELECT ") + kColumns + " FROM operation_log " + where + " ORDER BY rowid ASC",
                             params);
    if (rows.is_error()) {
        return Err<std::vector<OperationRecord>>(rows.error());
    }

    std::vector<OperationRecord> records;
    records.reserve(rows.value().size());
    for (const auto& row : rows.value()) {
        auto record = record_from_row(row);
        if (record.is_error()) {
            return Err<std::vector<OperationRecord>>(record.error());
        }
        records.push_back(std::move(record.value()));
    }
    return Ok(std::move(records));
}

Result<OperationRecord> OperationLog::require(const std::string& id) {
    auto found = get(id);
    if (found.is_error()) {
        return Err<OperationRecord>(found.error());
    }
    if (!found.value()) {
        return Fail<OperationRecord>(ErrorKind::NotFound, "no operation " + id);
    }
    return Ok(std::move(*found.value()));
}

Result<std::size_t> OperationLog::count_status(OperationStatus status) {
    auto rows = store_.query("SELECT COUNT(*) FROM operation_log WHERE status = ?",
                             {std::string(to_string(status))});
    if (rows.is_error()) {
        return Err<std::size_t>(rows.error());
    }
    return Ok(static_cast<std::size_t>(store::as_int(rows.value().at(0).at(0))));
}

} // namespace ofs::oplog
