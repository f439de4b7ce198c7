#include "ofs/store/local_store.hpp"

#include "ofs/core/clock.hpp"

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace ofs::store {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS cache (
    key         TEXT PRIMARY KEY,
    data        BLOB NOT NULL,
    timestamp   INTEGER NOT NULL,
    expires_at  INTEGER
);
CREATE INDEX IF NOT EXISTS idx_cache_key ON cache(key);
CREATE INDEX IF NOT EXISTS idx_cache_expires_at ON cache(expires_at);

CREATE TABLE IF NOT EXISTS operation_log (
    id           TEXT PRIMARY KEY,
    operation    TEXT NOT NULL,
    entity_type  TEXT NOT NULL,
    entity_id    TEXT NOT NULL,
    data         BLOB,
    status       TEXT NOT NULL,
    timestamp    INTEGER NOT NULL,
    retry_count  INTEGER NOT NULL DEFAULT 0,
    error        TEXT
);
CREATE INDEX IF NOT EXISTS idx_operation_log_status ON operation_log(status);

CREATE TABLE IF NOT EXISTS settings (
    key         TEXT PRIMARY KEY,
    value       TEXT NOT NULL,
    updated_at  INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS conflicts (
    operation_id    TEXT PRIMARY KEY,
    entity_type     TEXT NOT NULL,
    entity_id       TEXT NOT NULL,
    local_version   BLOB,
    remote_version  BLOB,
    detected_at     INTEGER NOT NULL
);
)sql";

int bind_value(sqlite3_stmt* stmt, int index, const Value& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return sqlite3_bind_null(stmt, index);
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(*i));
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return sqlite3_bind_double(stmt, index, *d);
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return sqlite3_bind_text(stmt, index, s->data(), static_cast<int>(s->size()), SQLITE_TRANSIENT);
    }
    const auto& blob = std::get<Blob>(value);
    if (blob.bytes.empty()) {
        // A null pointer would bind NULL rather than an empty blob
        return sqlite3_bind_zeroblob(stmt, index, 0);
    }
    return sqlite3_bind_blob(stmt, index, blob.bytes.data(), static_cast<int>(blob.bytes.size()), SQLITE_TRANSIENT);
}

Value column_value(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return static_cast<std::int64_t>(sqlite3_column_int64(stmt, col));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, col);
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            return std::string(text ? text : "", static_cast<std::size_t>(sqlite3_column_bytes(stmt, col)));
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, col));
            auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt, col));
            return Blob{data ? std::string(data, size) : std::string()};
        }
        default:
            return std::monostate{};
    }
}

} // namespace

std::int64_t as_int(const Value& v, std::int64_t fallback) {
    if (const auto* i = std::get_if<std::int64_t>(&v)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(&v)) {
        return static_cast<std::int64_t>(*d);
    }
    return fallback;
}

double as_double(const Value& v, double fallback) {
    if (const auto* d = std::get_if<double>(&v)) {
        return *d;
    }
    if (const auto* i = std::get_if<std::int64_t>(&v)) {
        return static_cast<double>(*i);
    }
    return fallback;
}

std::string as_text(const Value& v) {
    if (const auto* s = std::get_if<std::string>(&v)) {
        return *s;
    }
    if (const auto* b = std::get_if<Blob>(&v)) {
        return b->bytes;
    }
    return {};
}

std::optional<std::string> as_optional_text(const Value& v) {
    if (is_null(v)) {
        return std::nullopt;
    }
    return as_text(v);
}

LocalStore::LocalStore(std::string path) : path_(std::move(path)) {
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("cannot open " + path_ + ": " + msg);
    }

    try {
        create_schema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    spdlog::debug("Local store opened at {}", path_);
}

LocalStore::~LocalStore() {
    if (db_) sqlite3_close(db_);
}

void LocalStore::create_schema() {
    // WAL lets readers proceed while a writer holds the lock
    for (const char* pragma : {"PRAGMA journal_mode=WAL;", "PRAGMA synchronous=NORMAL;",
                               "PRAGMA temp_store=MEMORY;"}) {
        auto r = exec_script(pragma);
        if (r.is_error()) {
            throw std::runtime_error(r.error().message);
        }
    }
    if (sqlite3_busy_timeout(db_, 5000) != SQLITE_OK) {
        throw std::runtime_error(std::string("busy_timeout: ") + sqlite3_errmsg(db_));
    }

    auto schema = exec_script(kSchema);
    if (schema.is_error()) {
        throw std::runtime_error("schema creation failed: " + schema.error().message);
    }
}

Error LocalStore::translate(int rc, const std::string& context) const {
    std::string message = context + ": " + sqlite3_errmsg(db_);
    switch (rc & 0xff) {
        case SQLITE_FULL:
            return make_error(ErrorKind::Quota, message);
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return make_error(ErrorKind::Storage, "database busy: " + message);
        case SQLITE_CONSTRAINT:
            return make_error(ErrorKind::Storage, "constraint violation: " + message);
        case SQLITE_IOERR:
            return make_error(ErrorKind::Storage, "io error: " + message);
        default:
            return make_error(ErrorKind::Storage, message);
    }
}

Result<void> LocalStore::exec_script(const std::string& sql) {
    std::lock_guard lock(mutex_);
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        auto kind = (rc & 0xff) == SQLITE_FULL ? ErrorKind::Quota : ErrorKind::Storage;
        return Fail<void>(kind, msg);
    }
    return Ok();
}

Result<std::int64_t> LocalStore::execute(const std::string& sql, const std::vector<Value>& params) {
    std::lock_guard lock(mutex_);

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
    Statement stmt(raw);
    if (rc != SQLITE_OK) {
        return Err<std::int64_t>(translate(rc, "prepare"));
    }

    for (std::size_t i = 0; i < params.size(); ++i) {
        rc = bind_value(stmt.get(), static_cast<int>(i + 1), params[i]);
        if (rc != SQLITE_OK) {
            return Err<std::int64_t>(translate(rc, "bind"));
        }
    }

    do {
        rc = sqlite3_step(stmt.get());
    } while (rc == SQLITE_ROW);

    if (rc != SQLITE_DONE) {
        return Err<std::int64_t>(translate(rc, "step"));
    }
    return Ok(static_cast<std::int64_t>(sqlite3_changes(db_)));
}

Result<std::vector<Row>> LocalStore::query(const std::string& sql, const std::vector<Value>& params) {
    std::lock_guard lock(mutex_);

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
    Statement stmt(raw);
    if (rc != SQLITE_OK) {
        return Err<std::vector<Row>>(translate(rc, "prepare"));
    }

    for (std::size_t i = 0; i < params.size(); ++i) {
        rc = bind_value(stmt.get(), static_cast<int>(i + 1), params[i]);
        if (rc != SQLITE_OK) {
            return Err<std::vector<Row>>(translate(rc, "bind"));
        }
    }

    std::vector<Row> rows;
    const int columns = sqlite3_column_count(stmt.get());
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        Row row;
        row.reserve(static_cast<std::size_t>(columns));
        for (int col = 0; col < columns; ++col) {
            row.push_back(column_value(stmt.get(), col));
        }
        rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        return Err<std::vector<Row>>(translate(rc, "step"));
    }
    return Ok(std::move(rows));
}

Result<void> LocalStore::transaction(const std::function<Result<void>()>& fn) {
    std::lock_guard lock(mutex_);

    auto begin = exec_script("BEGIN IMMEDIATE;");
    if (begin.is_error()) {
        return begin;
    }

    auto result = fn();
    if (result.is_error()) {
        auto rollback = exec_script("ROLLBACK;");
        if (rollback.is_error()) {
            spdlog::error("Rollback failed: {}", rollback.error().message);
        }
        return result;
    }

    auto commit = exec_script("COMMIT;");
    if (commit.is_error()) {
        auto rollback = exec_script("ROLLBACK;");
        if (rollback.is_error()) {
            spdlog::error("Rollback after failed commit failed: {}", rollback.error().message);
        }
    }
    return commit;
}

Result<std::optional<std::string>> LocalStore::get_setting(const std::string& key) {
    auto rows = query("SELECT value FROM settings WHERE key = ?", {key});
    if (rows.is_error()) {
        return Err<std::optional<std::string>>(rows.error());
    }
    if (rows.value().empty()) {
        return Ok(std::optional<std::string>());
    }
    return Ok(std::optional<std::string>(as_text(rows.value().front().at(0))));
}

Result<void> LocalStore::put_setting(const std::string& key, const std::string& value) {
    auto r = execute(
        "INSERT INTO settings(key, value, updated_at) VALUES(?, ?, ?) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value, updated_at = excluded.updated_at",
        {key, value, to_epoch_ms(SystemClock::instance().now())});
    if (r.is_error()) {
        return Err<void>(r.error());
    }
    return Ok();
}

Result<std::uint64_t> LocalStore::storage_bytes() {
    auto pages = query("PRAGMA page_count");
    auto size = query("PRAGMA page_size");
    if (pages.is_error()) {
        return Err<std::uint64_t>(pages.error());
    }
    if (size.is_error()) {
        return Err<std::uint64_t>(size.error());
    }
    if (pages.value().empty() || size.value().empty()) {
        return Ok<std::uint64_t>(0);
    }
    auto count = as_int(pages.value().front().at(0));
    auto page = as_int(size.value().front().at(0));
    return Ok(static_cast<std::uint64_t>(count * page));
}

Result<void> LocalStore::set_size_limit(std::uint64_t max_bytes) {
    auto size = query("PRAGMA page_size");
    if (size.is_error()) {
        return Err<void>(size.error());
    }
    auto page = size.value().empty() ? 4096 : as_int(size.value().front().at(0), 4096);
    auto max_pages = std::max<std::uint64_t>(1, max_bytes / static_cast<std::uint64_t>(page));
    // max_page_count reports the value it settled on as a row
    auto r = query("PRAGMA max_page_count = " + std::to_string(max_pages));
    if (r.is_error()) {
        return Err<void>(r.error());
    }
    spdlog::debug("Local store size limit set to {} pages of {} bytes", max_pages, page);
    return Ok();
}

} // namespace ofs::store
