#pragma once

/**
 * @file local_store.hpp
 * @brief Durable SQLite-backed storage shared by the cache and operation log
 *
 * WHAT IT DOES:
 * - Opens (or creates) one SQLite database and creates the engine schema
 *   idempotently: cache, operation_log, settings, conflicts
 * - Runs parameterised statements and returns rows as Value vectors
 * - Serialises multi-statement transactions against other callers
 * - Maps SQLite result codes onto ErrorKind (SQLITE_FULL -> Quota)
 *
 * EXAMPLE:
 * LocalStore store(":memory:");
 * store.execute("INSERT INTO settings(key, value, updated_at) VALUES(?, ?, ?)",
 *               {std::string("k"), std::string("v"), std::int64_t{0}});
 * auto rows = store.query("SELECT value FROM settings WHERE key = ?", {std::string("k")});
 */

#include "ofs/core/result.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct sqlite3;

namespace ofs::store {

/**
 * @brief Opaque byte payload stored in a BLOB column
 */
struct Blob {
    std::string bytes;
};

using Value = std::variant<std::monostate, std::int64_t, double, std::string, Blob>;
using Row = std::vector<Value>;

inline bool is_null(const Value& v) { return std::holds_alternative<std::monostate>(v); }
std::int64_t as_int(const Value& v, std::int64_t fallback = 0);
double as_double(const Value& v, double fallback = 0.0);
// Text and blob columns both come back as their raw bytes
std::string as_text(const Value& v);
std::optional<std::string> as_optional_text(const Value& v);

class LocalStore {
public:
    /**
     * @brief Open the database and create the schema
     *
     * THROWS: std::runtime_error when the file cannot be opened or the
     *         schema cannot be created; there is no usable store otherwise.
     */
    explicit LocalStore(std::string path);
    ~LocalStore();

    LocalStore(const LocalStore&) = delete;
    LocalStore& operator=(const LocalStore&) = delete;

    /**
     * @brief Run a statement that returns no rows
     *
     * RETURNS: Number of rows changed
     */
    Result<std::int64_t> execute(const std::string& sql, const std::vector<Value>& params = {});

    Result<std::vector<Row>> query(const std::string& sql, const std::vector<Value>& params = {});

    /**
     * @brief Run `fn` inside BEGIN IMMEDIATE ... COMMIT
     *
     * The transaction rolls back when `fn` returns an error. Other threads
     * calling into the store wait until it finishes.
     */
    Result<void> transaction(const std::function<Result<void>()>& fn);

    Result<std::optional<std::string>> get_setting(const std::string& key);
    Result<void> put_setting(const std::string& key, const std::string& value);

    /**
     * @brief Database size on disk (page_count * page_size)
     */
    Result<std::uint64_t> storage_bytes();

    /**
     * @brief Cap the database size; writes past it fail with ErrorKind::Quota
     */
    Result<void> set_size_limit(std::uint64_t max_bytes);

    const std::string& path() const { return path_; }

private:
    Error translate(int rc, const std::string& context) const;
    Result<void> exec_script(const std::string& sql);
    void create_schema();

    sqlite3* db_ = nullptr;
    std::string path_;
    std::recursive_mutex mutex_;
};

} // namespace ofs::store
