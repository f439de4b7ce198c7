#include "ofs/store/local_store.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>

using ofs::ErrorKind;
using ofs::Result;
using ofs::store::Blob;
using ofs::store::LocalStore;
using ofs::store::Value;

namespace {

std::filesystem::path temp_db(const char* name) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(path);
    return path;
}

} // namespace

TEST(LocalStoreTest, CreatesSchemaIdempotently) {
    auto path = temp_db("ofs_store_schema.db");
    {
        LocalStore first(path.string());
        auto r = first.put_setting("k", "v");
        ASSERT_TRUE(r.is_ok()) << r.error();
    }
    {
        // Reopening must not fail on the existing tables
        LocalStore second(path.string());
        auto value = second.get_setting("k");
        ASSERT_TRUE(value.is_ok());
        EXPECT_EQ(value.value().value_or(""), "v");
    }
    std::filesystem::remove(path);
}

TEST(LocalStoreTest, OpenFailureThrows) {
    EXPECT_THROW(LocalStore("/nonexistent-dir/sub/ofs.db"), std::runtime_error);
}

TEST(LocalStoreTest, ExecuteAndQueryWithParameters) {
    LocalStore store(":memory:");

    auto inserted = store.execute(
        "INSERT INTO cache(key, data, timestamp, expires_at) VALUES(?, ?, ?, ?)",
        {std::string("posts_{}"), Blob{std::string("[1,2,3]")}, std::int64_t{1000}, Value{}});
    ASSERT_TRUE(inserted.is_ok()) << inserted.error();
    EXPECT_EQ(inserted.value(), 1);

    auto rows = store.query("SELECT data, timestamp, expires_at FROM cache WHERE key = ?",
                            {std::string("posts_{}")});
    ASSERT_TRUE(rows.is_ok());
    ASSERT_EQ(rows.value().size(), 1u);
    EXPECT_EQ(ofs::store::as_text(rows.value()[0][0]), "[1,2,3]");
    EXPECT_EQ(ofs::store::as_int(rows.value()[0][1]), 1000);
    EXPECT_TRUE(ofs::store::is_null(rows.value()[0][2]));
}

TEST(LocalStoreTest, BlobsKeepEmbeddedNulBytes) {
    LocalStore store(":memory:");
    std::string bytes("a\0b\0c", 5);

    ASSERT_TRUE(store.execute("INSERT INTO cache(key, data, timestamp) VALUES(?, ?, ?)",
                              {std::string("bin"), Blob{bytes}, std::int64_t{0}})
                    .is_ok());

    auto rows = store.query("SELECT data FROM cache WHERE key = 'bin'");
    ASSERT_TRUE(rows.is_ok());
    EXPECT_EQ(ofs::store::as_text(rows.value().at(0).at(0)), bytes);
}

TEST(LocalStoreTest, InvalidSqlIsStorageError) {
    LocalStore store(":memory:");

    auto result = store.query("SELECT * FROM no_such_table");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Storage);
}

TEST(LocalStoreTest, TransactionRollsBackOnError) {
    LocalStore store(":memory:");

    auto result = store.transaction([&]() -> Result<void> {
        auto r = store.put_setting("temp", "1");
        if (r.is_error()) {
            return r;
        }
        return ofs::Fail<void>(ErrorKind::Validation, "abort");
    });
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Validation);

    auto value = store.get_setting("temp");
    ASSERT_TRUE(value.is_ok());
    EXPECT_FALSE(value.value().has_value());
}

TEST(LocalStoreTest, TransactionCommits) {
    LocalStore store(":memory:");

    auto result = store.transaction([&]() -> Result<void> {
        auto a = store.put_setting("a", "1");
        if (a.is_error()) {
            return a;
        }
        return store.put_setting("b", "2");
    });
    ASSERT_TRUE(result.is_ok()) << result.error();

    EXPECT_EQ(store.get_setting("a").value().value_or(""), "1");
    EXPECT_EQ(store.get_setting("b").value().value_or(""), "2");
}

TEST(LocalStoreTest, PutSettingOverwrites) {
    LocalStore store(":memory:");

    ASSERT_TRUE(store.put_setting("last_sync", "1").is_ok());
    ASSERT_TRUE(store.put_setting("last_sync", "2").is_ok());

    EXPECT_EQ(store.get_setting("last_sync").value().value_or(""), "2");
}

TEST(LocalStoreTest, SizeLimitTurnsFullDatabaseIntoQuota) {
    LocalStore store(":memory:");

    auto used = store.storage_bytes();
    ASSERT_TRUE(used.is_ok());
    EXPECT_GT(used.value(), 0u);

    ASSERT_TRUE(store.set_size_limit(used.value()).is_ok());

    std::string big(256 * 1024, 'x');
    auto result = store.execute("INSERT INTO cache(key, data, timestamp) VALUES(?, ?, ?)",
                                {std::string("big"), Blob{big}, std::int64_t{0}});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Quota);
}
