#include "ofs/core/config.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>

using ofs::EngineConfig;
using ofs::ErrorKind;
using ofs::Millis;

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    EngineConfig config;

    EXPECT_EQ(config.cache.default_ttl, Millis(24 * 60 * 60 * 1000));
    EXPECT_EQ(config.cache.max_entries, 1000u);
    EXPECT_EQ(config.upload.max_concurrent, 3u);
    EXPECT_EQ(config.upload.chunk_size, 2u * 1024 * 1024);
    EXPECT_EQ(config.sync.max_retries, 3u);
    EXPECT_EQ(config.upload.max_retries, 3u);
    EXPECT_EQ(config.sync.conflict_resolution, ofs::sync::ConflictPolicy::Manual);
    EXPECT_EQ(config.sync.auto_sync_interval, Millis(30'000));
    EXPECT_EQ(config.network.request_timeout, Millis(30'000));
    EXPECT_EQ(config.offline.max_storage_bytes, 500ull * 1024 * 1024);
}

TEST(ConfigTest, MissingKeysKeepDefaults) {
    auto result = ofs::parse_config(R"({"upload": {"max_concurrent": 5}})");
    ASSERT_TRUE(result.is_ok()) << result.error();

    EXPECT_EQ(result.value().upload.max_concurrent, 5u);
    EXPECT_EQ(result.value().upload.chunk_size, 2u * 1024 * 1024);
    EXPECT_EQ(result.value().cache.max_entries, 1000u);
}

TEST(ConfigTest, ParsesDurationsAndPolicy) {
    auto result = ofs::parse_config(R"({
        "cache": {"default_ttl_ms": 600000},
        "sync": {"conflict_resolution": "remote_wins", "reconnect_delay_ms": 250}
    })");
    ASSERT_TRUE(result.is_ok()) << result.error();

    EXPECT_EQ(result.value().cache.default_ttl, Millis(600'000));
    EXPECT_EQ(result.value().sync.conflict_resolution, ofs::sync::ConflictPolicy::RemoteWins);
    EXPECT_EQ(result.value().sync.reconnect_delay, Millis(250));
}

TEST(ConfigTest, WrongTypeIsValidationError) {
    auto result = ofs::parse_config(R"({"upload": {"max_concurrent": "three"}})");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Validation);
}

TEST(ConfigTest, NonObjectSectionIsValidationError) {
    auto result = ofs::parse_config(R"({"cache": 5})");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Validation);
}

TEST(ConfigTest, UnknownPolicyRejected) {
    auto result = ofs::parse_config(R"({"sync": {"conflict_resolution": "newest"}})");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Validation);
}

TEST(ConfigTest, ZeroConcurrencyRejected) {
    auto result = ofs::parse_config(R"({"upload": {"max_concurrent": 0}})");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Validation);
}

TEST(ConfigTest, MalformedJsonRejected) {
    auto result = ofs::parse_config("{not json");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Validation);
}

TEST(ConfigTest, MissingFileIsNotFound) {
    auto result = ofs::load_config("/nonexistent/ofs-config.json");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
}

TEST(ConfigTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "ofs_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"storage": {"database_path": ":memory:"}, "logging": {"level": "debug"}})";
    }

    auto result = ofs::load_config(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(result.value().storage.database_path, ":memory:");
    EXPECT_EQ(result.value().logging.level, "debug");
}

TEST(ConfigTest, RenderedConfigParsesBack) {
    EngineConfig config;
    config.upload.max_concurrent = 7;
    config.sync.conflict_resolution = ofs::sync::ConflictPolicy::Merge;

    auto parsed = ofs::parse_config(ofs::config_to_json(config));
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    EXPECT_EQ(parsed.value().upload.max_concurrent, 7u);
    EXPECT_EQ(parsed.value().sync.conflict_resolution, ofs::sync::ConflictPolicy::Merge);
}
