#include "ofs/cache/ttl_cache.hpp"
#include "ofs/events/events.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace ofs;
using namespace ofs::cache;
using namespace std::chrono_literals;

namespace {

class TtlCacheTest : public ::testing::Test {
protected:
    TtlCache make_cache(std::size_t max_entries = 1000) {
        CacheConfig config;
        config.default_ttl = Millis{60'000};
        config.max_entries = max_entries;
        return TtlCache(store, bus, config, clock);
    }

    store::LocalStore store{":memory:"};
    events::EventBus bus;
    ManualClock clock;
};

Result<std::string> remote_ok(const std::string& payload) {
    return Ok(payload);
}

} // namespace

TEST(CacheKeys, FingerprintIgnoresParameterOrder) {
    EXPECT_EQ(fingerprint("/posts", R"({"page":1,"size":10})"),
              fingerprint("/posts", R"({"size":10,"page":1})"));
    EXPECT_NE(fingerprint("/posts", R"({"page":1})"), fingerprint("/posts", R"({"page":2})"));
}

TEST(CacheKeys, FingerprintWithoutParameters) {
    EXPECT_EQ(fingerprint("/posts"), "/posts_{}");
}

TEST(CacheKeys, FingerprintKeepsUnparseableParameters) {
    EXPECT_EQ(fingerprint("/posts", "page=1"), "/posts_page=1");
}

TEST(CacheKeys, EntityKey) {
    EXPECT_EQ(entity_key("draft", "42"), "draft:42");
}

TEST_F(TtlCacheTest, SetThenGet) {
    auto cache = make_cache();
    ASSERT_TRUE(cache.set("posts_p1", R"({"a":1})", Millis{600'000}).is_ok());

    auto hit = cache.get("posts_p1");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, R"({"a":1})");
}

TEST_F(TtlCacheTest, MissingKeyIsAbsent) {
    auto cache = make_cache();
    EXPECT_FALSE(cache.get("nothing").has_value());
    EXPECT_FALSE(cache.get_stale("nothing").has_value());
}

TEST_F(TtlCacheTest, ExpiredEntryIsAbsentButStaleReadable) {
    auto cache = make_cache();
    ASSERT_TRUE(cache.set("k", "v", Millis{1000}).is_ok());

    clock.advance(999ms);
    EXPECT_TRUE(cache.get("k").has_value());

    clock.advance(1ms);
    EXPECT_FALSE(cache.get("k").has_value());

    auto stale = cache.get_stale("k");
    ASSERT_TRUE(stale.has_value());
    EXPECT_EQ(stale->payload, "v");
}

TEST_F(TtlCacheTest, NonPositiveTtlNeverExpires) {
    auto cache = make_cache();
    ASSERT_TRUE(cache.set("forever", "v", Millis{0}).is_ok());

    clock.advance(std::chrono::hours(24 * 365));
    EXPECT_TRUE(cache.get("forever").has_value());
}

TEST_F(TtlCacheTest, EntriesSurviveANewCacheInstance) {
    {
        auto cache = make_cache();
        ASSERT_TRUE(cache.set("k", "persisted").is_ok());
    }
    auto reopened = make_cache();
    auto hit = reopened.get("k");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, "persisted");
}

TEST_F(TtlCacheTest, FetchServesFreshEntryWithoutCallingRemote) {
    auto cache = make_cache();
    ASSERT_TRUE(cache.set("k", "cached").is_ok());

    int calls = 0;
    auto result = cache.fetch_with_cache([&]() { ++calls; return remote_ok("remote"); }, "k");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(result.value().payload, "cached");
    EXPECT_TRUE(result.value().from_cache);
    EXPECT_FALSE(result.value().stale);
}

TEST_F(TtlCacheTest, FetchStoresRemoteResult) {
    auto cache = make_cache();

    auto result = cache.fetch_with_cache([]() { return remote_ok("remote"); }, "k");
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().from_cache);
    EXPECT_EQ(result.value().payload, "remote");
    EXPECT_EQ(cache.get("k").value_or(""), "remote");
}

TEST_F(TtlCacheTest, ForceRefreshBypassesFreshEntry) {
    auto cache = make_cache();
    ASSERT_TRUE(cache.set("k", "old").is_ok());

    FetchOptions options;
    options.force_refresh = true;
    auto result = cache.fetch_with_cache([]() { return remote_ok("new"); }, "k", options);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().payload, "new");
    EXPECT_EQ(cache.get("k").value_or(""), "new");
}

TEST_F(TtlCacheTest, RemoteFailureFallsBackToStaleEntry) {
    auto cache = make_cache();
    ASSERT_TRUE(cache.set("k", "old", Millis{1000}).is_ok());
    clock.advance(5s);

    std::vector<events::StaleDataServedEvent> notices;
    bus.subscribe<events::StaleDataServedEvent>([&](const events::StaleDataServedEvent& e) {
        notices.push_back(e);
    });

    auto result = cache.fetch_with_cache(
        []() { return Fail<std::string>(ErrorKind::Network, "connection refused"); }, "k");

    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(result.value().payload, "old");
    EXPECT_TRUE(result.value().stale);
    EXPECT_TRUE(result.value().from_cache);

    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].key, "k");
    EXPECT_EQ(notices[0].cause.kind, ErrorKind::Network);
}

TEST_F(TtlCacheTest, StaleNoticeCanBeSuppressed) {
    auto cache = make_cache();
    ASSERT_TRUE(cache.set("k", "old").is_ok());

    int notices = 0;
    bus.subscribe<events::StaleDataServedEvent>([&](const events::StaleDataServedEvent&) { ++notices; });

    FetchOptions options;
    options.force_refresh = true;
    options.show_stale_notice = false;
    auto result = cache.fetch_with_cache(
        []() { return Fail<std::string>(ErrorKind::Timeout, "slow"); }, "k", options);

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().stale);
    EXPECT_EQ(notices, 0);
}

TEST_F(TtlCacheTest, RemoteFailureWithoutEntryReturnsError) {
    auto cache = make_cache();

    auto result = cache.fetch_with_cache(
        []() { return Fail<std::string>(ErrorKind::Network, "down"); }, "k");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Network);
}

TEST_F(TtlCacheTest, FetchRetriesTransientFailures) {
    auto cache = make_cache();

    int calls = 0;
    FetchOptions options;
    options.retry = RetryPolicy{3, Millis{1}, Millis{5}, 2.0};
    auto result = cache.fetch_with_cache(
        [&]() -> Result<std::string> {
            if (++calls < 3) {
                return Fail<std::string>(ErrorKind::Timeout, "slow");
            }
            return Ok(std::string("third time"));
        },
        "k", options);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(result.value().payload, "third time");
}

TEST_F(TtlCacheTest, InvalidateAndClear) {
    auto cache = make_cache();
    ASSERT_TRUE(cache.set("a", "1").is_ok());
    ASSERT_TRUE(cache.set("b", "2").is_ok());

    ASSERT_TRUE(cache.invalidate("a").is_ok());
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_FALSE(cache.get_stale("a").has_value());
    EXPECT_TRUE(cache.get("b").has_value());

    ASSERT_TRUE(cache.clear().is_ok());
    EXPECT_FALSE(cache.get("b").has_value());
    EXPECT_EQ(cache.stats().value().total_items, 0u);
}

TEST_F(TtlCacheTest, PurgeExpiredRemovesOnlyExpiredRows) {
    auto cache = make_cache();
    ASSERT_TRUE(cache.set("short", "v", Millis{1000}).is_ok());
    ASSERT_TRUE(cache.set("long", "v", Millis{100'000}).is_ok());
    ASSERT_TRUE(cache.set("forever", "v", Millis{0}).is_ok());

    clock.advance(2s);
    auto purged = cache.purge_expired();
    ASSERT_TRUE(purged.is_ok());
    EXPECT_EQ(purged.value(), 1u);

    EXPECT_FALSE(cache.get_stale("short").has_value());
    EXPECT_TRUE(cache.get("long").has_value());
    EXPECT_TRUE(cache.get("forever").has_value());
}

TEST_F(TtlCacheTest, EvictsOldestBeyondMaxEntries) {
    auto cache = make_cache(3);
    for (const char* key : {"k1", "k2", "k3", "k4"}) {
        ASSERT_TRUE(cache.set(key, "v").is_ok());
        clock.advance(10ms);
    }

    EXPECT_EQ(cache.stats().value().total_items, 3u);
    EXPECT_FALSE(cache.get("k1").has_value());
    EXPECT_TRUE(cache.get("k4").has_value());
}

TEST_F(TtlCacheTest, FullStoreEvictsOldestEntriesToFitNewWrite) {
    ASSERT_TRUE(store.set_size_limit(256 * 1024).is_ok());
    auto cache = make_cache(40);
    const std::string payload(16 * 1024, 'p');

    for (int i = 0; i < 30; ++i) {
        auto written = cache.set("k" + std::to_string(i), payload);
        ASSERT_TRUE(written.is_ok()) << "write " << i << ": " << written.error();
        clock.advance(1s);
    }

    auto stats = cache.stats().value();
    EXPECT_LT(stats.total_items, 30u);
    EXPECT_GT(stats.total_items, 0u);
    EXPECT_FALSE(cache.get_stale("k0").has_value());
    EXPECT_EQ(cache.get("k29").value_or(""), payload);
}

TEST_F(TtlCacheTest, WriteThatCannotFitAfterEvictionReportsQuota) {
    ASSERT_TRUE(store.set_size_limit(64 * 1024).is_ok());
    auto cache = make_cache();
    ASSERT_TRUE(cache.set("small", "v").is_ok());
    clock.advance(1s);

    auto written = cache.set("huge", std::string(128 * 1024, 'h'));
    ASSERT_TRUE(written.is_error());
    EXPECT_EQ(written.error().kind, ErrorKind::Quota);

    // The eviction pass ran before the final attempt
    EXPECT_FALSE(cache.get_stale("small").has_value());
    EXPECT_FALSE(cache.get_stale("huge").has_value());
    EXPECT_EQ(cache.stats().value().total_items, 0u);
}

TEST_F(TtlCacheTest, ReclaimSpacePurgesExpiredThenOldest) {
    auto cache = make_cache(20);
    ASSERT_TRUE(cache.set("expired", "v", Millis{10}).is_ok());
    for (int i = 0; i < 5; ++i) {
        clock.advance(1s);
        ASSERT_TRUE(cache.set("k" + std::to_string(i), "v").is_ok());
    }

    auto freed = cache.reclaim_space("k0");
    ASSERT_TRUE(freed.is_ok()) << freed.error();
    // One expired row plus a batch of max_entries / 10 = 2 oldest, sparing k0
    EXPECT_EQ(freed.value(), 3u);
    EXPECT_TRUE(cache.get("k0").has_value());
    EXPECT_FALSE(cache.get_stale("k1").has_value());
    EXPECT_FALSE(cache.get_stale("k2").has_value());
    EXPECT_TRUE(cache.get("k3").has_value());
}

TEST_F(TtlCacheTest, StatsReportsOldestAndNewest) {
    auto cache = make_cache();
    auto first = clock.now();
    ASSERT_TRUE(cache.set("a", "1").is_ok());
    clock.advance(5s);
    ASSERT_TRUE(cache.set("b", "2").is_ok());

    auto stats = cache.stats();
    ASSERT_TRUE(stats.is_ok());
    EXPECT_EQ(stats.value().total_items, 2u);
    ASSERT_TRUE(stats.value().oldest.has_value());
    EXPECT_EQ(to_epoch_ms(*stats.value().oldest), to_epoch_ms(first));
    EXPECT_EQ(to_epoch_ms(*stats.value().newest), to_epoch_ms(first + 5s));
}

TEST_F(TtlCacheTest, CountsByPrefixAndEntityType) {
    auto cache = make_cache();
    ASSERT_TRUE(cache.set(entity_key("draft", "1"), "{}").is_ok());
    ASSERT_TRUE(cache.set(entity_key("draft", "2"), "{}").is_ok());
    ASSERT_TRUE(cache.set(entity_key("post", "9"), "{}").is_ok());
    ASSERT_TRUE(cache.set(fingerprint("/posts"), "[]").is_ok());

    EXPECT_EQ(cache.count_with_prefix("draft:").value(), 2u);
    EXPECT_EQ(cache.count_with_prefix("/posts").value(), 1u);

    auto counts = cache.count_by_entity_type();
    ASSERT_TRUE(counts.is_ok());
    ASSERT_EQ(counts.value().size(), 2u);
    EXPECT_EQ(counts.value().at("draft"), 2u);
    EXPECT_EQ(counts.value().at("post"), 1u);
}
