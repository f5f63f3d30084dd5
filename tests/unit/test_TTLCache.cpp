#include <gtest/gtest.h>
#include "cache/TTLCache.hpp"
#include "support/ManualClock.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace lv::cache;
using namespace std::chrono_literals;

class TTLCacheTest : public ::testing::Test {
protected:
    lv::test::ManualClock clock;
    TTLCache cache{10min, clock};
};

TEST_F(TTLCacheTest, MissingKeyIsAbsent) {
    EXPECT_FALSE(cache.get<std::string>("nope").has_value());
    EXPECT_FALSE(cache.contains("nope"));
}

TEST_F(TTLCacheTest, SetThenGetWithinTtl) {
    cache.set<std::string>("k", "v");
    clock.advance(9min);
    ASSERT_TRUE(cache.get<std::string>("k").has_value());
    EXPECT_EQ(*cache.get<std::string>("k"), "v");
}

TEST_F(TTLCacheTest, ExpiredEntryIsPurgedOnRead) {
    cache.set<int>("k", 42, 1s);
    EXPECT_EQ(cache.size(), 1u);
    clock.advance(1s);
    EXPECT_FALSE(cache.get<int>("k").has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(TTLCacheTest, SetReplacesValueAndExpiry) {
    cache.set<int>("k", 1, 1s);
    cache.set<int>("k", 2, 1h);
    clock.advance(30min);
    EXPECT_EQ(cache.get<int>("k").value_or(0), 2);
}

TEST_F(TTLCacheTest, WrongTypeReadsAsMiss) {
    cache.set<int>("k", 7);
    EXPECT_FALSE(cache.get<std::string>("k").has_value());
    EXPECT_TRUE(cache.contains("k"));
}

TEST_F(TTLCacheTest, InvalidateRemovesOneKey) {
    cache.set<int>("a", 1);
    cache.set<int>("b", 2);
    cache.invalidate("a");
    EXPECT_FALSE(cache.contains("a"));
    EXPECT_TRUE(cache.contains("b"));
}

TEST_F(TTLCacheTest, InvalidatePrefixLeavesOtherKeys) {
    cache.set<int>("secretvalue:kv/one:a", 1);
    cache.set<int>("secretvalue:kv/one:b", 2);
    cache.set<int>("secretvalue:kv/one-two:a", 3);
    cache.set<int>("secrets:kv/one", 4);

    cache.invalidatePrefix("secretvalue:kv/one:");

    EXPECT_FALSE(cache.contains("secretvalue:kv/one:a"));
    EXPECT_FALSE(cache.contains("secretvalue:kv/one:b"));
    EXPECT_TRUE(cache.contains("secretvalue:kv/one-two:a"));
    EXPECT_TRUE(cache.contains("secrets:kv/one"));
}

TEST_F(TTLCacheTest, ClearEmptiesEverything) {
    cache.set<int>("a", 1);
    cache.set<int>("b", 2);
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(TTLCacheTest, ConcurrentWritersAndReaders) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < 500; ++i) {
                const auto key = "k" + std::to_string(i % 20);
                cache.set<std::vector<int>>(key, std::vector<int>(5, t));
                if (const auto v = cache.get<std::vector<int>>(key)) {
                    // a reader never sees a half-written vector
                    ASSERT_EQ(v->size(), 5u);
                    for (const int x : *v) ASSERT_EQ(x, v->front());
                }
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(cache.size(), 20u);
}
