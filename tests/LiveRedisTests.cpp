#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "../src/cache/Cache.hpp"
#include "../src/cache/Replay.hpp"
#include "../src/client/RedisConnection.hpp"
#include "../src/client/StoreConfig.hpp"
#include "../src/types/CacheErrors.hpp"

// Runs against a real Redis when CALLCACHE_REDIS_HOST is set.
// These tests FLUSHDB the configured database.
class LiveRedisTest : public ::testing::Test {
protected:
    StoreConfig config;
    std::unique_ptr<RedisConnection> conn;

    void SetUp() override {
        const char* host = std::getenv("CALLCACHE_REDIS_HOST");
        if (!host || !*host)
            GTEST_SKIP() << "CALLCACHE_REDIS_HOST not set";

        config = StoreConfig::fromEnvironment();
        try {
            conn = std::make_unique<RedisConnection>(config);
        } catch (const ConnectionError& e) {
            GTEST_SKIP() << "redis unreachable: " << e.what();
        }
    }
};

TEST_F(LiveRedisTest, ConcreteScenarioAndReplay) {
    Cache cache(*conn);

    std::string id1 = cache.store("foo");
    EXPECT_EQ("foo", cache.getStr(id1));

    std::string id2 = cache.store(123);
    EXPECT_EQ(123, cache.getInt(id2));

    EXPECT_FALSE(cache.get("absent-key").has_value());
    EXPECT_THROW(cache.getInt(id1), FormatError);

    CallHistory history = readHistory(*conn, Cache::kStoreOperation);
    EXPECT_EQ(2, history.calls);
    EXPECT_EQ((std::vector<std::string>{"('foo',)", "(123,)"}), history.inputs);
    EXPECT_EQ((std::vector<std::string>{id1, id2}), history.outputs);

    std::ostringstream out;
    replay(cache.storeOperation(), out);
    EXPECT_EQ("Cache.store was called 2 times:\n"
              "Cache.store(*('foo',)) -> b'" + id1 + "'\n"
              "Cache.store(*(123,)) -> b'" + id2 + "'\n",
              out.str());
}

TEST_F(LiveRedisTest, BinaryValuesSurviveTheWire) {
    Cache cache(*conn);
    std::string raw("\x00\r\n\xff", 4);
    EXPECT_EQ(raw, cache.get(cache.store(Scalar::bytes(raw))).value());
}

TEST_F(LiveRedisTest, WrongTypeSurfacesAsStoreError) {
    Cache cache(*conn);
    conn->rpush("a-list", "x");
    EXPECT_THROW(conn->incr("a-list"), StoreError);
    EXPECT_TRUE(conn->connected());
}

// Concurrent callers share one connection. INCR is atomic on the server,
// so the counter is exact; history entries of different callers may
// interleave, which is a known limitation of the write path.
TEST_F(LiveRedisTest, ConcurrentStoresKeepCounterExact) {
    Cache cache(*conn);
    const int threads = 4;
    const int perThread = 50;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; t++) {
        workers.emplace_back([&cache, t] {
            for (int i = 0; i < perThread; i++)
                cache.store(t * perThread + i);
        });
    }
    for (auto& w : workers) w.join();

    CallHistory history = readHistory(*conn, Cache::kStoreOperation);
    EXPECT_EQ(threads * perThread, history.calls);
    EXPECT_EQ(static_cast<size_t>(threads * perThread), history.outputs.size());
}
