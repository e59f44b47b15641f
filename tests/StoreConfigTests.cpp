#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

#include "../src/client/StoreConfig.hpp"

class StoreConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        unsetenv("CALLCACHE_REDIS_HOST");
        unsetenv("CALLCACHE_REDIS_PORT");
        unsetenv("CALLCACHE_REDIS_DB");
        unsetenv("CALLCACHE_REDIS_PASSWORD");
    }
};

TEST_F(StoreConfigTest, DefaultsPointAtLocalRedis) {
    StoreConfig config = StoreConfig::fromEnvironment();
    EXPECT_EQ("127.0.0.1", config.host);
    EXPECT_EQ(6379, config.port);
    EXPECT_EQ(0, config.db);
    EXPECT_TRUE(config.password.empty());
}

TEST_F(StoreConfigTest, EnvironmentOverridesDefaults) {
    setenv("CALLCACHE_REDIS_HOST", "redis.internal", 1);
    setenv("CALLCACHE_REDIS_PORT", "6380", 1);
    setenv("CALLCACHE_REDIS_DB", "2", 1);
    setenv("CALLCACHE_REDIS_PASSWORD", "hunter2", 1);

    StoreConfig config = StoreConfig::fromEnvironment();
    EXPECT_EQ("redis.internal", config.host);
    EXPECT_EQ(6380, config.port);
    EXPECT_EQ(2, config.db);
    EXPECT_EQ("hunter2", config.password);
}

TEST_F(StoreConfigTest, EmptyVariablesKeepDefaults) {
    setenv("CALLCACHE_REDIS_HOST", "", 1);
    setenv("CALLCACHE_REDIS_PORT", "", 1);

    StoreConfig config = StoreConfig::fromEnvironment();
    EXPECT_EQ("127.0.0.1", config.host);
    EXPECT_EQ(6379, config.port);
}

TEST_F(StoreConfigTest, MalformedNumbersAreRejected) {
    setenv("CALLCACHE_REDIS_PORT", "63x9", 1);
    EXPECT_THROW(StoreConfig::fromEnvironment(), std::invalid_argument);

    setenv("CALLCACHE_REDIS_PORT", "70000", 1);
    EXPECT_THROW(StoreConfig::fromEnvironment(), std::invalid_argument);

    unsetenv("CALLCACHE_REDIS_PORT");
    setenv("CALLCACHE_REDIS_DB", "-1", 1);
    EXPECT_THROW(StoreConfig::fromEnvironment(), std::invalid_argument);
}

TEST(StoreConfigParseTest, ParsePortBounds) {
    EXPECT_EQ(1, StoreConfig::parsePort("1"));
    EXPECT_EQ(65535, StoreConfig::parsePort("65535"));
    EXPECT_THROW(StoreConfig::parsePort("0"), std::invalid_argument);
    EXPECT_THROW(StoreConfig::parsePort(""), std::invalid_argument);
    EXPECT_THROW(StoreConfig::parsePort("99999999999999999999"), std::invalid_argument);
}
