#pragma once

#include <string>

// Where the Redis store lives. Defaults match a local redis-server.
struct StoreConfig {
    std::string host = "127.0.0.1";
    int port = 6379;
    int db = 0;

    // Sent with AUTH when non-empty.
    std::string password;

    /**
     * Reads CALLCACHE_REDIS_HOST, CALLCACHE_REDIS_PORT, CALLCACHE_REDIS_DB
     * and CALLCACHE_REDIS_PASSWORD, keeping defaults for unset variables.
     * Throws std::invalid_argument on a malformed port or db.
     */
    static StoreConfig fromEnvironment();

    static int parsePort(const std::string& s);
    static int parseDb(const std::string& s);
};
