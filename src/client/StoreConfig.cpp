#include "StoreConfig.hpp"

#include <cstdlib>
#include <stdexcept>

namespace {

int parseBounded(const std::string& s, const char* what, long lo, long hi) {
    size_t used = 0;
    long value = 0;
    try {
        value = std::stol(s, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("invalid ") + what + ": '" + s + "'");
    }

    if (used != s.size() || value < lo || value > hi)
        throw std::invalid_argument(std::string("invalid ") + what + ": '" + s + "'");

    return static_cast<int>(value);
}

} // namespace

int StoreConfig::parsePort(const std::string& s) {
    return parseBounded(s, "port", 1, 65535);
}

int StoreConfig::parseDb(const std::string& s) {
    return parseBounded(s, "db index", 0, 1 << 20);
}

StoreConfig StoreConfig::fromEnvironment() {
    StoreConfig config;

    if (const char* host = std::getenv("CALLCACHE_REDIS_HOST"); host && *host)
        config.host = host;

    if (const char* port = std::getenv("CALLCACHE_REDIS_PORT"); port && *port)
        config.port = parsePort(port);

    if (const char* db = std::getenv("CALLCACHE_REDIS_DB"); db && *db)
        config.db = parseDb(db);

    if (const char* password = std::getenv("CALLCACHE_REDIS_PASSWORD"))
        config.password = password;

    return config;
}
