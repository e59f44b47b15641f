#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>

#include "List.hpp"
#include "../client/StoreHandle.hpp"

enum class RedisType {STRING, LIST};

struct RedisObj {
    RedisType type;
    std::variant<std::string, List> value;
};

/**
 * In-process StoreHandle with Redis semantics for the commands Cache uses:
 * strings, lists, WRONGTYPE checks and INCR's integer rules.
 *
 * Each command runs under one mutex, the same per-command atomicity
 * a Redis server gives.
 */
class MemoryStore : public StoreHandle {
public:
    bool connected() const override;

    void set(const std::string& key, const std::string& value) override;
    std::optional<std::string> get(const std::string& key) override;
    long long incr(const std::string& key) override;
    bool exists(const std::string& key) override;
    long long rpush(const std::string& key, const std::string& value) override;
    std::vector<std::string> lrange(const std::string& key,
                                    long long start, long long stop) override;
    void flushdb() override;

    // Number of keys currently held.
    size_t size() const;

    // Simulates a lost connection: connected() turns false and
    // every later command throws ConnectionError.
    void close();

private:
    std::unordered_map<std::string, RedisObj> data;
    mutable std::mutex mutex;
    std::atomic<bool> open{true};

    // Throws ConnectionError after close().
    void ensureOpen() const;
};
