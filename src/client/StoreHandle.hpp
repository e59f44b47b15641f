#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * StoreHandle
 * -----------
 * The primitive commands Cache needs from a key-value store.
 * Every method is one atomic store command; nothing here groups
 * several commands together.
 *
 * Failures are reported as StoreError, transport failures and use of
 * a closed handle as ConnectionError.
 */
class StoreHandle {
public:
    virtual ~StoreHandle() = default;

    /** Connected capability: false once the handle can no longer serve commands. */
    virtual bool connected() const = 0;

    // SET key value
    virtual void set(const std::string& key, const std::string& value) = 0;

    // GET key, nullopt when the key does not exist
    virtual std::optional<std::string> get(const std::string& key) = 0;

    // INCR key, absent key counts as 0
    virtual long long incr(const std::string& key) = 0;

    // EXISTS key
    virtual bool exists(const std::string& key) = 0;

    // RPUSH key value, returns the new list length
    virtual long long rpush(const std::string& key, const std::string& value) = 0;

    // LRANGE key start stop, negative indices count from the tail
    virtual std::vector<std::string> lrange(const std::string& key,
                                            long long start, long long stop) = 0;

    // FLUSHDB SYNC
    virtual void flushdb() = 0;
};
