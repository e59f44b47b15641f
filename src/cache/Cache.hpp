#pragma once

#include <functional>
#include <optional>
#include <string>

#include "CallRecorder.hpp"
#include "../client/StoreHandle.hpp"
#include "../types/Scalar.hpp"

class Cache;

// A Cache operation together with the instance it belongs to.
// Obtained from Cache::storeOperation() and consumed by replay().
struct BoundOperation {
    const Cache* owner = nullptr;
    std::string name;
};

/**
 * Cache
 * -----
 * Stores scalar values under random identifiers in an external store
 * and records how often, and with what, `store` was called.
 *
 * The store handle is owned by the caller and must outlive the Cache.
 * Constructing a Cache flushes the store.
 */
class Cache {
public:
    static constexpr const char* kStoreOperation = "Cache.store";

    // Runs FLUSHDB on `store`. Throws ConnectionError if the store is unreachable.
    explicit Cache(StoreHandle& store);

    /**
     * Writes `data` under a fresh UUID and returns that UUID.
     * Counted and recorded in the call history of "Cache.store".
     */
    std::string store(const Scalar& data);

    // Raw bytes under `key`, nullopt when absent.
    std::optional<std::string> get(const std::string& key) const;

    // Raw lookup passed through `convert`, which also sees the absent case.
    template <typename T>
    T get(const std::string& key,
          const std::function<T(const std::optional<std::string>&)>& convert) const {
        return convert(get(key));
    }

    // UTF-8 text. Throws MissingValueError or FormatError.
    std::string getStr(const std::string& key) const;

    // Base-10 integer. Throws MissingValueError or FormatError.
    long long getInt(const std::string& key) const;

    BoundOperation storeOperation() const;

    StoreHandle& handle() const { return db; }

private:
    StoreHandle& db;
    CallRecorder storeCalls;
};
