#include "MemoryStore.hpp"

#include <charconv>
#include <limits>

#include "../types/CacheErrors.hpp"

namespace {

const char* kWrongType = "WRONGTYPE Operation against a key holding the wrong kind of value";
const char* kNotInteger = "ERR value is not an integer or out of range";

} // namespace

bool MemoryStore::connected() const {
    return open.load();
}

void MemoryStore::close() {
    open.store(false);
}

void MemoryStore::ensureOpen() const {
    if (!open.load())
        throw ConnectionError("store connection is closed");
}

size_t MemoryStore::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return data.size();
}

// ----------------------------------------------------
// STRING: SET key value
// ----------------------------------------------------
void MemoryStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex);
    ensureOpen();

    RedisObj obj;
    obj.type = RedisType::STRING;
    obj.value = value;

    // SET overwrites any previous type
    data[key] = std::move(obj);
}

// ----------------------------------------------------
// STRING: GET key
// ----------------------------------------------------
std::optional<std::string> MemoryStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex);
    ensureOpen();

    auto it = data.find(key);
    if (it == data.end())
        return std::nullopt;

    if (it->second.type != RedisType::STRING)
        throw StoreError(kWrongType);

    return std::get<std::string>(it->second.value);
}

// ----------------------------------------------------
// STRING: INCR key
// Absent keys start at 0, the result is stored back as decimal text.
// ----------------------------------------------------
long long MemoryStore::incr(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex);
    ensureOpen();

    long long value = 0;

    auto it = data.find(key);
    if (it != data.end()) {
        if (it->second.type != RedisType::STRING)
            throw StoreError(kWrongType);

        const std::string& current = std::get<std::string>(it->second.value);
        const char* first = current.data();
        const char* last = first + current.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (current.empty() || ec != std::errc() || ptr != last)
            throw StoreError(kNotInteger);
    }

    if (value == std::numeric_limits<long long>::max())
        throw StoreError("ERR increment or decrement would overflow");
    ++value;

    RedisObj obj;
    obj.type = RedisType::STRING;
    obj.value = std::to_string(value);
    data[key] = std::move(obj);

    return value;
}

bool MemoryStore::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex);
    ensureOpen();
    return data.count(key) > 0;
}

// ----------------------------------------------------
// LIST: RPUSH key value
// ----------------------------------------------------
long long MemoryStore::rpush(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex);
    ensureOpen();

    auto it = data.find(key);
    if (it == data.end()) {
        RedisObj obj;
        obj.type = RedisType::LIST;
        obj.value = List{};
        it = data.emplace(key, std::move(obj)).first;
    } else if (it->second.type != RedisType::LIST) {
        throw StoreError(kWrongType);
    }

    return std::get<List>(it->second.value).PushBack(value);
}

// ----------------------------------------------------
// LIST: LRANGE key start stop
// Missing key reads as an empty list.
// ----------------------------------------------------
std::vector<std::string> MemoryStore::lrange(const std::string& key,
                                             long long start, long long stop) {
    std::lock_guard<std::mutex> lock(mutex);
    ensureOpen();

    auto it = data.find(key);
    if (it == data.end())
        return {};

    if (it->second.type != RedisType::LIST)
        throw StoreError(kWrongType);

    return std::get<List>(it->second.value).GetElementsInRange(start, stop);
}

void MemoryStore::flushdb() {
    std::lock_guard<std::mutex> lock(mutex);
    ensureOpen();
    data.clear();
}
