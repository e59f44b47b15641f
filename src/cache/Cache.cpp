#include "Cache.hpp"

#include "Conversions.hpp"
#include "../types/CacheErrors.hpp"
#include "../utils/repr.hpp"
#include "../utils/uuid.hpp"

namespace {

const std::string& requirePresent(const std::optional<std::string>& raw, const std::string& key) {
    if (!raw)
        throw MissingValueError("no value stored under '" + key + "'");
    return *raw;
}

} // namespace

Cache::Cache(StoreHandle& store)
    : db(store),
      storeCalls(store, kStoreOperation)
{
    db.flushdb();
}

std::string Cache::store(const Scalar& data) {
    return storeCalls.invoke(argsRepr({data}), [&] {
        std::string key = uuid_v4();
        db.set(key, encodeScalar(data));
        return key;
    });
}

std::optional<std::string> Cache::get(const std::string& key) const {
    return db.get(key);
}

std::string Cache::getStr(const std::string& key) const {
    return get<std::string>(key, [&key](const std::optional<std::string>& raw) {
        return decodeUtf8(requirePresent(raw, key));
    });
}

long long Cache::getInt(const std::string& key) const {
    return get<long long>(key, [&key](const std::optional<std::string>& raw) {
        return parseInteger(requirePresent(raw, key));
    });
}

BoundOperation Cache::storeOperation() const {
    return BoundOperation{this, kStoreOperation};
}
