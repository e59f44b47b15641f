#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "cache/Cache.hpp"
#include "cache/Replay.hpp"
#include "client/RedisConnection.hpp"
#include "client/StoreConfig.hpp"
#include "db/MemoryStore.hpp"
#include "types/CacheErrors.hpp"

namespace {

void usage(const char* prog) {
    std::cerr << "usage: " << prog << " [--host H] [--port P] [--db N] [--memory]\n";
}

} // namespace

int main(int argc, char **argv) {
    // Flush after every std::cout / std::cerr
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    StoreConfig config;
    bool inMemory = false;

    try {
        config = StoreConfig::fromEnvironment();

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--memory") {
                inMemory = true;
            } else if ((arg == "--host" || arg == "--port" || arg == "--db") && i + 1 < argc) {
                std::string value = argv[++i];
                if (arg == "--host") config.host = value;
                else if (arg == "--port") config.port = StoreConfig::parsePort(value);
                else config.db = StoreConfig::parseDb(value);
            } else {
                usage(argv[0]);
                return 2;
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    std::unique_ptr<StoreHandle> store;
    try {
        if (inMemory) {
            store = std::make_unique<MemoryStore>();
            std::cout << "Using in-process store\n";
        } else {
            store = std::make_unique<RedisConnection>(config);
            std::cout << "Connected to " << config.host << ":" << config.port
                      << " db " << config.db << "\n";
        }
    } catch (const ConnectionError& e) {
        std::cerr << "Failed to connect: " << e.what() << "\n";
        return 1;
    }

    try {
        Cache cache(*store);

        std::string textKey = cache.store("foo");
        std::cout << textKey << " -> " << cache.getStr(textKey) << "\n";

        std::string intKey = cache.store(123);
        std::cout << intKey << " -> " << cache.getInt(intKey) << "\n";

        std::string realKey = cache.store(3.14);
        std::cout << realKey << " -> " << cache.getStr(realKey) << "\n";

        replay(cache.storeOperation());
    } catch (const CacheError& e) {
        std::cerr << "cache error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
