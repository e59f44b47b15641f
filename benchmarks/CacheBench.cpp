#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "../src/cache/Cache.hpp"
#include "../src/cache/CallRecorder.hpp"
#include "../src/client/RedisConnection.hpp"
#include "../src/client/StoreConfig.hpp"
#include "../src/db/MemoryStore.hpp"
#include "../src/types/CacheErrors.hpp"

struct BenchmarkResult {
    std::string name;
    size_t operations;
    double duration_ms;
};

BenchmarkResult benchStoreGet(StoreHandle& store, const std::string& label, size_t iterations) {
    Cache cache(store);

    auto start = std::chrono::steady_clock::now();
    for (size_t i = 0; i < iterations; ++i) {
        std::string key = cache.store("value:" + std::to_string(i));
        cache.getStr(key);
    }
    auto end = std::chrono::steady_clock::now();

    double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return {label + " store+getStr", iterations * 2, duration_ms};
}

BenchmarkResult benchConcurrentStore(StoreHandle& store, const std::string& label,
                                     size_t iterations, int threads) {
    Cache cache(store);

    auto start = std::chrono::steady_clock::now();
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&cache, iterations, threads] {
            for (size_t i = 0; i < iterations / threads; ++i)
                cache.store(static_cast<long long>(i));
        });
    }
    for (auto& w : workers) w.join();
    auto end = std::chrono::steady_clock::now();

    long long counted = readHistory(store, Cache::kStoreOperation).calls;
    if (counted != static_cast<long long>(iterations / threads * threads))
        std::cerr << "counter drift: " << counted << " calls recorded\n";

    double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return {label + " store x" + std::to_string(threads) + " threads",
            static_cast<size_t>(counted), duration_ms};
}

BenchmarkResult benchReplayRead(StoreHandle& store, const std::string& label, size_t iterations) {
    Cache cache(store);
    for (size_t i = 0; i < iterations; ++i)
        cache.store(static_cast<long long>(i));

    auto start = std::chrono::steady_clock::now();
    CallHistory history = readHistory(store, Cache::kStoreOperation);
    auto end = std::chrono::steady_clock::now();

    double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return {label + " read history", history.inputs.size() + history.outputs.size(), duration_ms};
}

void run(StoreHandle& store, const std::string& label, size_t iterations,
         std::vector<BenchmarkResult>& results) {
    results.push_back(benchStoreGet(store, label, iterations));
    results.push_back(benchConcurrentStore(store, label, iterations, 4));
    results.push_back(benchReplayRead(store, label, iterations));
}

int main() {
    const size_t iterations = 5000;
    std::vector<BenchmarkResult> results;

    MemoryStore memory;
    run(memory, "memory", iterations, results);

    // A live Redis is only measured when configured explicitly.
    if (std::getenv("CALLCACHE_REDIS_HOST")) {
        try {
            RedisConnection redis(StoreConfig::fromEnvironment());
            run(redis, "redis", iterations / 10, results);
        } catch (const CacheError& e) {
            std::cerr << "skipping redis benchmarks: " << e.what() << "\n";
        }
    }

    std::cout << std::left << std::setw(36) << "Benchmark"
              << std::right << std::setw(12) << "Ops"
              << std::setw(14) << "Time (ms)"
              << std::setw(16) << "Ops/sec" << "\n";

    for (const auto& r : results) {
        double ops_per_sec = r.duration_ms > 0 ? (r.operations * 1000.0) / r.duration_ms : 0.0;
        std::cout << std::left << std::setw(36) << r.name
                  << std::right << std::setw(12) << r.operations
                  << std::setw(14) << std::fixed << std::setprecision(2) << r.duration_ms
                  << std::setw(16) << std::fixed << std::setprecision(0) << ops_per_sec
                  << "\n";
    }

    return 0;
}
