#pragma once

#include <algorithm>
#include <array>
#include <functional>
#include <random>
#include <string>

#include <uuid.h>

// Random (version 4) UUID in its canonical 36 character form.
// Each thread draws from its own engine.
inline std::string uuid_v4() {
    thread_local std::mt19937 generator = [] {
        std::random_device rd;
        std::array<std::random_device::result_type, std::mt19937::state_size> seed{};
        std::generate(seed.begin(), seed.end(), std::ref(rd));
        std::seed_seq seq(seed.begin(), seed.end());
        return std::mt19937(seq);
    }();
    thread_local uuids::uuid_random_generator uuidGen{generator};
    return uuids::to_string(uuidGen());
}
