#pragma once

#include <deque>
#include <string>
#include <vector>

// Append-only list value held by MemoryStore.
class List {
private:
    std::deque<std::string> list;
public:
    long long PushBack(std::string element);

    // Inclusive range with Redis LRANGE index rules.
    std::vector<std::string> GetElementsInRange(long long start, long long end) const;

    long long Len() const;
};
