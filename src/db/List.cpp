#include "List.hpp"

long long List::Len() const {
    return static_cast<long long>(list.size());
}

long long List::PushBack(std::string element) {
    list.push_back(std::move(element));
    return Len();
}

std::vector<std::string> List::GetElementsInRange(long long start, long long end) const {
    long long len = Len();
    if (len == 0) return {};

    if (start < 0) start = len + start;
    if (end < 0) end = len + end;
    
    if (start < 0) start = 0;

    if (start >= len) return {};

    if (end >= len) end = len - 1;

    if (start > end) return {};

    std::vector<std::string> result;
    result.reserve(end - start + 1);

    for (long long i = start; i <= end; i++) {
        result.push_back(list[i]);
    }

    return result;
}
