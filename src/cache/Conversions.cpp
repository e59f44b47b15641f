#include "Conversions.hpp"

#include <cctype>
#include <charconv>
#include <system_error>

#include "../types/CacheErrors.hpp"
#include "../utils/repr.hpp"

std::string decodeUtf8(const std::string& raw) {
    if (!isValidUtf8(raw))
        throw FormatError("value is not valid UTF-8: " + quoteText(raw, true));
    return raw;
}

long long parseInteger(const std::string& raw) {
    size_t first = 0;
    size_t last = raw.size();
    while (first < last && std::isspace(static_cast<unsigned char>(raw[first]))) first++;
    while (last > first && std::isspace(static_cast<unsigned char>(raw[last - 1]))) last--;

    const char* begin = raw.data() + first;
    const char* end = raw.data() + last;

    // from_chars takes '-' but not '+'
    if (begin != end && *begin == '+') {
        begin++;
        if (begin != end && *begin == '-')
            throw FormatError("invalid literal for integer: " + quoteText(raw, true));
    }

    long long value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);

    if (ec == std::errc::result_out_of_range)
        throw FormatError("integer out of range: " + quoteText(raw, true));
    if (begin == end || ec != std::errc() || ptr != end)
        throw FormatError("invalid literal for integer: " + quoteText(raw, true));

    return value;
}
