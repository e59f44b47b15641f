#pragma once

#include <optional>
#include <string>

// Converters used by Cache::getStr / Cache::getInt.

// Stored bytes as UTF-8 text. Throws FormatError on malformed UTF-8.
std::string decodeUtf8(const std::string& raw);

/**
 * Base-10 integer with optional sign; surrounding ASCII whitespace is ignored.
 * Throws FormatError when the text is not an integer or does not fit 64 bits.
 */
long long parseInteger(const std::string& raw);
