#pragma once

#include <string>
#include <vector>

#include "../types/Scalar.hpp"

/**
 * Text forms of Scalar values.
 *
 *   encodeScalar  - the bytes written to the store by Cache::store
 *   scalarRepr    - display form of one value: 'foo', b'\x00', 123, 3.5
 *   argsRepr      - display form of an argument tuple: ('foo',), (1, 2)
 */
std::string encodeScalar(const Scalar& value);
std::string scalarRepr(const Scalar& value);
std::string argsRepr(const std::vector<Scalar>& args);

// Shortest text that reads back as the same double: 1.0, 0.1, 1e+16, 1e-05, inf, nan
std::string formatReal(double d);

// Quoted, escaped form of text or bytes. Bytes get a b prefix and \xNN for >= 0x80;
// text keeps printable code points and escapes the rest as \xNN, \uNNNN or \UNNNNNNNN.
std::string quoteText(const std::string& s, bool asBytes);

// True when `s` is well-formed UTF-8.
bool isValidUtf8(const std::string& s);
