#pragma once

#include <stdexcept>
#include <string>

class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& msg) : std::runtime_error(msg) {}
};

// A store command failed or the store answered with an error reply.
class StoreError : public CacheError {
public:
    explicit StoreError(const std::string& msg) : CacheError(msg) {}
};

// The store could not be reached, or the connection was lost or closed.
class ConnectionError : public StoreError {
public:
    explicit ConnectionError(const std::string& msg) : StoreError(msg) {}
};

// Stored bytes could not be converted to the requested type.
class FormatError : public CacheError {
public:
    explicit FormatError(const std::string& msg) : CacheError(msg) {}
};

// A typed read was asked for a key that holds nothing.
class MissingValueError : public CacheError {
public:
    explicit MissingValueError(const std::string& msg) : CacheError(msg) {}
};
