#pragma once

#include <string>
#include <variant>

enum class ScalarType {TEXT, BINARY, INTEGER, REAL};

// A value accepted by Cache::store.
// TEXT and BINARY both keep their bytes in the string alternative.
struct Scalar {
    ScalarType type;
    std::variant<std::string, long long, double> value;

    Scalar(const char* text) : type(ScalarType::TEXT), value(std::string(text)) {}
    Scalar(std::string text) : type(ScalarType::TEXT), value(std::move(text)) {}
    Scalar(int n) : type(ScalarType::INTEGER), value(static_cast<long long>(n)) {}
    Scalar(long n) : type(ScalarType::INTEGER), value(static_cast<long long>(n)) {}
    Scalar(long long n) : type(ScalarType::INTEGER), value(n) {}
    Scalar(double d) : type(ScalarType::REAL), value(d) {}

    static Scalar bytes(std::string raw) {
        Scalar s(std::move(raw));
        s.type = ScalarType::BINARY;
        return s;
    }
};
