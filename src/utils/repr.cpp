#include "repr.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <system_error>

std::string formatReal(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";

    std::string sign = std::signbit(d) ? "-" : "";
    if (d == 0.0) return sign + "0.0";

    // Shortest round-trip digits, always in d.ddde±XX form.
    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), std::fabs(d),
                                   std::chars_format::scientific);
    if (ec != std::errc()) return sign + "nan";
    std::string sci(buf, end);

    size_t e = sci.find('e');
    std::string mantissa = sci.substr(0, e);
    int exponent = std::stoi(sci.substr(e + 1));

    std::string digits;
    for (char c : mantissa)
        if (c != '.') digits += c;

    // position of the decimal point relative to the first digit
    int decpt = exponent + 1;
    int ndigits = static_cast<int>(digits.size());

    std::string out;
    if (decpt <= -4 || decpt > 16) {
        out = digits.substr(0, 1);
        if (ndigits > 1)
            out += "." + digits.substr(1);

        char expbuf[16];
        std::snprintf(expbuf, sizeof(expbuf), "e%c%02d", exponent < 0 ? '-' : '+',
                      exponent < 0 ? -exponent : exponent);
        out += expbuf;
    } else if (decpt <= 0) {
        out = "0." + std::string(-decpt, '0') + digits;
    } else if (decpt >= ndigits) {
        out = digits + std::string(decpt - ndigits, '0') + ".0";
    } else {
        out = digits.substr(0, decpt) + "." + digits.substr(decpt);
    }

    return sign + out;
}

// Code points Python's str.isprintable() rejects above U+007F:
// Cc, Zs other than space, Zl, Zp, Cf, Co, and the noncharacters.
static bool isPrintableCodePoint(unsigned int cp) {
    static const unsigned int hidden[][2] = {
        {0x0080, 0x00A0}, {0x00AD, 0x00AD},
        {0x0600, 0x0605}, {0x061C, 0x061C}, {0x06DD, 0x06DD}, {0x070F, 0x070F},
        {0x08E2, 0x08E2}, {0x1680, 0x1680}, {0x180E, 0x180E},
        {0x2000, 0x200F}, {0x2028, 0x202F}, {0x205F, 0x2064}, {0x2066, 0x206F},
        {0x3000, 0x3000}, {0xE000, 0xF8FF}, {0xFDD0, 0xFDEF}, {0xFEFF, 0xFEFF},
        {0xFFF9, 0xFFFB}, {0x110BD, 0x110BD}, {0x110CD, 0x110CD},
        {0x13430, 0x1343F}, {0x1BCA0, 0x1BCA3}, {0x1D173, 0x1D17A},
        {0xE0001, 0xE0001}, {0xE0020, 0xE007F},
        {0xF0000, 0xFFFFD}, {0x100000, 0x10FFFD},
    };

    if ((cp & 0xFFFE) == 0xFFFE) return false;
    for (const auto& range : hidden)
        if (cp >= range[0] && cp <= range[1]) return false;
    return true;
}

// Length of the well-formed UTF-8 sequence at s[i], 0 if there is none.
static size_t decodeCodePoint(const std::string& s, size_t i, unsigned int& cp) {
    unsigned char c = s[i];
    size_t extra;
    unsigned int min;

    if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; min = 0x80; }
    else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; min = 0x800; }
    else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; min = 0x10000; }
    else return 0;

    if (i + extra >= s.size()) return 0;

    for (size_t k = 1; k <= extra; k++) {
        unsigned char cc = s[i + k];
        if ((cc & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (cc & 0x3F);
    }

    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
    return extra + 1;
}

static void appendEscape(std::string& out, unsigned int cp) {
    char hex[12];
    if (cp <= 0xFF)
        std::snprintf(hex, sizeof(hex), "\\x%02x", cp);
    else if (cp <= 0xFFFF)
        std::snprintf(hex, sizeof(hex), "\\u%04x", cp);
    else
        std::snprintf(hex, sizeof(hex), "\\U%08x", cp);
    out += hex;
}

std::string quoteText(const std::string& s, bool asBytes) {
    bool hasSingle = s.find('\'') != std::string::npos;
    bool hasDouble = s.find('"') != std::string::npos;
    char quote = (hasSingle && !hasDouble) ? '"' : '\'';

    std::string out;
    out.reserve(s.size() + 3);
    if (asBytes) out += 'b';
    out += quote;

    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = s[i];

        if (c >= 0x80) {
            unsigned int cp = 0;
            size_t len = asBytes ? 0 : decodeCodePoint(s, i, cp);
            if (len == 0) {
                appendEscape(out, c);
                i++;
            } else {
                if (isPrintableCodePoint(cp))
                    out.append(s, i, len);
                else
                    appendEscape(out, cp);
                i += len;
            }
            continue;
        }

        if (c == '\\' || c == static_cast<unsigned char>(quote)) {
            out += '\\';
            out += static_cast<char>(c);
        } else if (c == '\t') {
            out += "\\t";
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c < 0x20 || c == 0x7f) {
            appendEscape(out, c);
        } else {
            out += static_cast<char>(c);
        }
        i++;
    }

    out += quote;
    return out;
}

std::string encodeScalar(const Scalar& value) {
    switch (value.type) {
        case ScalarType::TEXT:
        case ScalarType::BINARY:
            return std::get<std::string>(value.value);
        case ScalarType::INTEGER:
            return std::to_string(std::get<long long>(value.value));
        case ScalarType::REAL:
            return formatReal(std::get<double>(value.value));
    }
    return {};
}

std::string scalarRepr(const Scalar& value) {
    switch (value.type) {
        case ScalarType::TEXT:
            return quoteText(std::get<std::string>(value.value), false);
        case ScalarType::BINARY:
            return quoteText(std::get<std::string>(value.value), true);
        case ScalarType::INTEGER:
        case ScalarType::REAL:
            return encodeScalar(value);
    }
    return {};
}

std::string argsRepr(const std::vector<Scalar>& args) {
    std::string out = "(";
    for (size_t i = 0; i < args.size(); i++) {
        if (i > 0) out += ", ";
        out += scalarRepr(args[i]);
    }
    if (args.size() == 1) out += ",";
    out += ")";
    return out;
}

bool isValidUtf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = s[i];
        int extra;
        unsigned int cp;

        if (c < 0x80) { i++; continue; }
        else if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
        else return false;

        if (i + extra >= s.size()) return false;

        for (int k = 1; k <= extra; k++) {
            unsigned char cc = s[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // overlong forms, surrogates, beyond U+10FFFF
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
            (extra == 3 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF))
            return false;

        i += extra + 1;
    }
    return true;
}
