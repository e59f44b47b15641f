#include "RESPParser.hpp"

#include <charconv>
#include <system_error>

// Reads an optionally signed decimal terminated by CRLF.
// Anything outside the 64-bit signed range is INVALID.
ParseStatus RESPParser::parseInteger(const std::string& s, int& pos, long long& out) {
    int p = pos;

    if (p < (int)s.size() && s[p] == '-')
        p++;

    int start = p;
    while (true) {
        if (p >= (int)s.size()) return ParseStatus::INCOMPLETE;
        if (s[p] == '\r') break;
        if (s[p] < '0' || s[p] > '9') return ParseStatus::INVALID;
        p++;
    }

    if (p == start) return ParseStatus::INVALID;

    long long num = 0;
    const char* last = s.data() + p;
    auto [ptr, ec] = std::from_chars(s.data() + pos, last, num);
    if (ec != std::errc() || ptr != last) return ParseStatus::INVALID;

    if (p + 1 >= (int)s.size()) return ParseStatus::INCOMPLETE;
    if (s[p + 1] != '\n') return ParseStatus::INVALID;

    pos = p + 2;
    out = num;
    return ParseStatus::OK;
}

void RESPParser::skipCRLF(const std::string& s, int& pos) {
    if (pos + 1 < (int)s.size() &&
        s[pos] == '\r' && s[pos + 1] == '\n')
        pos += 2;
}

std::vector<std::string_view> RESPParser::parse(const std::string& data) {
    std::vector<std::string_view> values;

    int pos = 0;

    if (data.empty() || data[pos] != '*') return {};
    pos++;

    long long count = 0;
    if (parseInteger(data, pos, count) != ParseStatus::OK || count < 0) return {};

    for (long long i = 0; i < count; i++) {
        if (pos >= (int)data.size() || data[pos] != '$')
            return {};

        pos++;

        long long len = 0;
        if (parseInteger(data, pos, len) != ParseStatus::OK) return {};
        if (len < 0 || pos + len > (long long)data.size()) return {};

        std::string_view word(data.data() + pos, len);
        values.push_back(word);

        pos += len;
        skipCRLF(data, pos);
    }

    return values;
}

ParseStatus RESPParser::parseReply(const std::string& data, int& pos, RespReply& out) {
    if (pos >= (int)data.size()) return ParseStatus::INCOMPLETE;

    int p = pos + 1;
    RespReply reply;

    switch (data[pos]) {
        case '+':
        case '-': {
            size_t crlf = data.find("\r\n", p);
            if (crlf == std::string::npos) return ParseStatus::INCOMPLETE;
            reply.type = data[pos] == '+' ? RespType::SIMPLE_STRING : RespType::ERROR;
            reply.str = data.substr(p, crlf - p);
            p = (int)crlf + 2;
            break;
        }
        case ':': {
            ParseStatus st = parseInteger(data, p, reply.integer);
            if (st != ParseStatus::OK) return st;
            reply.type = RespType::INTEGER;
            break;
        }
        case '$': {
            long long len = 0;
            ParseStatus st = parseInteger(data, p, len);
            if (st != ParseStatus::OK) return st;

            if (len == -1) {
                reply.type = RespType::NIL;
                break;
            }
            if (len < 0) return ParseStatus::INVALID;

            // payload plus its trailing CRLF
            if (p + len + 2 > (long long)data.size()) return ParseStatus::INCOMPLETE;
            if (data[p + len] != '\r' || data[p + len + 1] != '\n')
                return ParseStatus::INVALID;

            reply.type = RespType::BULK_STRING;
            reply.str = data.substr(p, len);
            p += (int)len + 2;
            break;
        }
        case '*': {
            long long count = 0;
            ParseStatus st = parseInteger(data, p, count);
            if (st != ParseStatus::OK) return st;

            if (count == -1) {
                reply.type = RespType::NIL;
                break;
            }
            if (count < 0) return ParseStatus::INVALID;

            reply.type = RespType::ARRAY;
            reply.elements.reserve(count);
            for (long long i = 0; i < count; i++) {
                RespReply element;
                st = parseReply(data, p, element);
                if (st != ParseStatus::OK) return st;
                reply.elements.push_back(std::move(element));
            }
            break;
        }
        default:
            return ParseStatus::INVALID;
    }

    pos = p;
    out = std::move(reply);
    return ParseStatus::OK;
}

ParseStatus RESPParser::scanReply(const std::string& data, ReplyFrame& frame) {
    while (true) {
        int pos = (int)frame.scanned;
        if (pos >= (int)data.size()) return ParseStatus::INCOMPLETE;

        int p = pos + 1;
        switch (data[pos]) {
            case '+':
            case '-': {
                size_t crlf = data.find("\r\n", p);
                if (crlf == std::string::npos) return ParseStatus::INCOMPLETE;
                p = (int)crlf + 2;
                break;
            }
            case ':': {
                long long ignored = 0;
                ParseStatus st = parseInteger(data, p, ignored);
                if (st != ParseStatus::OK) return st;
                break;
            }
            case '$': {
                long long len = 0;
                ParseStatus st = parseInteger(data, p, len);
                if (st != ParseStatus::OK) return st;
                if (len == -1) break;
                if (len < 0) return ParseStatus::INVALID;

                if (p + len + 2 > (long long)data.size()) return ParseStatus::INCOMPLETE;
                if (data[p + len] != '\r' || data[p + len + 1] != '\n')
                    return ParseStatus::INVALID;
                p += (int)len + 2;
                break;
            }
            case '*': {
                long long count = 0;
                ParseStatus st = parseInteger(data, p, count);
                if (st != ParseStatus::OK) return st;
                if (count < -1) return ParseStatus::INVALID;

                if (count > 0) {
                    // elements follow; the array completes with its last one
                    frame.scanned = p;
                    frame.remaining.push_back(count);
                    continue;
                }
                break;
            }
            default:
                return ParseStatus::INVALID;
        }

        frame.scanned = p;

        // one element finished; close every array it completes
        while (!frame.remaining.empty()) {
            if (--frame.remaining.back() > 0) break;
            frame.remaining.pop_back();
        }
        if (frame.remaining.empty()) return ParseStatus::OK;
    }
}

std::string RESPParser::bulk(const std::string& value) {
    return "$" + std::to_string(value.size()) + "\r\n" + value + "\r\n";
}

std::string RESPParser::encodeCommand(const std::vector<std::string>& args) {
    std::string out;
    out += "*" + std::to_string(args.size()) + "\r\n";

    for (const auto& a : args) {
        out += bulk(a);
    }

    return out;
}
