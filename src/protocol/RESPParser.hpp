#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "../types/RespReply.hpp"

enum class ParseStatus {OK, INCOMPLETE, INVALID};

// Progress of RESPParser::scanReply through one reply that is still arriving.
struct ReplyFrame {
    // bytes of the reply already checked
    size_t scanned = 0;

    // open arrays, innermost last: elements each one still expects
    std::vector<long long> remaining;
};

class RESPParser {
public: 
    static ParseStatus parseInteger(const std::string& s, int& pos, long long& out);
    static void skipCRLF(const std::string& s, int& pos);

    // Decodes a request ("*N\r\n$len\r\n...") into its bulk string arguments.
    // Returns an empty vector when the request is malformed.
    static std::vector<std::string_view> parse(const std::string& data);

    /**
     * Decodes one reply starting at `pos`.
     * On OK, `out` holds the reply and `pos` points past it.
     * On INCOMPLETE, more bytes are needed and `pos` is left untouched.
     */
    static ParseStatus parseReply(const std::string& data, int& pos, RespReply& out);

    /**
     * Checks whether `data` holds one complete reply without decoding it.
     * Resumes where the previous call on the same `frame` stopped, so
     * feeding a reply in pieces costs time linear in its size.
     * On OK the reply is data[0, frame.scanned).
     */
    static ParseStatus scanReply(const std::string& data, ReplyFrame& frame);

    /** RESP Bulk String: $len\r\nvalue\r\n */
    static std::string bulk(const std::string& value);

    /** RESP Array of bulk strings, the only shape a client sends. */
    static std::string encodeCommand(const std::vector<std::string>& args);
};
