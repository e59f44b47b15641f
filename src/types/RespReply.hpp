#pragma once

#include <string>
#include <vector>

enum class RespType {SIMPLE_STRING, ERROR, INTEGER, BULK_STRING, ARRAY, NIL};

// One decoded RESP2 reply.
// SIMPLE_STRING, ERROR and BULK_STRING use `str`, INTEGER uses `integer`,
// ARRAY uses `elements`. NIL covers both "$-1" and "*-1".
struct RespReply {
    RespType type = RespType::NIL;
    std::string str;
    long long integer = 0;
    std::vector<RespReply> elements;

    bool isNil() const { return type == RespType::NIL; }
    bool isError() const { return type == RespType::ERROR; }
};
