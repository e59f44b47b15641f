#include "RedisConnection.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "../protocol/RESPParser.hpp"
#include "../types/CacheErrors.hpp"

namespace {

int connectTo(const std::string& host, int port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        throw ConnectionError("cannot resolve " + host + ": " + gai_strerror(rc));
    }

    int fd = -1;
    int lastErrno = 0;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            lastErrno = errno;
            continue;
        }
        if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
            break;

        lastErrno = errno;
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(res);

    if (fd < 0) {
        throw ConnectionError("cannot connect to " + host + ":" + service + ": " +
                              std::strerror(lastErrno));
    }
    return fd;
}

std::string describe(const RespReply& reply) {
    switch (reply.type) {
        case RespType::SIMPLE_STRING: return "status '" + reply.str + "'";
        case RespType::ERROR:         return "error '" + reply.str + "'";
        case RespType::INTEGER:       return "integer " + std::to_string(reply.integer);
        case RespType::BULK_STRING:   return "bulk string";
        case RespType::ARRAY:         return "array";
        case RespType::NIL:           return "nil";
    }
    return "unknown reply";
}

StoreError unexpected(const std::vector<std::string>& args, const RespReply& reply) {
    return StoreError("unexpected reply to " + args[0] + ": " + describe(reply));
}

} // namespace

RedisConnection::RedisConnection(const StoreConfig& config)
    : fd(-1)
{
    try {
        fd = connectTo(config.host, config.port);
    } catch (const ConnectionError& e) {
        std::cerr << "redis connection failed: " << e.what() << "\n";
        throw;
    }

    try {
        if (!config.password.empty())
            expectStatus({"AUTH", config.password});
        if (config.db != 0)
            expectStatus({"SELECT", std::to_string(config.db)});
    } catch (const ConnectionError&) {
        throw;
    } catch (const StoreError& e) {
        ::close(fd);
        fd = -1;
        throw ConnectionError(std::string("handshake rejected: ") + e.what());
    }
}

RedisConnection::RedisConnection(int socketFd)
    : fd(socketFd) {}

RedisConnection::~RedisConnection() {
    if (fd >= 0)
        ::close(fd);
}

bool RedisConnection::connected() const {
    std::lock_guard<std::mutex> lock(mutex);
    return fd >= 0;
}

void RedisConnection::close() {
    std::lock_guard<std::mutex> lock(mutex);
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
    inbox.clear();
}

void RedisConnection::dropConnection(const std::string& reason) {
    std::cerr << "redis connection dropped: " << reason << "\n";
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
    inbox.clear();
}

void RedisConnection::sendAll(const std::string& payload) {
    size_t sent = 0;
    while (sent < payload.size()) {
        ssize_t n = ::send(fd, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string reason = std::strerror(errno);
            dropConnection(reason);
            throw ConnectionError("write failed: " + reason);
        }
        sent += static_cast<size_t>(n);
    }
}

RespReply RedisConnection::readReply() {
    char buffer[16384];
    ReplyFrame frame;

    while (true) {
        ParseStatus status = RESPParser::scanReply(inbox, frame);

        if (status == ParseStatus::OK) {
            int pos = 0;
            RespReply reply;
            if (RESPParser::parseReply(inbox, pos, reply) == ParseStatus::OK) {
                inbox.erase(0, pos);
                return reply;
            }
            status = ParseStatus::INVALID;
        }
        if (status == ParseStatus::INVALID) {
            dropConnection("malformed reply");
            throw ConnectionError("protocol error: malformed reply");
        }

        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            std::string reason = n == 0 ? "closed by peer" : std::strerror(errno);
            dropConnection(reason);
            throw ConnectionError("read failed: " + reason);
        }
        inbox.append(buffer, n);
    }
}

RespReply RedisConnection::command(const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(mutex);
    if (fd < 0)
        throw ConnectionError("not connected");

    sendAll(RESPParser::encodeCommand(args));
    return readReply();
}

RespReply RedisConnection::checked(const std::vector<std::string>& args) {
    RespReply reply = command(args);
    if (reply.isError())
        throw StoreError(reply.str);
    return reply;
}

void RedisConnection::expectStatus(const std::vector<std::string>& args, const std::string& status) {
    RespReply reply = checked(args);
    if (reply.type != RespType::SIMPLE_STRING || reply.str != status)
        throw unexpected(args, reply);
}

// ----------------------------------------------------
// Typed commands
// ----------------------------------------------------
void RedisConnection::set(const std::string& key, const std::string& value) {
    expectStatus({"SET", key, value});
}

std::optional<std::string> RedisConnection::get(const std::string& key) {
    std::vector<std::string> args{"GET", key};
    RespReply reply = checked(args);

    if (reply.isNil())
        return std::nullopt;
    if (reply.type != RespType::BULK_STRING)
        throw unexpected(args, reply);

    return std::move(reply.str);
}

long long RedisConnection::incr(const std::string& key) {
    std::vector<std::string> args{"INCR", key};
    RespReply reply = checked(args);
    if (reply.type != RespType::INTEGER)
        throw unexpected(args, reply);
    return reply.integer;
}

bool RedisConnection::exists(const std::string& key) {
    std::vector<std::string> args{"EXISTS", key};
    RespReply reply = checked(args);
    if (reply.type != RespType::INTEGER)
        throw unexpected(args, reply);
    return reply.integer != 0;
}

long long RedisConnection::rpush(const std::string& key, const std::string& value) {
    std::vector<std::string> args{"RPUSH", key, value};
    RespReply reply = checked(args);
    if (reply.type != RespType::INTEGER)
        throw unexpected(args, reply);
    return reply.integer;
}

std::vector<std::string> RedisConnection::lrange(const std::string& key,
                                                 long long start, long long stop) {
    std::vector<std::string> args{"LRANGE", key, std::to_string(start), std::to_string(stop)};
    RespReply reply = checked(args);
    if (reply.type != RespType::ARRAY)
        throw unexpected(args, reply);

    std::vector<std::string> items;
    items.reserve(reply.elements.size());
    for (auto& e : reply.elements) {
        if (e.type != RespType::BULK_STRING)
            throw unexpected(args, e);
        items.push_back(std::move(e.str));
    }
    return items;
}

void RedisConnection::flushdb() {
    expectStatus({"FLUSHDB", "SYNC"});
}

void RedisConnection::ping() {
    expectStatus({"PING"}, "PONG");
}
