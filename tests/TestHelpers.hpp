#pragma once

#include <string>
#include <string_view>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>
#include <vector>

#include "../src/client/StoreHandle.hpp"
#include "../src/db/MemoryStore.hpp"
#include "../src/protocol/RESPParser.hpp"
#include "../src/types/CacheErrors.hpp"

/**
 * The server side of a socketpair.
 * Replies are queued before the client sends, so a RedisConnection on the
 * other end can run a full round trip on the test thread.
 */
class ScriptedPeer {
public:
    ScriptedPeer() {
        int fds[2];
        if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0) {
            client = fds[0];
            peer = fds[1];
        }
    }

    ~ScriptedPeer() {
        closePeer();
        if (client >= 0) ::close(client);
    }

    bool ok() const { return peer >= 0; }

    // Hands the client end over; the caller becomes responsible for closing it.
    int takeClientFd() {
        int fd = client;
        client = -1;
        return fd;
    }

    void queueReply(const std::string& resp) {
        [[maybe_unused]] ssize_t _ = ::write(peer, resp.data(), resp.size());
    }

    // Reads the next complete request and returns its arguments.
    std::vector<std::string> nextRequest() {
        char buffer[4096];
        while (true) {
            auto views = RESPParser::parse(pending);
            if (!views.empty()) {
                std::vector<std::string> args(views.begin(), views.end());
                size_t framed = RESPParser::encodeCommand(args).size();
                // the last argument may still lack its CRLF
                if (pending.size() >= framed) {
                    pending.erase(0, framed);
                    return args;
                }
            }
            ssize_t n = ::read(peer, buffer, sizeof(buffer));
            if (n <= 0) return {};
            pending.append(buffer, n);
        }
    }

    // Writes `resp` in pieces of `chunk` bytes, for replies larger than the socket buffer.
    void queueReplyInChunks(const std::string& resp, size_t chunk) {
        for (size_t off = 0; off < resp.size(); off += chunk)
            queueReply(resp.substr(off, chunk));
    }

    void closePeer() {
        if (peer >= 0) {
            ::close(peer);
            peer = -1;
        }
    }

private:
    int client = -1;
    int peer = -1;
    std::string pending;
};

// MemoryStore whose SET always fails, for checking partial-failure behavior.
class FailingSetStore : public MemoryStore {
public:
    void set(const std::string&, const std::string&) override {
        throw StoreError("ERR simulated write failure");
    }
};
