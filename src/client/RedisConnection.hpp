#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "StoreHandle.hpp"
#include "StoreConfig.hpp"
#include "../types/RespReply.hpp"

/**
 * RedisConnection
 * ---------------
 * StoreHandle backed by one TCP connection speaking RESP2.
 *
 * Every command is a single request/reply round trip. Round trips are
 * serialized on the connection, so one instance may be shared by
 * several threads; commands from different threads never interleave
 * on the wire.
 */
class RedisConnection : public StoreHandle {
public:
    /**
     * Connects to config.host:config.port, then runs AUTH and SELECT
     * when the config asks for them.
     * Throws ConnectionError if the store is unreachable or refuses the
     * handshake.
     */
    explicit RedisConnection(const StoreConfig& config);

    // Adopts an already connected socket. The connection closes it.
    explicit RedisConnection(int fd);

    ~RedisConnection() override;

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    bool connected() const override;

    void set(const std::string& key, const std::string& value) override;
    std::optional<std::string> get(const std::string& key) override;
    long long incr(const std::string& key) override;
    bool exists(const std::string& key) override;
    long long rpush(const std::string& key, const std::string& value) override;
    std::vector<std::string> lrange(const std::string& key,
                                    long long start, long long stop) override;
    void flushdb() override;

    // PING, expects PONG
    void ping();

    // Closes the socket. Later commands throw ConnectionError.
    void close();

private:
    int fd;
    std::string inbox;
    mutable std::mutex mutex;

    // One locked round trip. Error replies are returned as-is.
    RespReply command(const std::vector<std::string>& args);

    // Expects OK (or the given status) as a simple string reply.
    void expectStatus(const std::vector<std::string>& args, const std::string& status = "OK");
    RespReply checked(const std::vector<std::string>& args);

    void sendAll(const std::string& payload);
    RespReply readReply();

    // Caller must hold `mutex`.
    void dropConnection(const std::string& reason);
};
