#ifndef REDIS_CONNECTION_HPP
#define REDIS_CONNECTION_HPP

#include "StorageConnection.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct RedisAddress
{
    std::string host;
    uint16_t port = 6379;
    std::string password;
    int database = 0;

    /**
     * @brief Parses redis://[:password@]host[:port][/db]
     *
     * @throws std::invalid_argument on a malformed address
     */
    static RedisAddress parse(const std::string &url);

    std::string toString() const;
};

/**
 * @brief Blocking RESP2 client for one Redis node
 *
 * The socket is opened lazily on the first command and reopened after any
 * failure. Connect, read and write are all bounded by the configured timeout.
 */
class RedisConnection : public StorageConnection
{
public:
    RedisConnection(RedisAddress address, std::chrono::milliseconds timeout);
    ~RedisConnection() override;

    RedisConnection(const RedisConnection &) = delete;
    RedisConnection &operator=(const RedisConnection &) = delete;

    int64_t incrementBy(const std::string &key, int64_t delta) override;
    std::optional<int64_t> get(const std::string &key) override;
    bool del(const std::string &key) override;
    void ping() override;

    bool isConnected() const { return m_fd >= 0; }

    // Encodes a command as a RESP array of bulk strings
    static std::string encodeCommand(const std::vector<std::string> &args);

private:
    struct Reply
    {
        enum class Type
        {
            Status,
            Error,
            Integer,
            Bulk,
            Nil
        };

        Type type = Type::Nil;
        std::string text;
        int64_t integer = 0;
    };

    Reply command(const std::vector<std::string> &args);
    void connect();
    void closeSocket();
    void writeAll(const std::string &data);
    std::string readLine();
    std::string readExact(size_t count);
    void fillBuffer();
    Reply readReply();

    RedisAddress m_address;
    std::chrono::milliseconds m_timeout;
    int m_fd{-1};
    std::string m_readBuffer;
};

#endif
