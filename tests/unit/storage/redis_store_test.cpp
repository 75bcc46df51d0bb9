/// @file redis_store_test.cpp
/// @brief RedisStore against an in-process RESP listener

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <absl/strings/numbers.h>

#include "storage/redis/redis_store.h"

namespace rcache::storage {
namespace {

/// Accepts one connection and answers every command: GET with nil, PING with
/// PONG, anything else with OK.
class RespListener {
public:
    RespListener() {
        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        int reuse = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bound_ = bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
                 listen(listen_fd_, 1) == 0;

        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this]() { Serve(); });
    }

    ~RespListener() {
        // Wakes a pending accept() if no client ever connected
        shutdown(listen_fd_, SHUT_RDWR);
        thread_.join();
        close(listen_fd_);
    }

    bool bound() const { return bound_; }
    uint16_t port() const { return port_; }
    int commands() const { return commands_.load(); }

private:
    static std::optional<std::vector<std::string>> TakeCommand(std::string& buffer) {
        if (buffer.empty() || buffer.front() != '*') {
            return std::nullopt;
        }
        size_t eol = buffer.find("\r\n");
        if (eol == std::string::npos) {
            return std::nullopt;
        }
        int count = 0;
        if (!absl::SimpleAtoi(buffer.substr(1, eol - 1), &count)) {
            return std::nullopt;
        }

        size_t pos = eol + 2;
        std::vector<std::string> args;
        for (int i = 0; i < count; ++i) {
            if (pos >= buffer.size() || buffer[pos] != '$') {
                return std::nullopt;
            }
            eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos) {
                return std::nullopt;
            }
            size_t length = 0;
            if (!absl::SimpleAtoi(buffer.substr(pos + 1, eol - pos - 1), &length)) {
                return std::nullopt;
            }
            pos = eol + 2;
            if (pos + length + 2 > buffer.size()) {
                return std::nullopt;
            }
            args.push_back(buffer.substr(pos, length));
            pos += length + 2;
        }
        buffer.erase(0, pos);
        return args;
    }

    void Serve() {
        const int fd = accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) {
            return;
        }

        std::string buffer;
        char chunk[4096];
        for (;;) {
            const ssize_t n = read(fd, chunk, sizeof(chunk));
            if (n <= 0) {
                break;
            }
            buffer.append(chunk, static_cast<size_t>(n));

            while (auto args = TakeCommand(buffer)) {
                std::string reply = "+OK\r\n";
                if (args->front() == "GET") {
                    reply = "$-1\r\n";
                } else if (args->front() == "PING") {
                    reply = "+PONG\r\n";
                }
                ++commands_;
                size_t sent = 0;
                while (sent < reply.size()) {
                    const ssize_t w = write(fd, reply.data() + sent, reply.size() - sent);
                    if (w <= 0) {
                        close(fd);
                        return;
                    }
                    sent += static_cast<size_t>(w);
                }
            }
        }
        close(fd);
    }

    int listen_fd_ = -1;
    bool bound_ = false;
    uint16_t port_ = 0;
    std::atomic<int> commands_{0};
    std::thread thread_;
};

RedisConfig ConfigFor(const RespListener& listener) {
    RedisConfig config;
    config.address.host = "127.0.0.1";
    config.address.port = listener.port();
    config.reconnect_attempts = 0;
    config.connection_timeout = std::chrono::milliseconds(1000);
    config.socket_timeout = std::chrono::milliseconds(1000);
    return config;
}

void WaitForCommands(const RespListener& listener, int expected) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (listener.commands() < expected && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

TEST(RedisStoreTest, UnacknowledgedRepliesDoNotAccumulate) {
    RespListener listener;
    ASSERT_TRUE(listener.bound());

    {
        RedisStore store(ConfigFor(listener));
        ASSERT_TRUE(store.Connect().ok());

        constexpr int kWrites = 500;
        for (int i = 0; i < kWrites; ++i) {
            ASSERT_TRUE(store.SetNoReply("k" + std::to_string(i), "v", std::nullopt).ok());
        }
        WaitForCommands(listener, kWrites);
        // Give the last replies time to cross the socket
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        // Every earlier reply has arrived, so the next send discards them all
        ASSERT_TRUE(store.SetNoReply("last", "v", std::nullopt).ok());
        EXPECT_LE(store.PendingReplies(), 1u);

        auto value = store.Get("k0");
        ASSERT_TRUE(value.ok()) << value.status();
        EXPECT_FALSE(value->has_value());
        EXPECT_EQ(store.PendingReplies(), 0u);
    }
}

TEST(RedisStoreTest, SynchronousReplyFollowsUnacknowledgedWrites) {
    RespListener listener;
    ASSERT_TRUE(listener.bound());

    {
        RedisStore store(ConfigFor(listener));
        ASSERT_TRUE(store.SetNoReply("a", "1", std::chrono::milliseconds(5000)).ok());
        ASSERT_TRUE(store.SetNoReply("b", "2", std::nullopt).ok());

        // The OKs owed to the writes must not be taken for PING's reply
        EXPECT_TRUE(store.Ping().ok());
        EXPECT_EQ(store.PendingReplies(), 0u);
        EXPECT_EQ(listener.commands(), 3);
    }
}

}  // namespace
}  // namespace rcache::storage
