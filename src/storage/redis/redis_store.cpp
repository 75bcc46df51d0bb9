/// @file redis_store.cpp
/// @brief hiredis-backed KeyValueStore implementation

#include "storage/redis/redis_store.h"

#include <poll.h>
#include <sys/time.h>

#include <thread>

#include <absl/strings/str_cat.h>
#include <hiredis/hiredis.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace rcache::storage {

namespace {

struct ReplyDeleter {
    void operator()(redisReply* reply) const {
        if (reply != nullptr) {
            freeReplyObject(reply);
        }
    }
};

using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

struct timeval ToTimeval(std::chrono::milliseconds duration) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(duration.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((duration.count() % 1000) * 1000);
    return tv;
}

std::string ReplyText(const redisReply* reply) {
    return std::string(reply->str, reply->len);
}

/// Arguments of a SET, with PX when an expiry is given
std::vector<std::string> SetArgs(const std::string& key, const std::string& value,
                                 std::optional<std::chrono::milliseconds> ttl) {
    std::vector<std::string> args = {"SET", key, value};
    if (ttl.has_value()) {
        args.emplace_back("PX");
        args.push_back(std::to_string(ttl->count()));
    }
    return args;
}

}  // namespace

absl::StatusOr<RedisConfig> RedisConfigFromConfig(const Config& config) {
    RedisConfig redis;

    auto address = config.HasKey("redis.server")
                       ? ParseServerAddress(config.GetString("redis.server"))
                       : ResolveServerAddress();
    if (!address.ok()) {
        return address.status();
    }
    redis.address = *std::move(address);
    redis.password = config.GetString("redis.password");

    const int64_t database = config.GetInt("redis.database", 0);
    if (database < 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("redis.database must be non-negative, got ", database));
    }
    redis.database = static_cast<int>(database);

    const int64_t attempts = config.GetInt("redis.reconnect_attempts", redis.reconnect_attempts);
    if (attempts < 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("redis.reconnect_attempts must be non-negative, got ",
                                      attempts));
    }
    redis.reconnect_attempts = static_cast<int>(attempts);

    const int64_t connect_ms =
        config.GetInt("redis.connect_timeout_ms", redis.connection_timeout.count());
    const int64_t socket_ms =
        config.GetInt("redis.socket_timeout_ms", redis.socket_timeout.count());
    if (connect_ms <= 0 || socket_ms <= 0) {
        return MakeError(ErrorCode::kConfigurationError, "Redis timeouts must be positive");
    }
    redis.connection_timeout = std::chrono::milliseconds(connect_ms);
    redis.socket_timeout = std::chrono::milliseconds(socket_ms);

    return redis;
}

// =============================================================================
// RedisStore::Impl
// =============================================================================

class RedisStore::Impl {
public:
    explicit Impl(RedisConfig config) : config_(std::move(config)) {}

    ~Impl() {
        Disconnect();
    }

    absl::Status Connect() {
        if (IsConnected()) {
            return absl::OkStatus();
        }

        absl::Status last_status;
        for (int attempt = 0; attempt <= config_.reconnect_attempts; ++attempt) {
            if (attempt > 0) {
                RCACHE_LOG_WARN("Reconnecting to {} (attempt {}/{}): {}",
                                config_.address.ToString(), attempt,
                                config_.reconnect_attempts, last_status.message());
                std::this_thread::sleep_for(config_.reconnect_delay * attempt);
            }

            last_status = ConnectOnce();
            if (last_status.ok()) {
                RCACHE_COUNTER("rcache_connections_total").Increment();
                return last_status;
            }
            if (absl::IsPermissionDenied(last_status)) {
                // Retrying will not fix a bad password
                break;
            }
        }

        RCACHE_LOG_CRITICAL("Cannot connect to server {}: {}",
                            config_.address.ToString(), last_status.message());
        return MakeError(ErrorCode::kConnectionFailed,
                         absl::StrCat("Cannot connect to server ",
                                      config_.address.ToString(), ": ",
                                      last_status.message()));
    }

    absl::Status Disconnect() {
        if (context_ == nullptr) {
            return absl::OkStatus();
        }

        redisFree(context_);
        context_ = nullptr;
        ignored_replies_ = 0;
        RCACHE_LOG_DEBUG("Disconnected from Redis at {}", config_.address.ToString());
        return absl::OkStatus();
    }

    bool IsConnected() const {
        return context_ != nullptr && context_->err == 0;
    }

    size_t PendingReplies() const {
        return ignored_replies_;
    }

    absl::StatusOr<ReplyPtr> Execute(const std::vector<std::string>& args) {
        const std::string& command = args.front();
        std::string last_error;

        for (int attempt = 0;; ++attempt) {
            RCACHE_RETURN_IF_ERROR(Connect());
            DrainIgnoredReplies();

            if (IsConnected()) {
                std::vector<const char*> argv;
                std::vector<size_t> argvlen;
                BuildArgv(args, argv, argvlen);

                ReplyPtr reply(static_cast<redisReply*>(
                    redisCommandArgv(context_, static_cast<int>(argv.size()),
                                     argv.data(), argvlen.data())));
                if (reply) {
                    if (reply->type == REDIS_REPLY_ERROR) {
                        return MakeError(ErrorCode::kStoreError,
                                         absl::StrCat(command, " failed: ", ReplyText(reply.get())));
                    }
                    return reply;
                }
            }

            last_error = context_ != nullptr ? context_->errstr : "connection closed";
            Disconnect();

            if (attempt >= config_.reconnect_attempts) {
                RCACHE_LOG_CRITICAL("Connection to {} lost during {}: {}",
                                    config_.address.ToString(), command, last_error);
                return MakeError(ErrorCode::kConnectionFailed,
                                 absl::StrCat(command, " failed: connection lost (",
                                              last_error, ")"));
            }
            RCACHE_LOG_WARN("Connection to {} lost during {} ({}), resending",
                            config_.address.ToString(), command, last_error);
        }
    }

    absl::Status SendIgnoringReply(const std::vector<std::string>& args) {
        DiscardArrivedReplies();
        RCACHE_RETURN_IF_ERROR(Connect());

        std::vector<const char*> argv;
        std::vector<size_t> argvlen;
        BuildArgv(args, argv, argvlen);

        if (redisAppendCommandArgv(context_, static_cast<int>(argv.size()),
                                   argv.data(), argvlen.data()) != REDIS_OK) {
            RCACHE_LOG_DEBUG("Dropped unacknowledged {}: {}", args.front(), context_->errstr);
            return absl::OkStatus();
        }
        ++ignored_replies_;

        int done = 0;
        while (!done) {
            if (redisBufferWrite(context_, &done) == REDIS_ERR) {
                RCACHE_LOG_DEBUG("Unacknowledged {} not sent: {}", args.front(),
                                 context_->errstr);
                Disconnect();
                break;
            }
        }
        return absl::OkStatus();
    }

private:
    absl::Status ConnectOnce() {
        const struct timeval connect_timeout = ToTimeval(config_.connection_timeout);
        context_ = redisConnectWithTimeout(config_.address.host.c_str(),
                                           config_.address.port, connect_timeout);

        if (context_ == nullptr || context_->err) {
            std::string error_msg = context_ ? context_->errstr : "Unknown error";
            Disconnect();
            return absl::UnavailableError(error_msg);
        }

        const struct timeval socket_timeout = ToTimeval(config_.socket_timeout);
        if (redisSetTimeout(context_, socket_timeout) != REDIS_OK) {
            std::string error_msg = context_->errstr;
            Disconnect();
            return absl::UnavailableError("Failed to set socket timeout: " + error_msg);
        }

        if (!config_.password.empty()) {
            auto status = HandshakeCommand({"AUTH", config_.password});
            if (!status.ok()) {
                return absl::PermissionDeniedError(
                    absl::StrCat("Redis authentication failed: ", status.message()));
            }
        }

        if (config_.database != 0) {
            RCACHE_RETURN_IF_ERROR(
                HandshakeCommand({"SELECT", std::to_string(config_.database)}));
        }

        RCACHE_LOG_INFO("Connected to Redis at {}/{}", config_.address.ToString(),
                        config_.database);
        return absl::OkStatus();
    }

    /// Runs a command during connection setup; any failure drops the context
    absl::Status HandshakeCommand(const std::vector<std::string>& args) {
        std::vector<const char*> argv;
        std::vector<size_t> argvlen;
        BuildArgv(args, argv, argvlen);

        ReplyPtr reply(static_cast<redisReply*>(
            redisCommandArgv(context_, static_cast<int>(argv.size()),
                             argv.data(), argvlen.data())));
        if (!reply || reply->type == REDIS_REPLY_ERROR) {
            std::string error_msg = reply ? ReplyText(reply.get()) : context_->errstr;
            Disconnect();
            return absl::UnavailableError(absl::StrCat(args.front(), " failed: ", error_msg));
        }
        return absl::OkStatus();
    }

    /// Discards replies to unacknowledged writes that have already arrived,
    /// without waiting for the rest
    void DiscardArrivedReplies() {
        while (ignored_replies_ > 0 && IsConnected()) {
            void* raw = nullptr;
            if (redisGetReplyFromReader(context_, &raw) != REDIS_OK) {
                RCACHE_LOG_DEBUG("Bad reply to unacknowledged write: {}", context_->errstr);
                Disconnect();
                return;
            }
            if (raw != nullptr) {
                --ignored_replies_;
                ReplyPtr reply(static_cast<redisReply*>(raw));
                if (reply->type == REDIS_REPLY_ERROR) {
                    RCACHE_LOG_DEBUG("Discarded error from unacknowledged write: {}",
                                     ReplyText(reply.get()));
                }
                continue;
            }

            struct pollfd pfd;
            pfd.fd = context_->fd;
            pfd.events = POLLIN;
            pfd.revents = 0;
            if (poll(&pfd, 1, 0) <= 0) {
                return;
            }
            if (redisBufferRead(context_) != REDIS_OK) {
                RCACHE_LOG_DEBUG("Lost connection while reading unacknowledged replies: {}",
                                 context_->errstr);
                Disconnect();
                return;
            }
        }
    }

    /// Reads and discards the replies owed to unacknowledged writes
    void DrainIgnoredReplies() {
        while (ignored_replies_ > 0 && IsConnected()) {
            void* raw = nullptr;
            if (redisGetReply(context_, &raw) != REDIS_OK) {
                RCACHE_LOG_DEBUG("Lost connection while draining unacknowledged replies: {}",
                                 context_->errstr);
                Disconnect();
                return;
            }
            --ignored_replies_;

            ReplyPtr reply(static_cast<redisReply*>(raw));
            if (reply && reply->type == REDIS_REPLY_ERROR) {
                RCACHE_LOG_DEBUG("Discarded error from unacknowledged write: {}",
                                 ReplyText(reply.get()));
            }
        }
    }

    static void BuildArgv(const std::vector<std::string>& args,
                          std::vector<const char*>& argv,
                          std::vector<size_t>& argvlen) {
        argv.reserve(args.size());
        argvlen.reserve(args.size());
        for (const auto& arg : args) {
            argv.push_back(arg.data());
            argvlen.push_back(arg.size());
        }
    }

    RedisConfig config_;
    redisContext* context_ = nullptr;
    size_t ignored_replies_ = 0;
};

// =============================================================================
// RedisStore Public Interface
// =============================================================================

RedisStore::RedisStore(RedisConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

RedisStore::~RedisStore() = default;

absl::Status RedisStore::Connect() {
    return impl_->Connect();
}

absl::Status RedisStore::Disconnect() {
    return impl_->Disconnect();
}

bool RedisStore::IsConnected() const {
    return impl_->IsConnected();
}

size_t RedisStore::PendingReplies() const {
    return impl_->PendingReplies();
}

absl::Status RedisStore::Ping() {
    return impl_->Execute({"PING"}).status();
}

absl::StatusOr<std::optional<std::string>> RedisStore::Get(const std::string& key) {
    RCACHE_ASSIGN_OR_RETURN(ReplyPtr reply, impl_->Execute({"GET", key}));

    if (reply->type == REDIS_REPLY_NIL) {
        return std::nullopt;
    }
    if (reply->type != REDIS_REPLY_STRING) {
        return MakeError(ErrorCode::kStoreError, "GET returned a non-string reply");
    }
    return std::optional<std::string>(ReplyText(reply.get()));
}

absl::Status RedisStore::Set(const std::string& key, const std::string& value,
                             std::optional<std::chrono::milliseconds> ttl) {
    return impl_->Execute(SetArgs(key, value, ttl)).status();
}

absl::Status RedisStore::SetNoReply(const std::string& key, const std::string& value,
                                    std::optional<std::chrono::milliseconds> ttl) {
    return impl_->SendIgnoringReply(SetArgs(key, value, ttl));
}

absl::StatusOr<int64_t> RedisStore::Delete(const std::vector<std::string>& keys) {
    if (keys.empty()) {
        return 0;
    }

    std::vector<std::string> args;
    args.reserve(keys.size() + 1);
    args.emplace_back("DEL");
    args.insert(args.end(), keys.begin(), keys.end());

    RCACHE_ASSIGN_OR_RETURN(ReplyPtr reply, impl_->Execute(args));
    if (reply->type != REDIS_REPLY_INTEGER) {
        return MakeError(ErrorCode::kStoreError, "DEL returned a non-integer reply");
    }
    return static_cast<int64_t>(reply->integer);
}

absl::StatusOr<std::vector<std::string>> RedisStore::Keys(const std::string& pattern) {
    RCACHE_ASSIGN_OR_RETURN(ReplyPtr reply, impl_->Execute({"KEYS", pattern}));
    if (reply->type != REDIS_REPLY_ARRAY) {
        return MakeError(ErrorCode::kStoreError, "KEYS returned a non-array reply");
    }

    std::vector<std::string> result;
    result.reserve(reply->elements);
    for (size_t i = 0; i < reply->elements; ++i) {
        result.push_back(ReplyText(reply->element[i]));
    }
    return result;
}

absl::StatusOr<int64_t> RedisStore::PTTL(const std::string& key) {
    RCACHE_ASSIGN_OR_RETURN(ReplyPtr reply, impl_->Execute({"PTTL", key}));
    if (reply->type != REDIS_REPLY_INTEGER) {
        return MakeError(ErrorCode::kStoreError, "PTTL returned a non-integer reply");
    }
    return static_cast<int64_t>(reply->integer);
}

absl::Status RedisStore::FlushAll() {
    return impl_->Execute({"FLUSHALL"}).status();
}

absl::StatusOr<std::unique_ptr<KeyValueStore>> ConnectRedisStore(const RedisConfig& config) {
    auto store = std::make_unique<RedisStore>(config);
    RCACHE_RETURN_IF_ERROR(store->Connect());
    return std::unique_ptr<KeyValueStore>(std::move(store));
}

}  // namespace rcache::storage
