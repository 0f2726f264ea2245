#include "tiercache/remote/RedisConnectionPool.hpp"
#include "tiercache/util/Logging.hpp"
#include <sys/time.h>

namespace tiercache {
namespace remote {

namespace {

timeval toTimeval(std::chrono::milliseconds ms) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

} // namespace

RedisConnectionPool::Lease::Lease(RedisConnectionPool* pool, RedisContextPtr ctx)
    : pool_(pool), ctx_(std::move(ctx)) {}

RedisConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), ctx_(std::move(other.ctx_)), broken_(other.broken_) {
    other.pool_ = nullptr;
}

RedisConnectionPool::Lease::~Lease() {
    if (pool_ && ctx_) {
        bool broken = broken_ || ctx_->err != 0;
        pool_->release(std::move(ctx_), broken);
    }
}

RedisConnectionPool::RedisConnectionPool(const RemoteTierConfig& config) : config_(config) {
    idle_.reserve(config_.maxConnections);
}

RedisConnectionPool::~RedisConnectionPool() {
    close();
}

void RedisConnectionPool::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

void RedisConnectionPool::close() {
    std::vector<RedisContextPtr> toFree;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        open_ -= idle_.size();
        toFree.swap(idle_);
    }
    cv_.notify_all();
    // Контексты освобождаются вне lock
}

size_t RedisConnectionPool::idleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

size_t RedisConnectionPool::openCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

RedisConnectionPool::Lease RedisConnectionPool::acquire(std::string& error) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + config_.acquireTimeout;

    while (true) {
        if (closed_) {
            error = "пул соединений закрыт";
            return Lease{};
        }
        if (!idle_.empty()) {
            RedisContextPtr ctx = std::move(idle_.back());
            idle_.pop_back();
            return Lease(this, std::move(ctx));
        }
        if (open_ < config_.maxConnections) {
            ++open_;
            lock.unlock();
            RedisContextPtr ctx = createConnection(error);
            if (!ctx) {
                lock.lock();
                --open_;
                cv_.notify_one();
                return Lease{};
            }
            return Lease(this, std::move(ctx));
        }
        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
            idle_.empty() && open_ >= config_.maxConnections) {
            error = "пул соединений исчерпан (" + std::to_string(config_.maxConnections) + ")";
            return Lease{};
        }
    }
}

void RedisConnectionPool::release(RedisContextPtr ctx, bool broken) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (broken || closed_) {
            --open_;
        } else {
            idle_.push_back(std::move(ctx));
        }
    }
    cv_.notify_one();
}

RedisContextPtr RedisConnectionPool::createConnection(std::string& error) const {
    RedisContextPtr ctx(redisConnectWithTimeout(config_.host.c_str(), config_.port,
                                                toTimeval(config_.connectTimeout)));
    if (!ctx) {
        error = "не удалось выделить redisContext";
        return nullptr;
    }
    if (ctx->err) {
        error = std::string("подключение к ") + config_.host + ":" +
                std::to_string(config_.port) + ": " + ctx->errstr;
        return nullptr;
    }
    if (redisSetTimeout(ctx.get(), toTimeval(config_.commandTimeout)) != REDIS_OK) {
        error = std::string("redisSetTimeout: ") + ctx->errstr;
        return nullptr;
    }
    redisEnableKeepAlive(ctx.get());

    if (config_.database != 0) {
        auto reply = command(ctx.get(), {"SELECT", std::to_string(config_.database)});
        if (!reply) {
            error = std::string("SELECT: ") + ctx->errstr;
            return nullptr;
        }
        if (reply->type == REDIS_REPLY_ERROR) {
            error = std::string("SELECT: ") + std::string(reply->str, reply->len);
            return nullptr;
        }
    }

    util::getLogger()->debug("RedisConnectionPool: новое соединение {}:{}/{}",
                             config_.host, config_.port, config_.database);
    return ctx;
}

RedisReplyPtr RedisConnectionPool::command(redisContext* ctx, const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }
    void* reply = redisCommandArgv(ctx, static_cast<int>(argv.size()), argv.data(), argvlen.data());
    return RedisReplyPtr(static_cast<redisReply*>(reply));
}

} // namespace remote
} // namespace tiercache
