#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <hiredis/hiredis.h>
#include "tiercache/remote/RemoteTierConfig.hpp"

namespace tiercache {
namespace remote {

struct RedisContextDeleter {
    void operator()(redisContext* ctx) const { if (ctx) redisFree(ctx); }
};
struct RedisReplyDeleter {
    void operator()(redisReply* reply) const { if (reply) freeReplyObject(reply); }
};
using RedisContextPtr = std::unique_ptr<redisContext, RedisContextDeleter>;
using RedisReplyPtr = std::unique_ptr<redisReply, RedisReplyDeleter>;

// RedisConnectionPool: ограниченный пул соединений hiredis.
// Новые соединения создаются по требованию до maxConnections; сломанные
// (ошибка ввода-вывода, таймаут) не возвращаются в пул.
class RedisConnectionPool {
public:
    // Lease: соединение, взятое из пула; возвращается в деструкторе
    class Lease {
    public:
        Lease() = default;
        Lease(RedisConnectionPool* pool, RedisContextPtr ctx);
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();
        redisContext* get() const { return ctx_.get(); }
        explicit operator bool() const { return static_cast<bool>(ctx_); }
        void invalidate() { broken_ = true; } // Не возвращать в пул
    private:
        RedisConnectionPool* pool_ = nullptr;
        RedisContextPtr ctx_;
        bool broken_ = false;
    };

    explicit RedisConnectionPool(const RemoteTierConfig& config);
    ~RedisConnectionPool();
    RedisConnectionPool(const RedisConnectionPool&) = delete;
    RedisConnectionPool& operator=(const RedisConnectionPool&) = delete;

    Lease acquire(std::string& error); // Пустой Lease при ошибке
    void open();  // Разрешить выдачу соединений
    void close(); // Закрыть простаивающие, запретить новые
    size_t idleCount() const;
    size_t openCount() const;

    // Выполнить команду в бинарно-безопасной argv-форме; nullptr при ошибке соединения
    static RedisReplyPtr command(redisContext* ctx, const std::vector<std::string>& args);

private:
    RedisContextPtr createConnection(std::string& error) const;
    void release(RedisContextPtr ctx, bool broken);

    RemoteTierConfig config_;
    std::vector<RedisContextPtr> idle_;
    size_t open_ = 0;
    bool closed_ = true;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace remote
} // namespace tiercache
