#pragma once

#include <atomic>
#include <memory>
#include <string>
#include "tiercache/remote/IRemoteTier.hpp"
#include "tiercache/remote/RedisConnectionPool.hpp"
#include "tiercache/remote/RemoteTierConfig.hpp"

namespace tiercache {
namespace remote {

// RedisTier: удалённый уровень кэша поверх Redis (hiredis + пул соединений).
// Любая ошибка сети/таймаут/исчерпание пула возвращается как Outcome::Error.
class RedisTier : public IRemoteTier {
public:
    RedisTier(std::string name, const RemoteTierConfig& config);
    ~RedisTier() override;

    std::string name() const override { return name_; }
    bool connect() override;
    void disconnect() override;
    bool isConnected() const override { return connected_.load(std::memory_order_acquire); }

    RemoteResult<std::vector<uint8_t>> get(const std::string& key) override;
    RemoteResult<bool> setEx(const std::string& key, std::chrono::seconds ttl,
                             const std::vector<uint8_t>& payload) override;
    RemoteResult<size_t> del(const std::vector<std::string>& keys) override;
    RemoteResult<ScanPage> scan(uint64_t cursor, const std::string& pattern, size_t count) override;
    RemoteResult<RemoteTierInfo> info() override;

    const RemoteTierConfig& config() const { return config_; }
    size_t openConnections() const { return pool_->openCount(); }

private:
    // Взять соединение и выполнить команду; reply == nullptr при ошибке (error заполнен)
    RedisReplyPtr execute(const std::vector<std::string>& args, std::string& error);

    std::string name_;
    RemoteTierConfig config_;
    std::unique_ptr<RedisConnectionPool> pool_;
    std::atomic<bool> connected_{false};
};

} // namespace remote
} // namespace tiercache
