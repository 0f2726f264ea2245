#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "tiercache/cache/base/CacheEntry.hpp"
#include "tiercache/cache/base/CacheTypes.hpp"
#include "tiercache/cache/memory/MemoryCacheConfig.hpp"
#include "tiercache/codec/Compressor.hpp"

namespace tiercache {
namespace cache {

// MemoryCacheStats: статистика L1
struct MemoryCacheStats {
    size_t entries = 0;
    size_t maxEntries = 0;
    size_t memoryUsageBytes = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
    double utilizationPercent() const {
        return maxEntries ? static_cast<double>(entries) * 100.0 / maxEntries : 0.0;
    }
    double hitRatePercent() const {
        auto total = hits + misses;
        return total ? static_cast<double>(hits) * 100.0 / total : 0.0;
    }
    double averageEntrySize() const {
        return entries ? static_cast<double>(memoryUsageBytes) / entries : 0.0;
    }
    nlohmann::json toJson() const;
};

// MemoryCache: in-process уровень L1, ограниченный по числу записей,
// потокобезопасный, с TTL и LRU-вытеснением.
// Все операции (включая get, который меняет порядок LRU) выполняются под одним mutex.
// Истёкшие записи удаляются в начале каждой операции; стоимость пропорциональна
// числу истёкших записей благодаря индексу по времени истечения.
class MemoryCache {
public:
    // Вызывается под lock кэша: нельзя обращаться к этому же MemoryCache
    using EvictionCallback = std::function<void(const std::string& key, EvictionReason reason)>;

    explicit MemoryCache(const MemoryCacheConfig& config,
                         const codec::CompressionConfig& compression = codec::CompressionConfig{});
    ~MemoryCache();
    MemoryCache(const MemoryCache&) = delete;
    MemoryCache& operator=(const MemoryCache&) = delete;

    std::optional<std::vector<uint8_t>> get(const std::string& key); // Получить кадр
    // ttl <= 0: TTL по умолчанию. false: пустой ключ или данные не являются кадром
    bool set(const std::string& key, std::vector<uint8_t> payload,
             std::chrono::seconds ttl = std::chrono::seconds(0));
    bool remove(const std::string& key); // Удалить
    void clear(); // Очистить
    size_t removeMatching(const std::string& pattern); // Удалить ключи по glob-шаблону

    std::optional<CacheEntry> peek(const std::string& key) const; // Без влияния на LRU/статистику
    std::vector<std::string> keysInLruOrder() const; // От LRU к MRU
    size_t size() const;
    size_t totalSizeBytes() const;
    MemoryCacheStats stats() const;
    const MemoryCacheConfig& config() const { return config_; }

    void setEvictionCallback(EvictionCallback cb); // Callback вытеснения
    size_t cleanupSync(); // Синхр. очистка истёкших, возвращает кол-во удалённых
    bool verifyIntegrity() const; // Проверка инвариантов map/LRU/индекса TTL

private:
    using LruList = std::list<std::string>;
    using ExpiryIndex = std::multimap<Clock::time_point, std::string>;
    struct Slot {
        CacheEntry entry;
        LruList::iterator lruIt;
        ExpiryIndex::iterator expiryIt;
    };
    using Map = std::unordered_map<std::string, Slot>;

    size_t removeExpiredLocked(Clock::time_point now);
    void evictLruLocked();
    void eraseLocked(Map::iterator it);
    void touchLocked(Slot& slot);
    void startCleanupThread();
    void stopCleanupThread();
    void cleanupThreadFunc();

    MemoryCacheConfig config_;
    codec::Compressor compressor_;
    Map entries_;
    LruList lruList_; // MRU в конце
    ExpiryIndex expiryIndex_;
    size_t totalSizeBytes_ = 0;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
    uint64_t expirations_ = 0;
    EvictionCallback evictionCallback_;
    mutable std::mutex mutex_;

    std::thread cleanupThread_;
    std::mutex cleanupMutex_; // Только для ожидания на cleanupCv_
    std::condition_variable cleanupCv_;
    bool stopCleanup_ = false;
};

} // namespace cache
} // namespace tiercache
