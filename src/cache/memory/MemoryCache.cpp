#include "tiercache/cache/memory/MemoryCache.hpp"
#include "tiercache/util/Logging.hpp"
#include "tiercache/util/Ttl.hpp"
#include <fnmatch.h>
#include <iterator>
#include <unordered_set>

namespace tiercache {
namespace cache {

nlohmann::json MemoryCacheStats::toJson() const {
    return {
        {"tier", "L1"},
        {"size", entries},
        {"max_size", maxEntries},
        {"utilization_percent", utilizationPercent()},
        {"memory_usage_bytes", memoryUsageBytes},
        {"hit_rate_percent", hitRatePercent()},
        {"hits", hits},
        {"misses", misses},
        {"evictions", evictions},
        {"expirations", expirations},
        {"average_entry_size", averageEntrySize()}
    };
}

MemoryCache::MemoryCache(const MemoryCacheConfig& config, const codec::CompressionConfig& compression)
    : config_(config), compressor_([&] {
          auto c = compression;
          c.threshold = config.compressionThreshold;
          return c;
      }()) {
    if (!config_.validate()) {
        throw std::invalid_argument("Некорректная конфигурация MemoryCache");
    }
    entries_.reserve(config_.maxEntries);
    if (config_.cleanupInterval.count() > 0) {
        startCleanupThread();
    }
    util::getLogger()->debug("MemoryCache: создан, maxEntries={}, defaultTtl={}s, cleanupInterval={}s",
                             config_.maxEntries, config_.defaultTtl.count(), config_.cleanupInterval.count());
}

MemoryCache::~MemoryCache() {
    stopCleanupThread();
}

std::optional<std::vector<uint8_t>> MemoryCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    removeExpiredLocked(now);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }
    if (it->second.entry.isExpired(now)) {
        // Истекла ровно сейчас: удаляем лениво
        if (evictionCallback_) {
            evictionCallback_(it->first, EvictionReason::Expired);
        }
        eraseLocked(it);
        ++expirations_;
        ++misses_;
        return std::nullopt;
    }

    touchLocked(it->second);
    ++it->second.entry.hitCount;
    ++hits_;
    return it->second.entry.payload;
}

bool MemoryCache::set(const std::string& key, std::vector<uint8_t> payload, std::chrono::seconds ttl) {
    if (key.empty()) {
        return false;
    }
    if (!codec::Compressor::isFrame(payload)) {
        util::getLogger()->warn("MemoryCache: отклонена запись key={}: данные не являются кадром", key);
        return false;
    }
    if (ttl.count() <= 0) {
        ttl = config_.defaultTtl;
    }
    ttl = util::clampTtl(ttl);
    // Сжатие до захвата lock
    payload = compressor_.repack(std::move(payload));

    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    removeExpiredLocked(now);

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        eraseLocked(it);
    } else {
        while (entries_.size() >= config_.maxEntries && !lruList_.empty()) {
            evictLruLocked();
        }
    }

    CacheEntry entry;
    entry.createdAt = now;
    entry.expiresAt = CacheEntry::expiryAfter(now, ttl);
    entry.sizeBytes = payload.size();
    entry.compressed = codec::Compressor::isCompressed(payload);
    entry.payload = std::move(payload);

    lruList_.push_back(key);
    auto expiryIt = expiryIndex_.emplace(entry.expiresAt, key);
    totalSizeBytes_ += entry.sizeBytes;
    entries_.emplace(key, Slot{std::move(entry), std::prev(lruList_.end()), expiryIt});
    return true;
}

bool MemoryCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    eraseLocked(it);
    return true;
}

void MemoryCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lruList_.clear();
    expiryIndex_.clear();
    totalSizeBytes_ = 0;
}

size_t MemoryCache::removeMatching(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        auto current = it++;
        if (fnmatch(pattern.c_str(), current->first.c_str(), 0) == 0) {
            eraseLocked(current);
            ++removed;
        }
    }
    return removed;
}

std::optional<CacheEntry> MemoryCache::peek(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.entry;
}

std::vector<std::string> MemoryCache::keysInLruOrder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(lruList_.begin(), lruList_.end());
}

size_t MemoryCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t MemoryCache::totalSizeBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSizeBytes_;
}

MemoryCacheStats MemoryCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MemoryCacheStats s;
    s.entries = entries_.size();
    s.maxEntries = config_.maxEntries;
    s.memoryUsageBytes = totalSizeBytes_;
    s.hits = hits_;
    s.misses = misses_;
    s.evictions = evictions_;
    s.expirations = expirations_;
    return s;
}

void MemoryCache::setEvictionCallback(EvictionCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    evictionCallback_ = std::move(cb);
}

size_t MemoryCache::cleanupSync() {
    std::lock_guard<std::mutex> lock(mutex_);
    return removeExpiredLocked(Clock::now());
}

bool MemoryCache::verifyIntegrity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.size() > config_.maxEntries) return false;
    if (lruList_.size() != entries_.size() || expiryIndex_.size() != entries_.size()) return false;

    std::unordered_set<std::string> seen;
    for (const auto& key : lruList_) {
        if (!seen.insert(key).second || entries_.find(key) == entries_.end()) {
            return false;
        }
    }
    size_t total = 0;
    for (const auto& [key, slot] : entries_) {
        if (*slot.lruIt != key || slot.expiryIt->second != key ||
            slot.expiryIt->first != slot.entry.expiresAt ||
            slot.entry.sizeBytes != slot.entry.payload.size() ||
            !(slot.entry.expiresAt > slot.entry.createdAt)) {
            return false;
        }
        total += slot.entry.sizeBytes;
    }
    return total == totalSizeBytes_;
}

size_t MemoryCache::removeExpiredLocked(Clock::time_point now) {
    size_t removed = 0;
    while (!expiryIndex_.empty() && expiryIndex_.begin()->first < now) {
        auto it = entries_.find(expiryIndex_.begin()->second);
        if (it == entries_.end()) {
            // Узел без записи: нарушение инварианта, убираем узел
            util::getLogger()->error("MemoryCache: узел индекса TTL без записи: {}", expiryIndex_.begin()->second);
            expiryIndex_.erase(expiryIndex_.begin());
            continue;
        }
        if (evictionCallback_) {
            evictionCallback_(it->first, EvictionReason::Expired);
        }
        eraseLocked(it);
        ++expirations_;
        ++removed;
    }
    return removed;
}

void MemoryCache::evictLruLocked() {
    auto it = entries_.find(lruList_.front());
    if (it == entries_.end()) {
        lruList_.pop_front();
        return;
    }
    if (evictionCallback_) {
        evictionCallback_(it->first, EvictionReason::Lru);
    }
    util::getLogger()->debug("MemoryCache: вытеснен по LRU key={}", it->first);
    eraseLocked(it);
    ++evictions_;
}

void MemoryCache::eraseLocked(Map::iterator it) {
    totalSizeBytes_ -= it->second.entry.sizeBytes;
    lruList_.erase(it->second.lruIt);
    expiryIndex_.erase(it->second.expiryIt);
    entries_.erase(it);
}

void MemoryCache::touchLocked(Slot& slot) {
    lruList_.splice(lruList_.end(), lruList_, slot.lruIt);
}

void MemoryCache::startCleanupThread() {
    stopCleanup_ = false;
    cleanupThread_ = std::thread([this] { cleanupThreadFunc(); });
}

void MemoryCache::stopCleanupThread() {
    {
        std::lock_guard<std::mutex> lock(cleanupMutex_);
        stopCleanup_ = true;
    }
    cleanupCv_.notify_all();
    if (cleanupThread_.joinable()) {
        cleanupThread_.join();
    }
}

void MemoryCache::cleanupThreadFunc() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(cleanupMutex_);
            if (cleanupCv_.wait_for(lock, config_.cleanupInterval, [this] { return stopCleanup_; })) {
                break;
            }
        }
        auto removed = cleanupSync();
        if (removed > 0) {
            util::getLogger()->debug("MemoryCache: фоновая очистка удалила {} истёкших записей", removed);
        }
    }
}

} // namespace cache
} // namespace tiercache
