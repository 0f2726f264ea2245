#include "tiercache/cache/manager/CacheManager.hpp"
#include "tiercache/codec/ValueCodec.hpp"
#include "tiercache/remote/RedisTier.hpp"
#include "tiercache/util/Logging.hpp"
#include "tiercache/util/Ttl.hpp"
#include <algorithm>
#include <atomic>
#include <shared_mutex>
#include <stdexcept>

namespace tiercache {
namespace cache {

namespace {

codec::CompressionConfig compressionFor(const CacheConfig& config) {
    codec::CompressionConfig compression;
    compression.enabled = config.enableCompression;
    compression.level = config.compressionLevel;
    compression.threshold = config.tier1.compressionThreshold;
    compression.maxDecodedSize = std::max(compression.maxDecodedSize, config.maxValueSize);
    return compression;
}

const CacheConfig& validated(const CacheConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация кэша");
    }
    return config;
}

bool requested(const std::vector<CacheTier>& tiers, CacheTier tier) {
    return tiers.empty() || std::find(tiers.begin(), tiers.end(), tier) != tiers.end();
}

} // namespace

nlohmann::json RemoteTierStats::toJson() const {
    nlohmann::json j = {{"tier", tier}, {"status", status}};
    if (status == "connected") {
        j["memory_usage_bytes"] = memoryUsageBytes;
        j["memory_peak_bytes"] = memoryPeakBytes;
        j["keys_count"] = keysCount;
        j["connected_clients"] = connectedClients;
        j["ops_per_sec"] = opsPerSec;
    } else if (status == "error") {
        j["error"] = error;
    }
    return j;
}

nlohmann::json CacheStats::toJson() const {
    return {
        {"overall", {
            {"total_requests", totalRequests()},
            {"hit_rate_percent", hitRatePercent()},
            {"l1_hits", l1Hits},
            {"l2_hits", l2Hits},
            {"l3_hits", l3Hits},
            {"misses", misses},
            {"promotions", promotions},
            {"l2_errors", l2Errors},
            {"l3_errors", l3Errors}
        }},
        {"l1", l1.toJson()},
        {"l2", l2.toJson()},
        {"l3", l3.toJson()},
        {"metrics", metrics}
    };
}

// Реализация PIMPL
struct CacheManager::Impl {
    CacheConfig config;
    codec::ValueCodec codec;
    CacheMetrics metrics;
    MemoryCache memory;
    std::shared_ptr<remote::IRemoteTier> tier2;
    std::shared_ptr<remote::IRemoteTier> tier3;
    bool initialized = false;
    mutable std::shared_mutex lifecycleMutex;

    std::atomic<uint64_t> l1Hits{0};
    std::atomic<uint64_t> l2Hits{0};
    std::atomic<uint64_t> l3Hits{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> promotions{0};
    std::atomic<uint64_t> l2Errors{0};
    std::atomic<uint64_t> l3Errors{0};

    Impl(const CacheConfig& cfg,
         std::shared_ptr<remote::IRemoteTier> t2,
         std::shared_ptr<remote::IRemoteTier> t3)
        : config(validated(cfg)),
          codec(compressionFor(cfg)),
          metrics(cfg.enableMetrics),
          memory(cfg.tier1, compressionFor(cfg)),
          tier2(std::move(t2)),
          tier3(std::move(t3)) {
        memory.setEvictionCallback([this](const std::string&, EvictionReason reason) {
            metrics.recordEviction("L1", evictionReasonName(reason));
        });
    }

    std::atomic<uint64_t>& errorsFor(CacheTier tier) {
        return tier == CacheTier::L2 ? l2Errors : l3Errors;
    }

    std::shared_ptr<remote::IRemoteTier> remoteFor(CacheTier tier) const {
        return tier == CacheTier::L2 ? tier2 : tier3;
    }

    std::chrono::seconds ttlFor(CacheTier tier, std::optional<std::chrono::seconds> ttl) const {
        if (ttl && ttl->count() > 0) {
            return util::clampTtl(*ttl);
        }
        switch (tier) {
        case CacheTier::L1: return config.tier1.defaultTtl;
        case CacheTier::L2: return config.tier2.defaultTtl;
        case CacheTier::L3: return config.tier3.defaultTtl;
        }
        return config.tier1.defaultTtl;
    }

    bool writeL1(const std::string& fullKey, const std::vector<uint8_t>& frame, std::chrono::seconds ttl) {
        auto start = std::chrono::steady_clock::now();
        bool ok = memory.set(fullKey, frame, ttl);
        metrics.observeDuration("set", "L1", std::chrono::steady_clock::now() - start);
        metrics.setMemoryUsage("L1", memory.totalSizeBytes());
        return ok;
    }

    bool writeRemote(CacheTier tier, const std::string& fullKey,
                     const std::vector<uint8_t>& frame, std::chrono::seconds ttl) {
        auto client = remoteFor(tier);
        if (!client) {
            return false;
        }
        auto start = std::chrono::steady_clock::now();
        auto result = client->setEx(fullKey, ttl, frame);
        metrics.observeDuration("set", tierName(tier), std::chrono::steady_clock::now() - start);
        if (result.failed()) {
            ++errorsFor(tier);
            util::getLogger()->warn("{}: ошибка записи key={}: {}", tierName(tier), fullKey, result.error);
            return false;
        }
        return true;
    }

    // Чтение из удалённого уровня; ошибка: промах (fail-open)
    std::optional<std::vector<uint8_t>> readRemote(CacheTier tier, const std::string& fullKey) {
        auto client = remoteFor(tier);
        if (!client) {
            return std::nullopt;
        }
        auto start = std::chrono::steady_clock::now();
        auto result = client->get(fullKey);
        metrics.observeDuration("get", tierName(tier), std::chrono::steady_clock::now() - start);
        if (result.failed()) {
            ++errorsFor(tier);
            util::getLogger()->warn("{}: ошибка чтения key={}, считаем промахом: {}",
                                    tierName(tier), fullKey, result.error);
            return std::nullopt;
        }
        if (result.miss()) {
            return std::nullopt;
        }
        return std::move(result.value);
    }

    std::optional<nlohmann::json> decode(CacheTier tier, const std::string& fullKey,
                                         const std::vector<uint8_t>& frame) const {
        try {
            return codec.decode(frame);
        } catch (const codec::CodecError& e) {
            util::getLogger()->warn("{}: повреждённое значение key={}, считаем промахом: {}",
                                    tierName(tier), fullKey, e.what());
            return std::nullopt;
        }
    }

    size_t invalidateRemote(CacheTier tier, const std::string& fullPattern) {
        auto client = remoteFor(tier);
        if (!client) {
            return 0;
        }
        size_t deleted = 0;
        uint64_t cursor = 0;
        do {
            auto page = client->scan(cursor, fullPattern, config.batchInvalidationSize);
            if (page.failed()) {
                ++errorsFor(tier);
                util::getLogger()->warn("{}: ошибка SCAN по шаблону '{}': {}", tierName(tier), fullPattern, page.error);
                break;
            }
            if (!page.value.keys.empty()) {
                auto removed = client->del(page.value.keys);
                if (removed.failed()) {
                    ++errorsFor(tier);
                    util::getLogger()->warn("{}: ошибка DEL при инвалидации '{}': {}", tierName(tier), fullPattern, removed.error);
                    break;
                }
                deleted += removed.value;
            }
            cursor = page.value.cursor;
        } while (cursor != 0);
        return deleted;
    }

    RemoteTierStats remoteStats(CacheTier tier) {
        RemoteTierStats stats;
        stats.tier = tierName(tier);
        auto client = remoteFor(tier);
        if (!client) {
            return stats;
        }
        auto info = client->info();
        if (info.failed()) {
            stats.status = "error";
            stats.error = info.error;
            return stats;
        }
        stats.status = "connected";
        stats.memoryUsageBytes = info.value.usedMemory;
        stats.memoryPeakBytes = info.value.usedMemoryPeak;
        stats.connectedClients = info.value.connectedClients;
        stats.opsPerSec = info.value.opsPerSec;
        metrics.setMemoryUsage(stats.tier, stats.memoryUsageBytes);

        // Кол-во ключей нашего префикса
        uint64_t cursor = 0;
        do {
            auto page = client->scan(cursor, config.keyPrefix + ":*", 1000);
            if (page.failed()) {
                stats.status = "error";
                stats.error = page.error;
                break;
            }
            stats.keysCount += page.value.keys.size();
            cursor = page.value.cursor;
        } while (cursor != 0);
        return stats;
    }
};

CacheManager::CacheManager(const CacheConfig& config)
    : CacheManager(config,
                   config.tier2.enabled ? std::make_shared<remote::RedisTier>("L2", config.tier2) : nullptr,
                   config.tier3.enabled ? std::make_shared<remote::RedisTier>("L3", config.tier3) : nullptr) {}

CacheManager::CacheManager(const CacheConfig& config,
                           std::shared_ptr<remote::IRemoteTier> tier2,
                           std::shared_ptr<remote::IRemoteTier> tier3)
    : pImpl(std::make_unique<Impl>(config, std::move(tier2), std::move(tier3))) {
    util::getLogger()->info("CacheManager создан: prefix='{}', L1 maxEntries={}, L2={}, L3={}",
                            config.keyPrefix, config.tier1.maxEntries,
                            pImpl->tier2 ? "on" : "off", pImpl->tier3 ? "on" : "off");
}

CacheManager::~CacheManager() {
    close();
}

bool CacheManager::initialize() {
    auto start = std::chrono::steady_clock::now();
    std::unique_lock<std::shared_mutex> lock(pImpl->lifecycleMutex);
    auto logger = util::getLogger();

    if (pImpl->initialized) {
        logger->warn("CacheManager уже инициализирован");
        return true;
    }

    for (auto tier : {CacheTier::L2, CacheTier::L3}) {
        auto client = pImpl->remoteFor(tier);
        if (client && !client->connect()) {
            logger->error("CacheManager: не удалось подключить уровень {}", tierName(tier));
            if (pImpl->tier2) pImpl->tier2->disconnect();
            if (pImpl->tier3) pImpl->tier3->disconnect();
            return false;
        }
    }

    pImpl->initialized = true;
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start).count();
    logger->info("CacheManager успешно инициализирован за {} μs", duration);
    return true;
}

void CacheManager::close() {
    std::unique_lock<std::shared_mutex> lock(pImpl->lifecycleMutex);
    if (!pImpl->initialized) {
        return;
    }
    if (pImpl->tier2) pImpl->tier2->disconnect();
    if (pImpl->tier3) pImpl->tier3->disconnect();
    pImpl->memory.clear();
    pImpl->initialized = false;
    util::getLogger()->info("CacheManager завершил работу");
}

bool CacheManager::isInitialized() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->lifecycleMutex);
    return pImpl->initialized;
}

std::string CacheManager::buildKey(const std::string& key, const std::string& ns) const {
    return pImpl->config.keyPrefix + ":" + ns + ":" + key;
}

std::optional<nlohmann::json> CacheManager::get(const std::string& key, const std::string& ns) {
    auto start = std::chrono::steady_clock::now();
    std::shared_lock<std::shared_mutex> lock(pImpl->lifecycleMutex);
    auto logger = util::getLogger();
    if (!pImpl->initialized) {
        logger->error("CacheManager не инициализирован: get key={}", key);
        return std::nullopt;
    }

    auto& impl = *pImpl;
    const auto fullKey = buildKey(key, ns);
    const auto keyType = CacheMetrics::classifyKey(key);
    auto elapsed = [&start] { return std::chrono::steady_clock::now() - start; };

    // L1
    if (auto frame = impl.memory.get(fullKey)) {
        if (auto value = impl.decode(CacheTier::L1, fullKey, *frame)) {
            ++impl.l1Hits;
            impl.metrics.recordHit("L1", keyType);
            impl.metrics.observeDuration("get_total", "L1", elapsed());
            logger->debug("L1 hit: key={}", fullKey);
            return value;
        }
        impl.memory.remove(fullKey);
    }
    impl.metrics.recordMiss("L1", keyType);

    // L2
    if (auto frame = impl.readRemote(CacheTier::L2, fullKey)) {
        if (auto value = impl.decode(CacheTier::L2, fullKey, *frame)) {
            impl.writeL1(fullKey, *frame, impl.config.tier1.defaultTtl);
            ++impl.l2Hits;
            ++impl.promotions;
            impl.metrics.recordHit("L2", keyType);
            impl.metrics.observeDuration("get_total", "L2", elapsed());
            logger->debug("L2 hit: key={}, продвинут в L1", fullKey);
            return value;
        }
    }
    if (impl.tier2) impl.metrics.recordMiss("L2", keyType);

    // L3
    if (auto frame = impl.readRemote(CacheTier::L3, fullKey)) {
        if (auto value = impl.decode(CacheTier::L3, fullKey, *frame)) {
            if (impl.tier2 && impl.writeRemote(CacheTier::L2, fullKey, *frame, impl.config.tier2.defaultTtl)) {
                ++impl.promotions;
            }
            impl.writeL1(fullKey, *frame, impl.config.tier1.defaultTtl);
            ++impl.promotions;
            ++impl.l3Hits;
            impl.metrics.recordHit("L3", keyType);
            impl.metrics.observeDuration("get_total", "L3", elapsed());
            logger->debug("L3 hit: key={}, продвинут в L2 и L1", fullKey);
            return value;
        }
    }
    if (impl.tier3) impl.metrics.recordMiss("L3", keyType);

    ++impl.misses;
    impl.metrics.recordMiss("all", keyType);
    logger->debug("Промах на всех уровнях: key={}", fullKey);
    return std::nullopt;
}

bool CacheManager::set(const std::string& key, const nlohmann::json& value,
                       std::optional<std::chrono::seconds> ttl, const std::string& ns,
                       const std::vector<CacheTier>& tiers) {
    std::shared_lock<std::shared_mutex> lock(pImpl->lifecycleMutex);
    auto logger = util::getLogger();
    if (!pImpl->initialized) {
        logger->error("CacheManager не инициализирован: set key={}", key);
        return false;
    }

    auto& impl = *pImpl;
    const auto fullKey = buildKey(key, ns);

    std::vector<uint8_t> frame;
    try {
        frame = impl.codec.encode(value);
    } catch (const codec::CodecError& e) {
        logger->error("Ошибка сериализации key={}: {}", fullKey, e.what());
        return false;
    }
    if (frame.size() > impl.config.maxValueSize) {
        logger->warn("Значение key={} отклонено: {} байт > maxValueSize={}",
                     fullKey, frame.size(), impl.config.maxValueSize);
        return false;
    }

    bool success = true;
    if (requested(tiers, CacheTier::L1)) {
        if (!impl.writeL1(fullKey, frame, impl.ttlFor(CacheTier::L1, ttl))) {
            logger->warn("L1: ошибка записи key={}", fullKey);
            success = false;
        }
    }
    for (auto tier : {CacheTier::L2, CacheTier::L3}) {
        if (!requested(tiers, tier)) continue;
        if (!impl.remoteFor(tier)) {
            if (tiers.empty()) continue;
            logger->warn("{}: уровень отключён, запись key={} пропущена", tierName(tier), fullKey);
            success = false;
            continue;
        }
        if (!impl.writeRemote(tier, fullKey, frame, impl.ttlFor(tier, ttl))) {
            success = false;
        }
    }

    logger->debug("set key={}, size={}, compressed={}, success={}",
                  fullKey, frame.size(), codec::Compressor::isCompressed(frame), success);
    return success;
}

bool CacheManager::remove(const std::string& key, const std::string& ns) {
    std::shared_lock<std::shared_mutex> lock(pImpl->lifecycleMutex);
    auto logger = util::getLogger();
    if (!pImpl->initialized) {
        logger->error("CacheManager не инициализирован: remove key={}", key);
        return false;
    }

    auto& impl = *pImpl;
    const auto fullKey = buildKey(key, ns);
    impl.memory.remove(fullKey);
    impl.metrics.setMemoryUsage("L1", impl.memory.totalSizeBytes());

    bool success = true;
    for (auto tier : {CacheTier::L2, CacheTier::L3}) {
        auto client = impl.remoteFor(tier);
        if (!client) continue;
        auto result = client->del({fullKey});
        if (result.failed()) {
            ++impl.errorsFor(tier);
            logger->warn("{}: ошибка удаления key={}: {}", tierName(tier), fullKey, result.error);
            success = false;
        }
    }
    logger->debug("Данные инвалидированы: key={}", fullKey);
    return success;
}

size_t CacheManager::invalidatePattern(const std::string& pattern, const std::string& ns) {
    std::shared_lock<std::shared_mutex> lock(pImpl->lifecycleMutex);
    auto logger = util::getLogger();
    if (!pImpl->initialized) {
        logger->error("CacheManager не инициализирован: invalidatePattern '{}'", pattern);
        return 0;
    }

    auto& impl = *pImpl;
    const auto fullPattern = buildKey(pattern, ns);

    size_t count = impl.memory.removeMatching(fullPattern);
    impl.metrics.setMemoryUsage("L1", impl.memory.totalSizeBytes());
    count += impl.invalidateRemote(CacheTier::L2, fullPattern);
    count += impl.invalidateRemote(CacheTier::L3, fullPattern);

    impl.metrics.recordInvalidation(pattern, count);
    logger->info("Инвалидация кэша: {} ключей по шаблону '{}'", count, fullPattern);
    return count;
}

CacheStats CacheManager::getStats() {
    std::shared_lock<std::shared_mutex> lock(pImpl->lifecycleMutex);
    auto& impl = *pImpl;

    CacheStats stats;
    stats.l1Hits = impl.l1Hits.load();
    stats.l2Hits = impl.l2Hits.load();
    stats.l3Hits = impl.l3Hits.load();
    stats.misses = impl.misses.load();
    stats.promotions = impl.promotions.load();
    stats.l2Errors = impl.l2Errors.load();
    stats.l3Errors = impl.l3Errors.load();
    stats.l1 = impl.memory.stats();
    impl.metrics.setMemoryUsage("L1", stats.l1.memoryUsageBytes);

    if (impl.initialized) {
        stats.l2 = impl.remoteStats(CacheTier::L2);
        stats.l3 = impl.remoteStats(CacheTier::L3);
    } else {
        stats.l2.tier = "L2";
        stats.l3.tier = "L3";
    }
    stats.metrics = impl.metrics.toJson();
    return stats;
}

const CacheConfig& CacheManager::getConfiguration() const {
    return pImpl->config;
}

const MemoryCache& CacheManager::memoryTier() const {
    return pImpl->memory;
}

const CacheMetrics& CacheManager::metrics() const {
    return pImpl->metrics;
}

} // namespace cache
} // namespace tiercache
