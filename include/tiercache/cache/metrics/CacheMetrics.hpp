#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace tiercache {
namespace cache {

// HistogramSnapshot: гистограмма длительностей (секунды), кумулятивные бакеты
struct HistogramSnapshot {
    std::vector<double> bounds;   // Верхние границы бакетов
    std::vector<uint64_t> counts; // Кол-во наблюдений <= bound
    uint64_t count = 0;           // Всего наблюдений
    double sum = 0.0;             // Сумма (секунды)
};

// CacheMetrics: счётчики, гистограммы и gauge для внешнего сборщика телеметрии.
// Реестр не экспортирует сам: только отдаёт снимок через toJson().
//   cache_hits_total{tier,key_type}, cache_misses_total{tier,key_type},
//   cache_operation_duration_seconds{operation,tier}, cache_evictions_total{tier,reason},
//   cache_memory_usage_bytes{tier}, cache_invalidations_total{pattern}
class CacheMetrics {
public:
    explicit CacheMetrics(bool enabled = true);

    void recordHit(const std::string& tier, const std::string& keyType);
    void recordMiss(const std::string& tier, const std::string& keyType);
    void observeDuration(const std::string& operation, const std::string& tier,
                         std::chrono::steady_clock::duration elapsed);
    void recordEviction(const std::string& tier, const std::string& reason);
    void setMemoryUsage(const std::string& tier, uint64_t bytes);
    void recordInvalidation(const std::string& pattern, uint64_t count);

    uint64_t hits(const std::string& tier, const std::string& keyType) const;
    uint64_t misses(const std::string& tier, const std::string& keyType) const;
    uint64_t evictions(const std::string& tier, const std::string& reason) const;
    uint64_t invalidations(const std::string& pattern) const;
    uint64_t memoryUsage(const std::string& tier) const;
    std::optional<HistogramSnapshot> duration(const std::string& operation, const std::string& tier) const;

    bool enabled() const { return enabled_; }
    nlohmann::json toJson() const;

    // Категория ключа по префиксу логического ключа: user/event/product/query/other
    static std::string classifyKey(const std::string& logicalKey);

private:
    using Labels = std::pair<std::string, std::string>;
    struct Histogram {
        std::vector<uint64_t> buckets;
        uint64_t count = 0;
        double sum = 0.0;
    };

    static const std::vector<double>& bucketBounds();

    bool enabled_;
    std::map<Labels, uint64_t> hits_;
    std::map<Labels, uint64_t> misses_;
    std::map<Labels, Histogram> durations_;
    std::map<Labels, uint64_t> evictions_;
    std::map<std::string, uint64_t> memoryUsage_;
    std::map<std::string, uint64_t> invalidations_;
    mutable std::mutex mutex_;
};

} // namespace cache
} // namespace tiercache
