#include "tiercache/cache/metrics/CacheMetrics.hpp"

namespace tiercache {
namespace cache {

namespace {

template<typename Map>
uint64_t lookup(const Map& map, const typename Map::key_type& key) {
    auto it = map.find(key);
    return it == map.end() ? 0 : it->second;
}

nlohmann::json labeledCounters(const std::map<std::pair<std::string, std::string>, uint64_t>& counters,
                               const char* first, const char* second) {
    auto result = nlohmann::json::array();
    for (const auto& [labels, value] : counters) {
        result.push_back({{first, labels.first}, {second, labels.second}, {"value", value}});
    }
    return result;
}

} // namespace

CacheMetrics::CacheMetrics(bool enabled) : enabled_(enabled) {}

const std::vector<double>& CacheMetrics::bucketBounds() {
    static const std::vector<double> bounds = {
        0.0001, 0.00025, 0.0005, 0.001, 0.0025, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0
    };
    return bounds;
}

void CacheMetrics::recordHit(const std::string& tier, const std::string& keyType) {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    ++hits_[{tier, keyType}];
}

void CacheMetrics::recordMiss(const std::string& tier, const std::string& keyType) {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    ++misses_[{tier, keyType}];
}

void CacheMetrics::observeDuration(const std::string& operation, const std::string& tier,
                                   std::chrono::steady_clock::duration elapsed) {
    if (!enabled_) return;
    double seconds = std::chrono::duration<double>(elapsed).count();
    const auto& bounds = bucketBounds();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = durations_[{operation, tier}];
    if (histogram.buckets.empty()) {
        histogram.buckets.assign(bounds.size(), 0);
    }
    for (size_t i = 0; i < bounds.size(); ++i) {
        if (seconds <= bounds[i]) {
            ++histogram.buckets[i];
        }
    }
    ++histogram.count;
    histogram.sum += seconds;
}

void CacheMetrics::recordEviction(const std::string& tier, const std::string& reason) {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    ++evictions_[{tier, reason}];
}

void CacheMetrics::setMemoryUsage(const std::string& tier, uint64_t bytes) {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    memoryUsage_[tier] = bytes;
}

void CacheMetrics::recordInvalidation(const std::string& pattern, uint64_t count) {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    invalidations_[pattern] += count;
}

uint64_t CacheMetrics::hits(const std::string& tier, const std::string& keyType) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(hits_, {tier, keyType});
}

uint64_t CacheMetrics::misses(const std::string& tier, const std::string& keyType) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(misses_, {tier, keyType});
}

uint64_t CacheMetrics::evictions(const std::string& tier, const std::string& reason) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(evictions_, {tier, reason});
}

uint64_t CacheMetrics::invalidations(const std::string& pattern) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(invalidations_, pattern);
}

uint64_t CacheMetrics::memoryUsage(const std::string& tier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(memoryUsage_, tier);
}

std::optional<HistogramSnapshot> CacheMetrics::duration(const std::string& operation,
                                                        const std::string& tier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = durations_.find({operation, tier});
    if (it == durations_.end()) {
        return std::nullopt;
    }
    return HistogramSnapshot{bucketBounds(), it->second.buckets, it->second.count, it->second.sum};
}

nlohmann::json CacheMetrics::toJson() const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto durations = nlohmann::json::array();
    for (const auto& [labels, histogram] : durations_) {
        auto buckets = nlohmann::json::array();
        for (size_t i = 0; i < histogram.buckets.size(); ++i) {
            buckets.push_back({{"le", bucketBounds()[i]}, {"count", histogram.buckets[i]}});
        }
        durations.push_back({
            {"operation", labels.first},
            {"tier", labels.second},
            {"count", histogram.count},
            {"sum", histogram.sum},
            {"buckets", buckets}
        });
    }

    return {
        {"enabled", enabled_},
        {"cache_hits_total", labeledCounters(hits_, "tier", "key_type")},
        {"cache_misses_total", labeledCounters(misses_, "tier", "key_type")},
        {"cache_operation_duration_seconds", durations},
        {"cache_evictions_total", labeledCounters(evictions_, "tier", "reason")},
        {"cache_memory_usage_bytes", memoryUsage_},
        {"cache_invalidations_total", invalidations_}
    };
}

std::string CacheMetrics::classifyKey(const std::string& logicalKey) {
    static const char* prefixes[] = {"user", "event", "product", "query"};
    for (const char* prefix : prefixes) {
        std::string p = std::string(prefix) + ":";
        if (logicalKey.compare(0, p.size(), p) == 0) {
            return prefix;
        }
    }
    return "other";
}

} // namespace cache
} // namespace tiercache
