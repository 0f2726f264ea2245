#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "tiercache/cache/memory/MemoryCache.hpp"

namespace tiercache {
namespace cache {

// RemoteTierStats: телеметрия удалённого уровня (INFO + кол-во ключей префикса)
struct RemoteTierStats {
    std::string tier;
    std::string status = "disabled"; // connected / disabled / error
    std::string error;
    uint64_t memoryUsageBytes = 0;
    uint64_t memoryPeakBytes = 0;
    uint64_t keysCount = 0;
    uint64_t connectedClients = 0;
    uint64_t opsPerSec = 0;
    nlohmann::json toJson() const;
};

// CacheStats: агрегированная статистика всех уровней
struct CacheStats {
    uint64_t l1Hits = 0;
    uint64_t l2Hits = 0;
    uint64_t l3Hits = 0;
    uint64_t misses = 0;      // Промах на всех уровнях
    uint64_t promotions = 0;  // Копирований в более быстрые уровни
    uint64_t l2Errors = 0;
    uint64_t l3Errors = 0;
    MemoryCacheStats l1;
    RemoteTierStats l2;
    RemoteTierStats l3;
    nlohmann::json metrics;   // Снимок CacheMetrics

    uint64_t totalRequests() const { return l1Hits + l2Hits + l3Hits + misses; }
    double hitRatePercent() const {
        auto total = totalRequests();
        return total ? static_cast<double>(l1Hits + l2Hits + l3Hits) * 100.0 / total : 0.0;
    }
    nlohmann::json toJson() const;
};

} // namespace cache
} // namespace tiercache
