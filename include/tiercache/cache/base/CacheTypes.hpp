#pragma once

#include <string>
#include <vector>

namespace tiercache {
namespace cache {

// Уровни иерархии кэша
enum class CacheTier {
    L1 = 1, // In-process (MemoryCache)
    L2 = 2, // Локальный удалённый (Redis)
    L3 = 3  // Дальний удалённый, больший объём (Redis)
};

// Причины вытеснения из L1
enum class EvictionReason {
    Lru,     // Вытеснение по LRU при заполнении
    Expired  // Истёк TTL
};

inline const char* tierName(CacheTier tier) {
    switch (tier) {
    case CacheTier::L1: return "L1";
    case CacheTier::L2: return "L2";
    case CacheTier::L3: return "L3";
    }
    return "unknown";
}

inline const char* evictionReasonName(EvictionReason reason) {
    return reason == EvictionReason::Lru ? "lru" : "expired";
}

inline std::vector<CacheTier> allTiers() {
    return {CacheTier::L1, CacheTier::L2, CacheTier::L3};
}

} // namespace cache
} // namespace tiercache
