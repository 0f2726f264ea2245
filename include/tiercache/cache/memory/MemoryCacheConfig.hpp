#pragma once

#include <chrono>
#include <cstddef>
#include "tiercache/util/Ttl.hpp"

namespace tiercache {
namespace cache {

// MemoryCacheConfig: параметры L1
struct MemoryCacheConfig {
    static constexpr size_t MAX_ENTRIES = 10000000;         // Верхняя граница maxEntries
    size_t maxEntries = 10000;                              // Макс. записи
    std::chrono::seconds defaultTtl = std::chrono::seconds(300); // TTL по умолчанию (5 минут)
    size_t compressionThreshold = 1024;                     // Сжимать кадры больше порога
    std::chrono::seconds cleanupInterval = std::chrono::seconds(0); // Фоновая очистка (0 = выкл.)
    bool validate() const {
        return maxEntries > 0 && maxEntries <= MAX_ENTRIES &&
               defaultTtl.count() > 0 && defaultTtl <= util::MAX_TTL &&
               cleanupInterval.count() >= 0;
    }
};

} // namespace cache
} // namespace tiercache
