#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

namespace tiercache {
namespace cache {

using Clock = std::chrono::steady_clock;

// CacheEntry: запись L1: кадр (возможно сжатый), время создания/истечения, счётчик попаданий.
// expiresAt > createdAt; запись с now > expiresAt логически отсутствует.
struct CacheEntry {
    std::vector<uint8_t> payload;  // Кадр Compressor
    Clock::time_point createdAt;   // Создана
    Clock::time_point expiresAt;   // Истекает (createdAt + ttl)
    uint64_t hitCount = 0;         // Попадания
    size_t sizeBytes = 0;          // payload.size()
    bool compressed = false;       // Тег кадра Zlib

    // now + ttl с насыщением у Clock::time_point::max()
    static Clock::time_point expiryAfter(Clock::time_point now, std::chrono::seconds ttl) {
        auto headroom = std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::max() - now);
        return ttl < headroom ? now + ttl : Clock::time_point::max();
    }

    bool isExpired(Clock::time_point now) const { return now > expiresAt; }
    std::chrono::milliseconds age(Clock::time_point now) const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - createdAt);
    }
};

} // namespace cache
} // namespace tiercache
