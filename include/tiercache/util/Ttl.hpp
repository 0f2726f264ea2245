#pragma once

#include <chrono>

namespace tiercache {
namespace util {

// Верхняя граница TTL для всех уровней (100 лет)
constexpr std::chrono::seconds MAX_TTL{100LL * 365 * 24 * 3600};

// TTL > MAX_TTL приводится к MAX_TTL
inline std::chrono::seconds clampTtl(std::chrono::seconds ttl) {
    return ttl > MAX_TTL ? MAX_TTL : ttl;
}

} // namespace util
} // namespace tiercache
