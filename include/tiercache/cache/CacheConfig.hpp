#pragma once

#include <string>
#include <chrono>
#include <nlohmann/json.hpp>
#include "tiercache/cache/memory/MemoryCacheConfig.hpp"
#include "tiercache/remote/RemoteTierConfig.hpp"
#include "tiercache/util/Logging.hpp"

namespace tiercache {
namespace cache {

// CacheConfig: параметры трёхуровневого кэша (L1, L2, L3, сжатие, метрики, логирование).
// Неизменяема после создания CacheManager.
struct CacheConfig {
    static constexpr size_t MAX_BATCH_INVALIDATION_SIZE = 1000000; // Верхняя граница COUNT
    std::string keyPrefix = "eventos";      // Префикс ключей "<prefix>:<namespace>:<key>"
    MemoryCacheConfig tier1;                 // L1 (in-process)
    remote::RemoteTierConfig tier2;          // L2 (локальный Redis)
    remote::RemoteTierConfig tier3 = defaultTier3(); // L3 (дальний Redis)
    bool enableCompression = true;           // Сжатие
    int compressionLevel = 3;                // Уровень zlib (1..9)
    bool enableMetrics = true;               // Метрики
    size_t batchInvalidationSize = 1000;     // COUNT для SCAN при инвалидации
    size_t maxValueSize = 8 * 1024 * 1024;   // Макс. размер закодированного значения (8 MB)
    util::LoggingConfig logging;             // Логирование

    bool validate() const;
    nlohmann::json toJson() const;
    // Отсутствующие поля: значения по умолчанию; std::invalid_argument при ошибке
    static CacheConfig fromJson(const nlohmann::json& j);
    static CacheConfig loadFromFile(const std::string& path);

    static remote::RemoteTierConfig defaultTier3() {
        remote::RemoteTierConfig config;
        config.database = 1;
        config.defaultTtl = std::chrono::seconds(3600);
        config.maxConnections = 50;
        return config;
    }
};

} // namespace cache
} // namespace tiercache
