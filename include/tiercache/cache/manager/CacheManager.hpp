#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tiercache/cache/CacheConfig.hpp"
#include "tiercache/cache/base/CacheTypes.hpp"
#include "tiercache/cache/manager/CacheStats.hpp"
#include "tiercache/cache/memory/MemoryCache.hpp"
#include "tiercache/cache/metrics/CacheMetrics.hpp"
#include "tiercache/remote/IRemoteTier.hpp"

namespace tiercache {
namespace cache {

constexpr const char* DEFAULT_NAMESPACE = "default";

// CacheManager: оркестрация трёх уровней. Чтение идёт каскадом L1 -> L2 -> L3
// с продвижением найденного значения в более быстрые уровни.
//
// Ошибки удалённых уровней не выходят наружу: они логируются и считаются
// промахом (fail-open). Атомарности между уровнями нет; одновременные промахи
// по одному ключу не объединяются: каждый вызывающий может вычислить и записать значение.
class CacheManager {
public:
    // Уровни L2/L3 создаются как RedisTier по конфигурации (disabled: без уровня)
    explicit CacheManager(const CacheConfig& config);
    // Внедрение удалённых уровней; nullptr: уровень отключён
    CacheManager(const CacheConfig& config,
                 std::shared_ptr<remote::IRemoteTier> tier2,
                 std::shared_ptr<remote::IRemoteTier> tier3);
    ~CacheManager();
    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    // Подключение удалённых уровней; false: фатальная ошибка запуска
    bool initialize();
    void close(); // Закрыть соединения, очистить L1
    bool isInitialized() const;

    std::optional<nlohmann::json> get(const std::string& key,
                                      const std::string& ns = DEFAULT_NAMESPACE);
    // ttl не задан (или <= 0): TTL по умолчанию каждого уровня.
    // Пустой tiers: все включённые уровни; явно указанный отключённый уровень: ошибка записи.
    // true, только если запись удалась во всех запрошенных уровнях
    bool set(const std::string& key, const nlohmann::json& value,
             std::optional<std::chrono::seconds> ttl = std::nullopt,
             const std::string& ns = DEFAULT_NAMESPACE,
             const std::vector<CacheTier>& tiers = {});
    // Удалить из всех уровней; false: ошибка удалённого уровня
    bool remove(const std::string& key, const std::string& ns = DEFAULT_NAMESPACE);
    // Удалить ключи по glob-шаблону во всех уровнях, вернуть общее кол-во
    size_t invalidatePattern(const std::string& pattern, const std::string& ns = DEFAULT_NAMESPACE);
    CacheStats getStats();

    std::string buildKey(const std::string& key, const std::string& ns) const; // "<prefix>:<ns>:<key>"
    const CacheConfig& getConfiguration() const;
    const MemoryCache& memoryTier() const;
    const CacheMetrics& metrics() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace cache
} // namespace tiercache
