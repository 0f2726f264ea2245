#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "tiercache/cache/base/CacheTypes.hpp"
#include "tiercache/cache/compute/CacheKeyBuilder.hpp"
#include "tiercache/cache/manager/CacheManager.hpp"
#include "tiercache/util/Logging.hpp"

namespace tiercache {
namespace cache {

// Параметры сохранения вычисленного значения
struct ComputeOptions {
    std::optional<std::chrono::seconds> ttl;    // Не задан: TTL уровней по умолчанию
    std::string ns = DEFAULT_NAMESPACE;         // Пространство имён
    std::vector<CacheTier> tiers;               // Пусто: все включённые уровни
};

// Вернуть значение из кэша или вычислить, сохранить и вернуть.
// Исключения compute() пробрасываются вызывающему, в кэш ничего не пишется.
// Одновременные промахи по одному ключу не объединяются.
template<typename Compute>
nlohmann::json getOrCompute(CacheManager& manager, const std::string& key,
                            const ComputeOptions& options, Compute&& compute) {
    if (auto cached = manager.get(key, options.ns)) {
        return std::move(*cached);
    }

    nlohmann::json value = std::forward<Compute>(compute)();
    if (!manager.set(key, value, options.ttl, options.ns, options.tiers)) {
        util::getLogger()->warn("getOrCompute: не удалось сохранить вычисленное значение key={}", key);
    }
    return value;
}

// Кэшируемая операция: ключ "<operation>:<sha256(аргументов)>"
class CachedOperation {
public:
    CachedOperation(CacheManager& manager, std::string operation, ComputeOptions options = ComputeOptions{})
        : manager_(manager), operation_(std::move(operation)), options_(std::move(options)) {}

    std::string keyFor(const std::map<std::string, nlohmann::json>& args) const {
        CacheKeyBuilder builder(operation_);
        for (const auto& [name, value] : args) {
            builder.arg(name, value);
        }
        return operation_ + ":" + builder.build();
    }

    template<typename Compute>
    nlohmann::json call(const std::map<std::string, nlohmann::json>& args, Compute&& compute) {
        return getOrCompute(manager_, keyFor(args), options_, std::forward<Compute>(compute));
    }

    bool invalidate(const std::map<std::string, nlohmann::json>& args) {
        return manager_.remove(keyFor(args), options_.ns);
    }

    const std::string& operation() const { return operation_; }
    const ComputeOptions& options() const { return options_; }

private:
    CacheManager& manager_;
    std::string operation_;
    ComputeOptions options_;
};

} // namespace cache
} // namespace tiercache
