#include "tiercache/cache/CacheConfig.hpp"
#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace tiercache {
namespace cache {

namespace {

// Неотрицательное целое поле; отрицательные и нецелые значения отклоняются
size_t sizeField(const nlohmann::json& j, const char* name, size_t fallback) {
    if (!j.contains(name)) {
        return fallback;
    }
    const auto& v = j.at(name);
    if (v.is_number_unsigned()) {
        return v.get<size_t>();
    }
    if (v.is_number_integer() && v.get<int64_t>() >= 0) {
        return static_cast<size_t>(v.get<int64_t>());
    }
    throw std::invalid_argument(std::string("Некорректная конфигурация кэша: поле ") + name +
                                " должно быть неотрицательным целым");
}

nlohmann::json remoteToJson(const remote::RemoteTierConfig& c) {
    return {
        {"enabled", c.enabled},
        {"host", c.host},
        {"port", c.port},
        {"database", c.database},
        {"default_ttl_seconds", c.defaultTtl.count()},
        {"max_connections", c.maxConnections},
        {"connect_timeout_ms", c.connectTimeout.count()},
        {"command_timeout_ms", c.commandTimeout.count()},
        {"acquire_timeout_ms", c.acquireTimeout.count()}
    };
}

remote::RemoteTierConfig remoteFromJson(const nlohmann::json& j, remote::RemoteTierConfig c) {
    c.enabled = j.value("enabled", c.enabled);
    c.host = j.value("host", c.host);
    c.port = j.value("port", c.port);
    c.database = j.value("database", c.database);
    c.defaultTtl = std::chrono::seconds(j.value("default_ttl_seconds", static_cast<int64_t>(c.defaultTtl.count())));
    c.maxConnections = sizeField(j, "max_connections", c.maxConnections);
    c.connectTimeout = std::chrono::milliseconds(j.value("connect_timeout_ms", static_cast<int64_t>(c.connectTimeout.count())));
    c.commandTimeout = std::chrono::milliseconds(j.value("command_timeout_ms", static_cast<int64_t>(c.commandTimeout.count())));
    c.acquireTimeout = std::chrono::milliseconds(j.value("acquire_timeout_ms", static_cast<int64_t>(c.acquireTimeout.count())));
    return c;
}

} // namespace

bool CacheConfig::validate() const {
    if (keyPrefix.empty() || !tier1.validate()) return false;
    if (tier2.enabled && !tier2.validate()) return false;
    if (tier3.enabled && !tier3.validate()) return false;
    if (compressionLevel < 1 || compressionLevel > 9) return false;
    return batchInvalidationSize > 0 && batchInvalidationSize <= MAX_BATCH_INVALIDATION_SIZE &&
           maxValueSize > 0 && logging.validate();
}

nlohmann::json CacheConfig::toJson() const {
    return {
        {"key_prefix", keyPrefix},
        {"tier1", {
            {"max_entries", tier1.maxEntries},
            {"default_ttl_seconds", tier1.defaultTtl.count()},
            {"compression_threshold", tier1.compressionThreshold},
            {"cleanup_interval_seconds", tier1.cleanupInterval.count()}
        }},
        {"tier2", remoteToJson(tier2)},
        {"tier3", remoteToJson(tier3)},
        {"enable_compression", enableCompression},
        {"compression_level", compressionLevel},
        {"enable_metrics", enableMetrics},
        {"batch_invalidation_size", batchInvalidationSize},
        {"max_value_size", maxValueSize},
        {"logging", {
            {"level", logging.level},
            {"log_path", logging.logPath},
            {"max_log_size", logging.maxLogSize},
            {"max_log_files", logging.maxLogFiles},
            {"console", logging.console}
        }}
    };
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Конфигурация кэша должна быть JSON-объектом");
    }

    CacheConfig config;
    try {
        config.keyPrefix = j.value("key_prefix", config.keyPrefix);

        if (j.contains("tier1")) {
            const auto& t = j.at("tier1");
            auto& c = config.tier1;
            c.maxEntries = sizeField(t, "max_entries", c.maxEntries);
            c.defaultTtl = std::chrono::seconds(t.value("default_ttl_seconds", static_cast<int64_t>(c.defaultTtl.count())));
            c.compressionThreshold = sizeField(t, "compression_threshold", c.compressionThreshold);
            c.cleanupInterval = std::chrono::seconds(t.value("cleanup_interval_seconds", static_cast<int64_t>(c.cleanupInterval.count())));
        }
        if (j.contains("tier2")) {
            config.tier2 = remoteFromJson(j.at("tier2"), config.tier2);
        }
        if (j.contains("tier3")) {
            config.tier3 = remoteFromJson(j.at("tier3"), config.tier3);
        }

        config.enableCompression = j.value("enable_compression", config.enableCompression);
        config.compressionLevel = j.value("compression_level", config.compressionLevel);
        config.enableMetrics = j.value("enable_metrics", config.enableMetrics);
        config.batchInvalidationSize = sizeField(j, "batch_invalidation_size", config.batchInvalidationSize);
        config.maxValueSize = sizeField(j, "max_value_size", config.maxValueSize);

        if (j.contains("logging")) {
            const auto& l = j.at("logging");
            config.logging.level = l.value("level", config.logging.level);
            config.logging.logPath = l.value("log_path", config.logging.logPath);
            config.logging.maxLogSize = sizeField(l, "max_log_size", config.logging.maxLogSize);
            config.logging.maxLogFiles = sizeField(l, "max_log_files", config.logging.maxLogFiles);
            config.logging.console = l.value("console", config.logging.console);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Некорректная конфигурация кэша: ") + e.what());
    }

    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация кэша: значения вне допустимого диапазона");
    }
    return config;
}

CacheConfig CacheConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::invalid_argument("Не удалось открыть файл конфигурации: " + path);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument("Ошибка разбора " + path + ": " + e.what());
    }
    return fromJson(j);
}

} // namespace cache
} // namespace tiercache
