#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "tiercache/cache/CacheConfig.hpp"

using namespace tiercache::cache;

namespace {

bool throwsInvalid(const nlohmann::json& j) {
    try {
        CacheConfig::fromJson(j);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

} // namespace

void smokeTestCacheConfigDefaults() {
    std::cout << "Testing CacheConfig defaults...\n";

    CacheConfig config;
    assert(config.validate());
    assert(config.keyPrefix == "eventos");
    assert(config.tier1.maxEntries == 10000);
    assert(config.tier1.defaultTtl == std::chrono::seconds(300));
    assert(config.tier1.compressionThreshold == 1024);
    assert(config.tier2.port == 6379 && config.tier2.database == 0);
    assert(config.tier2.defaultTtl == std::chrono::seconds(1800));
    assert(config.tier2.maxConnections == 100);
    assert(config.tier3.database == 1);
    assert(config.tier3.defaultTtl == std::chrono::seconds(3600));
    assert(config.tier3.maxConnections == 50);
    assert(config.compressionLevel == 3);
    assert(config.batchInvalidationSize == 1000);

    std::cout << "[OK] CacheConfig defaults test\n";
}

void testCacheConfigFromJson() {
    std::cout << "Testing CacheConfig fromJson...\n";

    nlohmann::json j = {
        {"key_prefix", "tickets"},
        {"tier1", {{"max_entries", 500}, {"default_ttl_seconds", 30}}},
        {"tier2", {{"host", "cache.local"}, {"port", 6380}, {"command_timeout_ms", 250}}},
        {"tier3", {{"enabled", false}}},
        {"enable_compression", false},
        {"logging", {{"level", "debug"}, {"console", false}}}
    };
    auto config = CacheConfig::fromJson(j);
    assert(config.keyPrefix == "tickets");
    assert(config.tier1.maxEntries == 500);
    assert(config.tier1.defaultTtl == std::chrono::seconds(30));
    assert(config.tier1.compressionThreshold == 1024);
    assert(config.tier2.host == "cache.local");
    assert(config.tier2.port == 6380);
    assert(config.tier2.commandTimeout == std::chrono::milliseconds(250));
    assert(config.tier2.connectTimeout == std::chrono::milliseconds(200));
    assert(!config.tier3.enabled);
    assert(config.tier3.database == 1);
    assert(!config.enableCompression);
    assert(config.logging.level == "debug");
    assert(!config.logging.console);

    // toJson -> fromJson сохраняет значения
    auto again = CacheConfig::fromJson(config.toJson());
    assert(again.toJson() == config.toJson());

    std::cout << "[OK] CacheConfig fromJson test\n";
}

void testCacheConfigValidation() {
    std::cout << "Testing CacheConfig validation...\n";

    assert(throwsInvalid(nlohmann::json::array()));
    assert(throwsInvalid({{"key_prefix", ""}}));
    assert(throwsInvalid({{"tier1", {{"max_entries", 0}}}}));
    assert(throwsInvalid({{"tier2", {{"port", 70000}}}}));
    assert(throwsInvalid({{"compression_level", 0}}));
    assert(throwsInvalid({{"batch_invalidation_size", 0}}));
    assert(throwsInvalid({{"logging", {{"level", "loud"}}}}));
    assert(throwsInvalid({{"tier1", {{"max_entries", "many"}}}}));

    // Отрицательные размеры не превращаются в огромные size_t
    assert(throwsInvalid({{"tier1", {{"max_entries", -1}}}}));
    assert(throwsInvalid({{"tier1", {{"compression_threshold", -1}}}}));
    assert(throwsInvalid({{"tier2", {{"max_connections", -5}}}}));
    assert(throwsInvalid({{"tier3", {{"max_connections", -1}}}}));
    assert(throwsInvalid({{"batch_invalidation_size", -1}}));
    assert(throwsInvalid({{"max_value_size", -1}}));
    assert(throwsInvalid({{"logging", {{"max_log_files", -2}}}}));
    assert(throwsInvalid({{"tier1", {{"max_entries", 2.5}}}}));

    // Верхние границы
    assert(throwsInvalid(nlohmann::json::parse(R"({"tier1": {"max_entries": 18446744073709551615}})")));
    assert(throwsInvalid({{"batch_invalidation_size", 1000000000}}));
    assert(throwsInvalid({{"tier2", {{"max_connections", 1000000}}}}));
    assert(throwsInvalid({{"tier1", {{"default_ttl_seconds", 10000000000LL}}}}));
    assert(throwsInvalid({{"tier2", {{"default_ttl_seconds", 10000000000LL}}}}));

    // Неотрицательные значения из файла (unsigned) принимаются
    auto parsed = CacheConfig::fromJson(nlohmann::json::parse(
        R"({"tier1": {"max_entries": 42, "compression_threshold": 0}, "batch_invalidation_size": 7})"));
    assert(parsed.tier1.maxEntries == 42);
    assert(parsed.tier1.compressionThreshold == 0);
    assert(parsed.batchInvalidationSize == 7);

    // Отключённый уровень не проверяется
    assert(!throwsInvalid({{"tier3", {{"enabled", false}, {"port", 0}}}}));

    CacheConfig config;
    config.tier2.commandTimeout = std::chrono::milliseconds(0);
    assert(!config.validate());

    std::cout << "[OK] CacheConfig validation test\n";
}

void testCacheConfigLoadFromFile() {
    std::cout << "Testing CacheConfig loadFromFile...\n";

    const std::string path = "tiercache_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"key_prefix": "fromfile", "tier2": {"database": 4}})";
    }
    auto config = CacheConfig::loadFromFile(path);
    assert(config.keyPrefix == "fromfile");
    assert(config.tier2.database == 4);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    bool thrown = false;
    try {
        CacheConfig::loadFromFile(path);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::remove(path.c_str());

    thrown = false;
    try {
        CacheConfig::loadFromFile("does/not/exist.json");
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "[OK] CacheConfig loadFromFile test\n";
}

int main() {
    try {
        smokeTestCacheConfigDefaults();
        testCacheConfigFromJson();
        testCacheConfigValidation();
        testCacheConfigLoadFromFile();
        std::cout << "All CacheConfig tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "CacheConfig test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
