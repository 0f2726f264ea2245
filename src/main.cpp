#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "tiercache/cache/CacheConfig.hpp"
#include "tiercache/cache/manager/CacheManager.hpp"
#include "tiercache/util/Logging.hpp"

using namespace tiercache;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config file.json] <command> [args]\n"
              << "Commands:\n"
              << "  get <namespace> <key>\n"
              << "  set <namespace> <key> <json> [ttl_seconds]\n"
              << "  del <namespace> <key>\n"
              << "  invalidate <namespace> <pattern>\n"
              << "  stats\n";
}

// Выполнить команду, вернуть код выхода
int runCommand(cache::CacheManager& manager, const std::vector<std::string>& args) {
    const std::string& command = args[0];

    if (command == "get" && args.size() == 3) {
        auto value = manager.get(args[2], args[1]);
        if (!value) {
            std::cout << "(nil)" << std::endl;
            return 1;
        }
        std::cout << value->dump() << std::endl;
        return 0;
    }

    if (command == "set" && (args.size() == 4 || args.size() == 5)) {
        nlohmann::json value;
        try {
            value = nlohmann::json::parse(args[3]);
        } catch (const nlohmann::json::exception& e) {
            spdlog::error("Некорректный JSON значения: {}", e.what());
            return 2;
        }
        std::optional<std::chrono::seconds> ttl;
        if (args.size() == 5) {
            try {
                ttl = std::chrono::seconds(std::stol(args[4]));
            } catch (const std::exception& e) {
                spdlog::error("Некорректный ttl '{}': {}", args[4], e.what());
                return 2;
            }
        }
        bool ok = manager.set(args[2], value, ttl, args[1]);
        std::cout << (ok ? "OK" : "FAILED") << std::endl;
        return ok ? 0 : 1;
    }

    if (command == "del" && args.size() == 3) {
        bool ok = manager.remove(args[2], args[1]);
        std::cout << (ok ? "OK" : "FAILED") << std::endl;
        return ok ? 0 : 1;
    }

    if (command == "invalidate" && args.size() == 3) {
        std::cout << manager.invalidatePattern(args[2], args[1]) << std::endl;
        return 0;
    }

    if (command == "stats" && args.size() == 1) {
        std::cout << manager.getStats().toJson().dump(2) << std::endl;
        return 0;
    }

    return 2;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }
    if (args.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    cache::CacheConfig config;
    try {
        if (!configPath.empty()) {
            config = cache::CacheConfig::loadFromFile(configPath);
        }
        util::initializeLogging(config.logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 1;
    }

    int rc = 1;
    try {
        cache::CacheManager manager(config);
        if (!manager.initialize()) {
            spdlog::critical("Не удалось инициализировать CacheManager");
            return 1;
        }
        rc = runCommand(manager, args);
        if (rc == 2) {
            printUsage(argv[0]);
        }
        manager.close();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        rc = 1;
    }

    spdlog::shutdown();
    return rc;
}
