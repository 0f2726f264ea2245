#include "tiercache/util/Logging.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <vector>

namespace tiercache {
namespace util {

bool LoggingConfig::validate() const {
    if (spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
        return false;
    }
    if (!logPath.empty() && (maxLogSize == 0 || maxLogFiles == 0)) {
        return false;
    }
    return true;
}

void initializeLogging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        sinks.push_back(console_sink);
    }

    if (!config.logPath.empty()) {
        // Создаем директорию для логов, если её нет
        auto parent = std::filesystem::path(config.logPath).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.logPath, config.maxLogSize, config.maxLogFiles);
        rotating_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(rotating_sink);
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.level));
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    logger->info("Логирование инициализировано: level={}, file='{}'", config.level, config.logPath);
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (auto logger = spdlog::get(LOGGER_NAME)) {
        return logger;
    }
    return spdlog::default_logger();
}

} // namespace util
} // namespace tiercache
