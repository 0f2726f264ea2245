#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace tiercache {
namespace util {

// LoggingConfig: параметры логирования (уровень, файл, ротация, консоль)
struct LoggingConfig {
    std::string level = "info";                  // trace/debug/info/warn/error/critical/off
    std::string logPath = "logs/tiercache.log";  // Файл (пусто = без файла)
    size_t maxLogSize = 1024 * 1024 * 5;         // Размер файла до ротации
    size_t maxLogFiles = 2;                      // Кол-во файлов ротации
    bool console = true;                         // Вывод в консоль
    bool validate() const;
};

// Имя основного логгера библиотеки
constexpr const char* LOGGER_NAME = "tiercache";

// Создаёт и регистрирует логгер tiercache, делает его логгером по умолчанию.
// Повторный вызов пересоздаёт логгер с новыми параметрами.
// Бросает spdlog::spdlog_ex, если файл лога не удаётся открыть.
void initializeLogging(const LoggingConfig& config);

// Логгер tiercache; если initializeLogging не вызывался: логгер по умолчанию
std::shared_ptr<spdlog::logger> getLogger();

} // namespace util
} // namespace tiercache
