#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include "tiercache/util/Ttl.hpp"

namespace tiercache {
namespace remote {

// RemoteTierConfig: параметры подключения удалённого уровня (L2/L3)
struct RemoteTierConfig {
    static constexpr size_t MAX_CONNECTIONS = 10000;          // Верхняя граница размера пула
    bool enabled = true;                                      // Уровень включён
    std::string host = "127.0.0.1";                           // Хост
    int port = 6379;                                          // Порт
    int database = 0;                                         // Индекс БД (SELECT)
    std::chrono::seconds defaultTtl = std::chrono::seconds(1800); // TTL по умолчанию
    size_t maxConnections = 100;                              // Размер пула
    std::chrono::milliseconds connectTimeout{200};            // Таймаут подключения
    std::chrono::milliseconds commandTimeout{100};            // Таймаут команды
    std::chrono::milliseconds acquireTimeout{50};             // Ожидание свободного соединения
    bool validate() const {
        return !host.empty() && port > 0 && port <= 65535 && database >= 0 &&
               defaultTtl.count() > 0 && defaultTtl <= util::MAX_TTL &&
               maxConnections > 0 && maxConnections <= MAX_CONNECTIONS &&
               connectTimeout.count() > 0 && commandTimeout.count() > 0 &&
               acquireTimeout.count() >= 0;
    }
};

} // namespace remote
} // namespace tiercache
