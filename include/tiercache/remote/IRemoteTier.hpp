#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tiercache {
namespace remote {

// Исход операции удалённого уровня: ошибки не бросаются, а возвращаются
enum class Outcome {
    Ok,    // Успех (для get: попадание)
    Miss,  // Ключ отсутствует
    Error  // Сеть, таймаут, исчерпан пул, ошибка сервера
};

template<typename T>
struct RemoteResult {
    Outcome outcome = Outcome::Error;
    T value{};
    std::string error;

    bool ok() const { return outcome == Outcome::Ok; }
    bool miss() const { return outcome == Outcome::Miss; }
    bool failed() const { return outcome == Outcome::Error; }

    static RemoteResult success(T v) { return RemoteResult{Outcome::Ok, std::move(v), {}}; }
    static RemoteResult notFound() { return RemoteResult{Outcome::Miss, T{}, {}}; }
    static RemoteResult failure(std::string message) { return RemoteResult{Outcome::Error, T{}, std::move(message)}; }
};

// Страница SCAN: следующий курсор (0 = обход завершён) и найденные ключи
struct ScanPage {
    uint64_t cursor = 0;
    std::vector<std::string> keys;
};

// Телеметрия сервера (INFO)
struct RemoteTierInfo {
    uint64_t usedMemory = 0;
    uint64_t usedMemoryPeak = 0;
    uint64_t connectedClients = 0;
    uint64_t opsPerSec = 0;
};

// IRemoteTier: клиент удалённого key-value уровня (GET/SETEX/DEL/SCAN/INFO).
// Реализации потокобезопасны; каждый вызов ограничен таймаутом.
class IRemoteTier {
public:
    virtual ~IRemoteTier() = default;
    virtual std::string name() const = 0;
    virtual bool connect() = 0; // Подключение и проверка (PING)
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;
    virtual RemoteResult<std::vector<uint8_t>> get(const std::string& key) = 0;
    virtual RemoteResult<bool> setEx(const std::string& key, std::chrono::seconds ttl,
                                     const std::vector<uint8_t>& payload) = 0;
    virtual RemoteResult<size_t> del(const std::vector<std::string>& keys) = 0; // Кол-во удалённых
    virtual RemoteResult<ScanPage> scan(uint64_t cursor, const std::string& pattern, size_t count) = 0;
    virtual RemoteResult<RemoteTierInfo> info() = 0;
};

} // namespace remote
} // namespace tiercache
