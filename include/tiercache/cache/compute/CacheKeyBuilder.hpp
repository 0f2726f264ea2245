#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace tiercache {
namespace cache {

// Построитель ключа для lookup-or-compute: операция + аргументы (name=value,
// отсортированы по имени) -> SHA-256, 64 hex-символа в нижнем регистре.
// Порядок добавления аргументов не влияет на результат.
class CacheKeyBuilder {
public:
    explicit CacheKeyBuilder(std::string operation);

    CacheKeyBuilder& arg(const std::string& name, const nlohmann::json& value); // Повторное имя перезаписывает значение
    std::string canonical() const; // "operation:a=1:b=\"x\""
    std::string build() const;     // SHA-256 от canonical()

    static std::string sha256Hex(const std::string& data);

private:
    std::string operation_;
    std::map<std::string, std::string> args_;
};

} // namespace cache
} // namespace tiercache
