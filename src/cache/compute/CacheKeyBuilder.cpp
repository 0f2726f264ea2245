#include "tiercache/cache/compute/CacheKeyBuilder.hpp"
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>

namespace tiercache {
namespace cache {

CacheKeyBuilder::CacheKeyBuilder(std::string operation) : operation_(std::move(operation)) {}

CacheKeyBuilder& CacheKeyBuilder::arg(const std::string& name, const nlohmann::json& value) {
    // dump() сортирует ключи объектов, поэтому представление детерминировано
    args_[name] = value.dump();
    return *this;
}

std::string CacheKeyBuilder::canonical() const {
    std::string result = operation_;
    for (const auto& [name, value] : args_) {
        result += ':';
        result += name;
        result += '=';
        result += value;
    }
    return result;
}

std::string CacheKeyBuilder::build() const {
    return sha256Hex(canonical());
}

std::string CacheKeyBuilder::sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace cache
} // namespace tiercache
