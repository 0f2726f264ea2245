#include "tiercache/codec/ValueCodec.hpp"

namespace tiercache {
namespace codec {

ValueCodec::ValueCodec(const CompressionConfig& config) : compressor_(config) {}

std::vector<uint8_t> ValueCodec::encode(const nlohmann::json& value) const {
    if (value.is_discarded()) {
        throw CodecError("значение не может быть сериализовано (discarded)");
    }
    std::vector<uint8_t> serialized;
    try {
        serialized = nlohmann::json::to_msgpack(value);
    } catch (const nlohmann::json::exception& e) {
        throw CodecError(std::string("ошибка сериализации MessagePack: ") + e.what());
    }
    if (serialized.size() > compressor_.config().maxDecodedSize) {
        throw CodecError("значение больше предела распаковки: " + std::to_string(serialized.size()) + " байт");
    }
    return compressor_.pack(serialized);
}

nlohmann::json ValueCodec::decode(const std::vector<uint8_t>& frame) const {
    auto serialized = compressor_.unpack(frame);
    try {
        return nlohmann::json::from_msgpack(serialized);
    } catch (const nlohmann::json::exception& e) {
        throw CodecError(std::string("ошибка десериализации MessagePack: ") + e.what());
    }
}

} // namespace codec
} // namespace tiercache
