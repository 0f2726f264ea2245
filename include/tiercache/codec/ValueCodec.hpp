#pragma once

#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>
#include "tiercache/codec/Compressor.hpp"

namespace tiercache {
namespace codec {

// ValueCodec: значение -> MessagePack -> кадр Compressor и обратно.
// decode(encode(v)) == v для любого значения, сжатого или нет.
class ValueCodec {
public:
    explicit ValueCodec(const CompressionConfig& config = CompressionConfig{});

    std::vector<uint8_t> encode(const nlohmann::json& value) const; // CodecError при ошибке
    nlohmann::json decode(const std::vector<uint8_t>& frame) const; // CodecError при повреждении

    const Compressor& compressor() const { return compressor_; }

private:
    Compressor compressor_;
};

} // namespace codec
} // namespace tiercache
