#include "tiercache/codec/Compressor.hpp"
#include <zlib.h>
#include <limits>

namespace tiercache {
namespace codec {

Compressor::Compressor(const CompressionConfig& config) : config_(config) {
    if (!config_.validate()) {
        throw std::invalid_argument("Некорректная конфигурация сжатия: level=" + std::to_string(config_.level) +
                                    ", maxDecodedSize=" + std::to_string(config_.maxDecodedSize));
    }
}

std::vector<uint8_t> Compressor::rawFrame(const std::vector<uint8_t>& data) const {
    std::vector<uint8_t> frame;
    frame.reserve(data.size() + 1);
    frame.push_back(static_cast<uint8_t>(FrameTag::Raw));
    frame.insert(frame.end(), data.begin(), data.end());
    return frame;
}

std::vector<uint8_t> Compressor::pack(const std::vector<uint8_t>& data) const {
    if (!config_.enabled || data.size() <= config_.threshold ||
        data.size() > std::numeric_limits<uint32_t>::max()) {
        return rawFrame(data);
    }

    uLongf bound = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> frame(ZLIB_HEADER_SIZE + bound);
    int rc = compress2(frame.data() + ZLIB_HEADER_SIZE, &bound,
                       data.data(), static_cast<uLong>(data.size()), config_.level);
    if (rc != Z_OK) {
        // Сжатие не удалось: храним исходные байты
        return rawFrame(data);
    }
    frame.resize(ZLIB_HEADER_SIZE + bound);
    if (frame.size() >= data.size() + 1) {
        return rawFrame(data);
    }

    auto length = static_cast<uint32_t>(data.size());
    frame[0] = static_cast<uint8_t>(FrameTag::Zlib);
    frame[1] = static_cast<uint8_t>((length >> 24) & 0xFF);
    frame[2] = static_cast<uint8_t>((length >> 16) & 0xFF);
    frame[3] = static_cast<uint8_t>((length >> 8) & 0xFF);
    frame[4] = static_cast<uint8_t>(length & 0xFF);
    return frame;
}

std::vector<uint8_t> Compressor::unpack(const std::vector<uint8_t>& frame) const {
    if (frame.empty()) {
        throw CodecError("пустой кадр");
    }
    switch (static_cast<FrameTag>(frame[0])) {
    case FrameTag::Raw:
        return std::vector<uint8_t>(frame.begin() + 1, frame.end());
    case FrameTag::Zlib: {
        if (frame.size() < ZLIB_HEADER_SIZE) {
            throw CodecError("усечённый заголовок zlib-кадра");
        }
        uint32_t length = (static_cast<uint32_t>(frame[1]) << 24) |
                          (static_cast<uint32_t>(frame[2]) << 16) |
                          (static_cast<uint32_t>(frame[3]) << 8) |
                          static_cast<uint32_t>(frame[4]);
        // deflate не сжимает сильнее ~1032:1
        if (length == 0 || length / 1032 > frame.size()) {
            throw CodecError("недопустимая длина в заголовке zlib-кадра");
        }
        if (length > config_.maxDecodedSize) {
            throw CodecError("длина в заголовке zlib-кадра превышает предел: " + std::to_string(length));
        }
        std::vector<uint8_t> data(length);
        uLongf destLen = length;
        int rc = uncompress(data.data(), &destLen,
                            frame.data() + ZLIB_HEADER_SIZE,
                            static_cast<uLong>(frame.size() - ZLIB_HEADER_SIZE));
        if (rc != Z_OK) {
            throw CodecError("ошибка распаковки zlib: код " + std::to_string(rc));
        }
        if (destLen != length) {
            throw CodecError("длина после распаковки не совпадает с заголовком");
        }
        return data;
    }
    default:
        throw CodecError("неизвестный тег кадра: " + std::to_string(frame[0]));
    }
}

std::vector<uint8_t> Compressor::repack(std::vector<uint8_t> frame) const {
    if (!config_.enabled || frame.empty() ||
        frame[0] != static_cast<uint8_t>(FrameTag::Raw) ||
        frame.size() - 1 <= config_.threshold) {
        return frame;
    }
    std::vector<uint8_t> body(frame.begin() + 1, frame.end());
    return pack(body);
}

bool Compressor::isCompressed(const std::vector<uint8_t>& frame) {
    return !frame.empty() && frame[0] == static_cast<uint8_t>(FrameTag::Zlib);
}

bool Compressor::isFrame(const std::vector<uint8_t>& frame) {
    if (frame.empty()) return false;
    if (frame[0] == static_cast<uint8_t>(FrameTag::Raw)) return true;
    return frame[0] == static_cast<uint8_t>(FrameTag::Zlib) && frame.size() >= ZLIB_HEADER_SIZE;
}

} // namespace codec
} // namespace tiercache
