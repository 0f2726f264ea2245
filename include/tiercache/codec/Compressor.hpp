#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace tiercache {
namespace codec {

// CodecError: повреждённый кадр или ошибка (де)сериализации
class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& what) : std::runtime_error(what) {}
};

// Тег кадра: первый байт полезной нагрузки
enum class FrameTag : uint8_t {
    Raw = 0x00,  // Без сжатия
    Zlib = 0x01  // zlib, далее 4 байта исходной длины (big-endian)
};

// CompressionConfig: параметры сжатия
struct CompressionConfig {
    bool enabled = true;        // Сжатие включено
    int level = 3;              // Уровень zlib (1..9)
    size_t threshold = 1024;    // Сжимать только данные больше порога
    size_t maxDecodedSize = 64 * 1024 * 1024; // Макс. длина данных в кадре (64 MB)
    bool validate() const { return level >= 1 && level <= 9 && maxDecodedSize > 0; }
};

// Compressor: упаковка байтов в тегированный кадр.
// Сжатие применяется, только если длина данных больше порога и сжатый кадр
// короче исходного; иначе данные хранятся как есть с тегом Raw.
class Compressor {
public:
    static constexpr size_t ZLIB_HEADER_SIZE = 1 + 4;

    explicit Compressor(const CompressionConfig& config = CompressionConfig{});

    std::vector<uint8_t> pack(const std::vector<uint8_t>& data) const; // Упаковать
    std::vector<uint8_t> unpack(const std::vector<uint8_t>& frame) const; // Распаковать (CodecError)

    // Перепаковать Raw-кадр, если он стал больше порога; иначе кадр без изменений
    std::vector<uint8_t> repack(std::vector<uint8_t> frame) const;

    static bool isCompressed(const std::vector<uint8_t>& frame); // Кадр сжат?
    static bool isFrame(const std::vector<uint8_t>& frame); // Похоже на кадр?

    const CompressionConfig& config() const { return config_; }

private:
    std::vector<uint8_t> rawFrame(const std::vector<uint8_t>& data) const;
    CompressionConfig config_;
};

} // namespace codec
} // namespace tiercache
