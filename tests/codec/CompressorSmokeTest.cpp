#include <cassert>
#include <iostream>
#include <random>
#include <stdexcept>
#include <vector>
#include "tiercache/codec/Compressor.hpp"

using namespace tiercache::codec;

void smokeTestCompressor() {
    std::cout << "Testing Compressor basic operations...\n";

    Compressor compressor;
    std::vector<uint8_t> small = {1, 2, 3, 4, 5};
    auto frame = compressor.pack(small);
    assert(frame.size() == small.size() + 1);
    assert(frame[0] == static_cast<uint8_t>(FrameTag::Raw));
    assert(!Compressor::isCompressed(frame));
    assert(Compressor::isFrame(frame));
    assert(compressor.unpack(frame) == small);

    // Пустые данные: тоже корректный кадр
    auto empty = compressor.pack({});
    assert(empty.size() == 1);
    assert(compressor.unpack(empty).empty());

    std::cout << "[OK] Compressor smoke test\n";
}

void testCompressorThreshold() {
    std::cout << "Testing Compressor threshold...\n";

    CompressionConfig config;
    config.threshold = 64;
    Compressor compressor(config);

    std::vector<uint8_t> atThreshold(64, 'a');
    assert(!Compressor::isCompressed(compressor.pack(atThreshold)));

    std::vector<uint8_t> aboveThreshold(4096, 'a');
    auto frame = compressor.pack(aboveThreshold);
    assert(Compressor::isCompressed(frame));
    assert(frame.size() < aboveThreshold.size());
    assert(compressor.unpack(frame) == aboveThreshold);

    // Сжатие выключено
    config.enabled = false;
    Compressor disabled(config);
    auto raw = disabled.pack(aboveThreshold);
    assert(!Compressor::isCompressed(raw));
    assert(raw.size() == aboveThreshold.size() + 1);

    std::cout << "[OK] Compressor threshold test\n";
}

void testCompressorIncompressible() {
    std::cout << "Testing Compressor incompressible data...\n";

    Compressor compressor;
    std::mt19937 rng(42);
    std::vector<uint8_t> noise(8192);
    for (auto& b : noise) {
        b = static_cast<uint8_t>(rng() & 0xFF);
    }
    auto frame = compressor.pack(noise);
    // Случайные байты не сжимаются: храним без сжатия
    assert(!Compressor::isCompressed(frame));
    assert(compressor.unpack(frame) == noise);

    std::cout << "[OK] Compressor incompressible test\n";
}

void testCompressorRepack() {
    std::cout << "Testing Compressor repack...\n";

    CompressionConfig noCompression;
    noCompression.enabled = false;
    Compressor raw(noCompression);

    CompressionConfig config;
    config.threshold = 128;
    Compressor compressor(config);

    std::vector<uint8_t> data(2048, 'z');
    auto rawFrame = raw.pack(data);
    auto repacked = compressor.repack(rawFrame);
    assert(Compressor::isCompressed(repacked));
    assert(compressor.unpack(repacked) == data);

    // Сжатый кадр не трогаем
    assert(compressor.repack(repacked) == repacked);

    // Кадр ниже порога не трогаем
    std::vector<uint8_t> small(16, 'z');
    auto smallFrame = raw.pack(small);
    assert(compressor.repack(smallFrame) == smallFrame);

    std::cout << "[OK] Compressor repack test\n";
}

void testCompressorCorruption() {
    std::cout << "Testing Compressor corruption handling...\n";

    Compressor compressor;
    auto expectError = [&](const std::vector<uint8_t>& frame) {
        bool thrown = false;
        try {
            compressor.unpack(frame);
        } catch (const CodecError&) {
            thrown = true;
        }
        assert(thrown);
    };

    expectError({});
    expectError({0x7F, 1, 2, 3});         // Неизвестный тег
    expectError({0x01, 0, 0});            // Усечённый заголовок
    expectError({0x01, 0, 0, 0, 0, 1});   // Нулевая длина
    expectError({0x01, 0x7F, 0xFF, 0xFF, 0xFF, 1, 2}); // Невозможная длина

    std::vector<uint8_t> data(4096, 'q');
    auto frame = compressor.pack(data);
    assert(Compressor::isCompressed(frame));
    auto damaged = frame;
    damaged.resize(damaged.size() / 2);
    expectError(damaged);

    // Неверная длина в заголовке
    auto wrongLength = frame;
    wrongLength[4] ^= 0x01;
    expectError(wrongLength);

    // Длина в заголовке больше предела: отказ до выделения памяти
    CompressionConfig capped;
    capped.maxDecodedSize = 1024;
    Compressor small(capped);
    bool capThrown = false;
    try {
        small.unpack({0x01, 0x00, 0x00, 0x07, 0xD0, 0x78, 0x9C, 1, 2, 3});
    } catch (const CodecError&) {
        capThrown = true;
    }
    assert(capThrown);

    std::vector<uint8_t> huge(70000, 0xAB);
    huge[0] = 0x01;
    huge[1] = 0x04;
    huge[2] = 0x00;
    huge[3] = 0x00;
    huge[4] = 0x01; // 64 MB + 1
    expectError(huge);

    assert(!Compressor::isFrame({}));
    assert(!Compressor::isFrame({0x05, 1}));

    bool invalid = false;
    try {
        CompressionConfig bad;
        bad.level = 12;
        Compressor broken(bad);
    } catch (const std::invalid_argument&) {
        invalid = true;
    }
    assert(invalid);

    invalid = false;
    try {
        CompressionConfig bad;
        bad.maxDecodedSize = 0;
        Compressor broken(bad);
    } catch (const std::invalid_argument&) {
        invalid = true;
    }
    assert(invalid);

    std::cout << "[OK] Compressor corruption test\n";
}

int main() {
    try {
        smokeTestCompressor();
        testCompressorThreshold();
        testCompressorIncompressible();
        testCompressorRepack();
        testCompressorCorruption();
        std::cout << "All Compressor tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Compressor test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
