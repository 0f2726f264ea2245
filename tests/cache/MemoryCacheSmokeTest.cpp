#include <cassert>
#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include "tiercache/cache/memory/MemoryCache.hpp"
#include "tiercache/codec/Compressor.hpp"
#include "tiercache/util/Ttl.hpp"

using namespace tiercache::cache;
using tiercache::codec::Compressor;
using tiercache::codec::CompressionConfig;

namespace {

// Кадр без сжатия с заданным содержимым
std::vector<uint8_t> frameOf(const std::string& text) {
    CompressionConfig config;
    config.enabled = false;
    std::vector<uint8_t> bytes(text.begin(), text.end());
    return Compressor(config).pack(bytes);
}

MemoryCacheConfig smallConfig(size_t maxEntries) {
    MemoryCacheConfig config;
    config.maxEntries = maxEntries;
    config.defaultTtl = std::chrono::seconds(60);
    return config;
}

} // namespace

void smokeTestMemoryCache() {
    std::cout << "Testing MemoryCache basic operations...\n";

    MemoryCache cache(smallConfig(100));
    assert(cache.size() == 0);
    assert(!cache.get("missing"));

    auto frame = frameOf("value-1");
    assert(cache.set("k1", frame));
    auto value = cache.get("k1");
    assert(value && *value == frame);
    assert(cache.size() == 1);
    assert(cache.totalSizeBytes() == frame.size());

    auto entry = cache.peek("k1");
    assert(entry);
    assert(entry->hitCount == 1);
    assert(entry->expiresAt - entry->createdAt == std::chrono::seconds(60));
    assert(!entry->compressed);

    auto stats = cache.stats();
    assert(stats.hits == 1);
    assert(stats.misses == 1);
    assert(stats.entries == 1);

    // Некорректные записи отклоняются
    assert(!cache.set("", frame));
    assert(!cache.set("bad", {}));
    assert(!cache.set("bad", {0x05, 0x01}));
    assert(cache.size() == 1);

    std::cout << "[OK] MemoryCache smoke test\n";
}

void testMemoryCacheExpiration() {
    std::cout << "Testing MemoryCache expiration...\n";

    MemoryCache cache(smallConfig(100));
    std::vector<std::pair<std::string, EvictionReason>> evicted;
    cache.setEvictionCallback([&](const std::string& key, EvictionReason reason) {
        evicted.emplace_back(key, reason);
    });

    assert(cache.set("short", frameOf("s"), std::chrono::seconds(1)));
    assert(cache.set("long", frameOf("l"), std::chrono::seconds(60)));
    assert(cache.get("short"));

    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    assert(!cache.get("short"));
    assert(cache.get("long"));
    assert(cache.size() == 1);
    assert(cache.stats().expirations == 1);
    assert(evicted.size() == 1);
    assert(evicted[0].first == "short" && evicted[0].second == EvictionReason::Expired);
    assert(cache.verifyIntegrity());

    // ttl <= 0: TTL по умолчанию
    assert(cache.set("default", frameOf("d"), std::chrono::seconds(0)));
    auto entry = cache.peek("default");
    assert(entry && entry->expiresAt - entry->createdAt == std::chrono::seconds(60));

    std::cout << "[OK] MemoryCache expiration test\n";
}

void testMemoryCacheLongTtl() {
    std::cout << "Testing MemoryCache very long TTL...\n";

    MemoryCache cache(smallConfig(10));
    auto frame = frameOf("forever");

    // TTL больше диапазона steady_clock: запись живёт, а не истекает сразу
    assert(cache.set("far", frame, std::chrono::seconds(10000000000LL)));
    assert(cache.cleanupSync() == 0);
    auto value = cache.get("far");
    assert(value && *value == frame);
    auto entry = cache.peek("far");
    assert(entry && entry->expiresAt > entry->createdAt);
    assert(entry->expiresAt - entry->createdAt == tiercache::util::MAX_TTL);
    assert(cache.verifyIntegrity());

    // Насыщение у границы часов
    auto now = Clock::now();
    assert(CacheEntry::expiryAfter(now, std::chrono::seconds::max()) == Clock::time_point::max());
    assert(CacheEntry::expiryAfter(now, std::chrono::seconds(5)) == now + std::chrono::seconds(5));

    MemoryCacheConfig tooLong = smallConfig(10);
    tooLong.defaultTtl = tiercache::util::MAX_TTL + std::chrono::seconds(1);
    assert(!tooLong.validate());
    MemoryCacheConfig tooBig = smallConfig(MemoryCacheConfig::MAX_ENTRIES + 1);
    assert(!tooBig.validate());

    std::cout << "[OK] MemoryCache long TTL test\n";
}

void testMemoryCacheLru() {
    std::cout << "Testing MemoryCache LRU eviction...\n";

    MemoryCache cache(smallConfig(3));
    std::vector<std::string> evicted;
    cache.setEvictionCallback([&](const std::string& key, EvictionReason reason) {
        assert(reason == EvictionReason::Lru);
        evicted.push_back(key);
    });

    cache.set("a", frameOf("1"));
    cache.set("b", frameOf("2"));
    cache.set("c", frameOf("3"));
    // get защищает "a" от вытеснения
    assert(cache.get("a"));
    cache.set("d", frameOf("4"));

    assert(cache.size() == 3);
    assert(!cache.peek("b"));
    assert(evicted.size() == 1 && evicted[0] == "b");
    assert((cache.keysInLruOrder() == std::vector<std::string>{"c", "a", "d"}));
    assert(cache.stats().evictions == 1);

    // Перезапись существующего ключа не вытесняет и делает ключ MRU
    cache.set("c", frameOf("33"));
    assert(cache.size() == 3);
    assert(evicted.size() == 1);
    assert((cache.keysInLruOrder() == std::vector<std::string>{"a", "d", "c"}));
    auto c = cache.get("c");
    assert(c && *c == frameOf("33"));
    assert(cache.verifyIntegrity());

    std::cout << "[OK] MemoryCache LRU test\n";
}

void testMemoryCacheRemoveAndClear() {
    std::cout << "Testing MemoryCache remove/clear...\n";

    MemoryCache cache(smallConfig(100));
    cache.set("eventos:default:user:1", frameOf("u1"));
    cache.set("eventos:default:user:2", frameOf("u2"));
    cache.set("eventos:default:product:1", frameOf("p1"));
    cache.set("eventos:other:user:3", frameOf("u3"));

    assert(cache.remove("eventos:default:user:1"));
    assert(!cache.remove("eventos:default:user:1"));
    assert(cache.size() == 3);

    assert(cache.removeMatching("eventos:default:user:*") == 1);
    assert(cache.removeMatching("eventos:*:user:*") == 1);
    assert(cache.size() == 1);
    assert(cache.peek("eventos:default:product:1"));
    assert(cache.totalSizeBytes() == frameOf("p1").size());
    assert(cache.verifyIntegrity());

    cache.clear();
    assert(cache.size() == 0);
    assert(cache.totalSizeBytes() == 0);
    assert(cache.keysInLruOrder().empty());
    assert(cache.verifyIntegrity());

    std::cout << "[OK] MemoryCache remove/clear test\n";
}

void testMemoryCacheCompression() {
    std::cout << "Testing MemoryCache compression...\n";

    MemoryCacheConfig config = smallConfig(10);
    config.compressionThreshold = 64;
    MemoryCache cache(config);

    std::string text(2000, 'x');
    auto raw = frameOf(text);
    assert(cache.set("big", raw));
    auto entry = cache.peek("big");
    assert(entry && entry->compressed);
    assert(entry->sizeBytes < raw.size());

    auto stored = cache.get("big");
    assert(stored && Compressor::isCompressed(*stored));
    auto unpacked = Compressor().unpack(*stored);
    assert(std::string(unpacked.begin(), unpacked.end()) == text);

    // Ниже порога: без сжатия
    assert(cache.set("small", frameOf("tiny")));
    assert(!cache.peek("small")->compressed);

    std::cout << "[OK] MemoryCache compression test\n";
}

void testMemoryCacheIntegrityUnderChurn() {
    std::cout << "Testing MemoryCache integrity under churn...\n";

    MemoryCache cache(smallConfig(50));
    std::mt19937 rng(1234);
    for (int i = 0; i < 5000; ++i) {
        std::string key = "key_" + std::to_string(rng() % 120);
        switch (rng() % 4) {
        case 0:
        case 1:
            cache.set(key, frameOf(std::to_string(i)), std::chrono::seconds(1 + rng() % 30));
            break;
        case 2:
            cache.get(key);
            break;
        default:
            cache.remove(key);
            break;
        }
        assert(cache.size() <= 50);
    }
    assert(cache.verifyIntegrity());

    std::cout << "[OK] MemoryCache integrity test\n";
}

void testMemoryCacheConcurrentAccess() {
    std::cout << "Testing MemoryCache concurrent access...\n";

    MemoryCache cache(smallConfig(200));
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 1000; ++i) {
                std::string key = "t" + std::to_string(t) + "_" + std::to_string(i % 100);
                cache.set(key, frameOf(key));
                auto value = cache.get(key);
                if (value) {
                    assert(*value == frameOf(key));
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    assert(cache.size() <= 200);
    assert(cache.verifyIntegrity());

    std::cout << "[OK] MemoryCache concurrent access test\n";
}

void testMemoryCacheBackgroundCleanup() {
    std::cout << "Testing MemoryCache background cleanup...\n";

    MemoryCacheConfig config = smallConfig(100);
    config.cleanupInterval = std::chrono::seconds(1);
    MemoryCache cache(config);

    cache.set("a", frameOf("1"), std::chrono::seconds(1));
    cache.set("b", frameOf("2"), std::chrono::seconds(1));
    assert(cache.size() == 2);

    std::this_thread::sleep_for(std::chrono::milliseconds(2600));
    // size() не выполняет очистку: записи удалены фоновым потоком
    assert(cache.size() == 0);
    assert(cache.stats().expirations == 2);

    std::cout << "[OK] MemoryCache background cleanup test\n";
}

int main() {
    try {
        smokeTestMemoryCache();
        testMemoryCacheExpiration();
        testMemoryCacheLongTtl();
        testMemoryCacheLru();
        testMemoryCacheRemoveAndClear();
        testMemoryCacheCompression();
        testMemoryCacheIntegrityUnderChurn();
        testMemoryCacheConcurrentAccess();
        testMemoryCacheBackgroundCleanup();
        std::cout << "All MemoryCache tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "MemoryCache test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
