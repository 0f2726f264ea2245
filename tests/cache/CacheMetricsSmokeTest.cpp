#include <cassert>
#include <chrono>
#include <iostream>
#include "tiercache/cache/metrics/CacheMetrics.hpp"

using namespace tiercache::cache;

void smokeTestCacheMetrics() {
    std::cout << "Testing CacheMetrics counters...\n";

    CacheMetrics metrics;
    metrics.recordHit("L1", "user");
    metrics.recordHit("L1", "user");
    metrics.recordHit("L2", "event");
    metrics.recordMiss("L1", "query");
    metrics.recordEviction("L1", "lru");
    metrics.setMemoryUsage("L1", 4096);
    metrics.setMemoryUsage("L1", 2048);
    metrics.recordInvalidation("user:*", 3);
    metrics.recordInvalidation("user:*", 2);

    assert(metrics.hits("L1", "user") == 2);
    assert(metrics.hits("L2", "event") == 1);
    assert(metrics.hits("L3", "user") == 0);
    assert(metrics.misses("L1", "query") == 1);
    assert(metrics.evictions("L1", "lru") == 1);
    assert(metrics.memoryUsage("L1") == 2048);
    assert(metrics.invalidations("user:*") == 5);

    auto json = metrics.toJson();
    assert(json["enabled"] == true);
    assert(json["cache_hits_total"].size() == 2);
    assert(json["cache_memory_usage_bytes"]["L1"] == 2048);
    assert(json["cache_invalidations_total"]["user:*"] == 5);

    std::cout << "[OK] CacheMetrics smoke test\n";
}

void testCacheMetricsHistogram() {
    std::cout << "Testing CacheMetrics duration histogram...\n";

    CacheMetrics metrics;
    metrics.observeDuration("get", "L1", std::chrono::microseconds(50));
    metrics.observeDuration("get", "L1", std::chrono::milliseconds(3));
    metrics.observeDuration("get", "L1", std::chrono::seconds(2));

    auto histogram = metrics.duration("get", "L1");
    assert(histogram);
    assert(histogram->count == 3);
    assert(histogram->bounds.size() == histogram->counts.size());
    assert(histogram->bounds.front() == 0.0001);
    assert(histogram->bounds.back() == 1.0);
    // Бакеты накопительные: 50 μs попадает во все, 2 s: ни в один
    assert(histogram->counts.front() == 1);
    assert(histogram->counts.back() == 2);
    assert(histogram->sum > 2.0);
    assert(!metrics.duration("set", "L1"));

    std::cout << "[OK] CacheMetrics histogram test\n";
}

void testCacheMetricsDisabled() {
    std::cout << "Testing CacheMetrics disabled...\n";

    CacheMetrics metrics(false);
    metrics.recordHit("L1", "user");
    metrics.observeDuration("get", "L1", std::chrono::milliseconds(1));
    assert(metrics.hits("L1", "user") == 0);
    assert(!metrics.duration("get", "L1"));
    assert(metrics.toJson()["enabled"] == false);

    std::cout << "[OK] CacheMetrics disabled test\n";
}

void testCacheMetricsKeyClassification() {
    std::cout << "Testing CacheMetrics key classification...\n";

    assert(CacheMetrics::classifyKey("user:42") == "user");
    assert(CacheMetrics::classifyKey("event:summer") == "event");
    assert(CacheMetrics::classifyKey("product:9") == "product");
    assert(CacheMetrics::classifyKey("query:abc") == "query");
    assert(CacheMetrics::classifyKey("users:1") == "other");
    assert(CacheMetrics::classifyKey("session") == "other");

    std::cout << "[OK] CacheMetrics key classification test\n";
}

int main() {
    try {
        smokeTestCacheMetrics();
        testCacheMetricsHistogram();
        testCacheMetricsDisabled();
        testCacheMetricsKeyClassification();
        std::cout << "All CacheMetrics tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "CacheMetrics test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
