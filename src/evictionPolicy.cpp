#include "evictionPolicy.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cmath>

EvictionPolicy::EvictionPolicy(size_t capacity, double fraction)
    : capacity(capacity), fraction(fraction) {}

size_t EvictionPolicy::evictionCount(size_t count) const {
    if (count <= capacity) return 0;
    // 0.2 * 105 is 21.000000000000004 in binary floating point
    double raw = fraction * (double)count;
    double rounded = std::round(raw);
    size_t n = std::fabs(raw - rounded) < 1e-9 ? (size_t)rounded : (size_t)std::ceil(raw);
    return std::min(n, count);
}

size_t EvictionPolicy::run(NamespaceStore &store, const std::string &ns) const {
    size_t count = store.countEntries(ns);
    size_t toDelete = evictionCount(count);
    if (toDelete == 0) return 0;

    std::vector<CacheEntry> entries = store.listEntries(ns);
    toDelete = evictionCount(entries.size());
    if (toDelete == 0) return 0;

    // oldest first, key order among equal timestamps
    std::sort(entries.begin(), entries.end(), [](const CacheEntry &a, const CacheEntry &b) {
        if (a.retrievedAt != b.retrievedAt) return a.retrievedAt < b.retrievedAt;
        return a.key < b.key;
    });

    for (size_t i = 0; i < toDelete; ++i) {
        store.remove(ns, entries[i].key);
    }

    Logger::getInstance().logEviction(ns, entries.size(), toDelete);
    return toDelete;
}
