#ifndef EVICTIONPOLICY_HPP
#define EVICTIONPOLICY_HPP

#include "namespaceStore.hpp"
#include <cstddef>
#include <string>

// Age-based pruning of one namespace.
//
// Entries are ordered by retrievedAt, the time the response was fetched, not
// the time it was last served. An entry that is read often but never
// re-fetched ages like any other and can be evicted; this is a coarse LRU
// approximation. Tracking last access per entry would make it exact.
class EvictionPolicy {
public:
    EvictionPolicy(size_t capacity, double fraction);

    // Returns the number of entries removed (0 when count <= capacity)
    size_t run(NamespaceStore &store, const std::string &ns) const;

    // ceil(fraction * count) for count > capacity, 0 otherwise
    size_t evictionCount(size_t count) const;

private:
    size_t capacity;
    double fraction;
};

#endif // EVICTIONPOLICY_HPP
