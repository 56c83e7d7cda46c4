#ifndef NAMESPACESTORE_HPP
#define NAMESPACESTORE_HPP

#include "cacheEntry.hpp"
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// I/O failure of a backing store. Never raised for an absent key or namespace.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string &what) : std::runtime_error(what) {}
};

// Named collections of cached responses. The only owner of entry data.
// Every operation is atomic per key; concurrent put/get on one key is last-writer-wins.
class NamespaceStore {
public:
    virtual ~NamespaceStore() = default;

    virtual std::optional<CacheEntry> get(const std::string &ns, const std::string &key) = 0;

    // Creates the namespace on first write
    virtual void put(const std::string &ns, const std::string &key, const CacheEntry &entry) = 0;

    virtual void remove(const std::string &ns, const std::string &key) = 0;

    // Create an empty namespace if it does not exist yet
    virtual void openNamespace(const std::string &ns) = 0;

    virtual std::set<std::string> listNamespaces() = 0;
    virtual void deleteNamespace(const std::string &ns) = 0;

    // Snapshot copy; each entry carries its own key
    virtual std::vector<CacheEntry> listEntries(const std::string &ns) = 0;
    virtual size_t countEntries(const std::string &ns) = 0;
};

#endif // NAMESPACESTORE_HPP
