#ifndef MEMORYSTORE_HPP
#define MEMORYSTORE_HPP

#include "namespaceStore.hpp"
#include <map>
#include <shared_mutex>

// Process-lifetime store, used when no store_path is configured.
class MemoryStore : public NamespaceStore {
private:
    // namespace -> key -> entry
    std::map<std::string, std::map<std::string, CacheEntry>> data;

    // Readers share, writers exclude; a reader always copies a whole entry
    std::shared_mutex storeMutex;

public:
    MemoryStore() = default;

    MemoryStore(MemoryStore const&) = delete;
    MemoryStore& operator=(MemoryStore const&) = delete;

    std::optional<CacheEntry> get(const std::string &ns, const std::string &key) override;
    void put(const std::string &ns, const std::string &key, const CacheEntry &entry) override;
    void remove(const std::string &ns, const std::string &key) override;
    void openNamespace(const std::string &ns) override;
    std::set<std::string> listNamespaces() override;
    void deleteNamespace(const std::string &ns) override;
    std::vector<CacheEntry> listEntries(const std::string &ns) override;
    size_t countEntries(const std::string &ns) override;
};

#endif // MEMORYSTORE_HPP
