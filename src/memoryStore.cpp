#include "memoryStore.hpp"
#include <mutex>

std::optional<CacheEntry> MemoryStore::get(const std::string &ns, const std::string &key) {
    std::shared_lock<std::shared_mutex> rlock(storeMutex);
    auto nsIt = data.find(ns);
    if (nsIt == data.end()) return std::nullopt;

    auto it = nsIt->second.find(key);
    if (it == nsIt->second.end()) return std::nullopt;
    return it->second;
}

void MemoryStore::put(const std::string &ns, const std::string &key, const CacheEntry &entry) {
    CacheEntry copy = entry;
    copy.key = key;

    std::unique_lock<std::shared_mutex> wlock(storeMutex);
    data[ns][key] = std::move(copy);
}

void MemoryStore::remove(const std::string &ns, const std::string &key) {
    std::unique_lock<std::shared_mutex> wlock(storeMutex);
    auto nsIt = data.find(ns);
    if (nsIt == data.end()) return;
    nsIt->second.erase(key);
}

void MemoryStore::openNamespace(const std::string &ns) {
    std::unique_lock<std::shared_mutex> wlock(storeMutex);
    data[ns];
}

std::set<std::string> MemoryStore::listNamespaces() {
    std::shared_lock<std::shared_mutex> rlock(storeMutex);
    std::set<std::string> names;
    for (const auto &kv : data) {
        names.insert(kv.first);
    }
    return names;
}

void MemoryStore::deleteNamespace(const std::string &ns) {
    std::unique_lock<std::shared_mutex> wlock(storeMutex);
    data.erase(ns);
}

std::vector<CacheEntry> MemoryStore::listEntries(const std::string &ns) {
    std::shared_lock<std::shared_mutex> rlock(storeMutex);
    std::vector<CacheEntry> entries;
    auto nsIt = data.find(ns);
    if (nsIt == data.end()) return entries;

    entries.reserve(nsIt->second.size());
    for (const auto &kv : nsIt->second) {
        entries.push_back(kv.second);
    }
    return entries;
}

size_t MemoryStore::countEntries(const std::string &ns) {
    std::shared_lock<std::shared_mutex> rlock(storeMutex);
    auto nsIt = data.find(ns);
    return nsIt == data.end() ? 0 : nsIt->second.size();
}
