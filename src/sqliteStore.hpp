#ifndef SQLITESTORE_HPP
#define SQLITESTORE_HPP

#include "namespaceStore.hpp"
#include <mutex>
#include <sqlite3.h>

// Namespace store persisted in one SQLite file on the device.
// Created at agent start and never torn down during normal operation.
class SqliteStore : public NamespaceStore {
public:
    // Throws StoreError if the file cannot be opened or the schema created
    explicit SqliteStore(const std::string &path);
    ~SqliteStore() override;

    SqliteStore(SqliteStore const&) = delete;
    SqliteStore& operator=(SqliteStore const&) = delete;

    std::optional<CacheEntry> get(const std::string &ns, const std::string &key) override;
    void put(const std::string &ns, const std::string &key, const CacheEntry &entry) override;
    void remove(const std::string &ns, const std::string &key) override;
    void openNamespace(const std::string &ns) override;
    std::set<std::string> listNamespaces() override;
    void deleteNamespace(const std::string &ns) override;
    std::vector<CacheEntry> listEntries(const std::string &ns) override;
    size_t countEntries(const std::string &ns) override;

private:
    sqlite3 *db{nullptr};

    // One connection, serialized
    std::mutex dbMutex;

    void execOrThrow(const char *sql);
    sqlite3_stmt *prepareOrThrow(const char *sql);
    void insertNamespaceUnsafe(const std::string &ns);
    CacheEntry readEntryRow(sqlite3_stmt *stmt);
};

#endif // SQLITESTORE_HPP
