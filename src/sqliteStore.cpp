#include "sqliteStore.hpp"
#include "logger.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
using nlohmann::json;

namespace {

// finalize on scope exit
struct StmtGuard {
    sqlite3_stmt *stmt;
    explicit StmtGuard(sqlite3_stmt *s) : stmt(s) {}
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
    StmtGuard(const StmtGuard&) = delete;
    StmtGuard& operator=(const StmtGuard&) = delete;
};

std::string columnText(sqlite3_stmt *stmt, int col) {
    const unsigned char *txt = sqlite3_column_text(stmt, col);
    if (!txt) return "";
    return std::string(reinterpret_cast<const char *>(txt), (size_t)sqlite3_column_bytes(stmt, col));
}

long long nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}

SqliteStore::SqliteStore(const std::string &path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        std::string e = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        db = nullptr;
        throw StoreError("cannot open store " + path + ": " + e);
    }
    sqlite3_busy_timeout(db, 2000);

    try {
        execOrThrow("PRAGMA journal_mode=WAL;");
        execOrThrow("PRAGMA foreign_keys=ON;");
        execOrThrow(
            "CREATE TABLE IF NOT EXISTS namespaces ("
            "  name       TEXT PRIMARY KEY,"
            "  created_at INTEGER NOT NULL"
            ");");
        execOrThrow(
            "CREATE TABLE IF NOT EXISTS entries ("
            "  ns           TEXT NOT NULL REFERENCES namespaces(name) ON DELETE CASCADE,"
            "  key          TEXT NOT NULL,"
            "  status       INTEGER NOT NULL,"
            "  status_msg   TEXT NOT NULL,"
            "  headers      TEXT NOT NULL,"
            "  body         BLOB,"
            "  retrieved_at INTEGER NOT NULL,"
            "  PRIMARY KEY (ns, key)"
            ");");
        execOrThrow("CREATE INDEX IF NOT EXISTS idx_entries_retrieved ON entries(ns, retrieved_at);");
    } catch (const StoreError &) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }
}

SqliteStore::~SqliteStore() {
    if (db) {
        sqlite3_close(db);
    }
}

void SqliteStore::execOrThrow(const char *sql) {
    char *err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string e = err ? err : "unknown";
        if (err) sqlite3_free(err);
        throw StoreError(std::string("sqlite: ") + e);
    }
}

sqlite3_stmt *SqliteStore::prepareOrThrow(const char *sql) {
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return stmt;
}

void SqliteStore::insertNamespaceUnsafe(const std::string &ns) {
    StmtGuard ins(prepareOrThrow("INSERT OR IGNORE INTO namespaces(name, created_at) VALUES(?, ?);"));
    sqlite3_bind_text(ins.stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(ins.stmt, 2, nowMillis());
    if (sqlite3_step(ins.stmt) != SQLITE_DONE) {
        throw StoreError(std::string("sqlite insert namespace: ") + sqlite3_errmsg(db));
    }
}

CacheEntry SqliteStore::readEntryRow(sqlite3_stmt *stmt) {
    CacheEntry entry;
    entry.key = columnText(stmt, 0);
    entry.status = sqlite3_column_int(stmt, 1);
    entry.statusMsg = columnText(stmt, 2);

    try {
        json headers = json::parse(columnText(stmt, 3));
        entry.headers = headers.get<std::map<std::string, std::string>>();
    } catch (const json::exception &e) {
        // keep the body; a broken header column only loses metadata
        Logger::getInstance().logWarning(-1, "stored headers unreadable for " + entry.key + ": " + e.what());
    }

    const void *blob = sqlite3_column_blob(stmt, 4);
    int blobLen = sqlite3_column_bytes(stmt, 4);
    if (blob && blobLen > 0) {
        entry.body.assign(static_cast<const char *>(blob), (size_t)blobLen);
    }
    entry.retrievedAt = CacheEntry::fromMillis(sqlite3_column_int64(stmt, 5));
    return entry;
}

std::optional<CacheEntry> SqliteStore::get(const std::string &ns, const std::string &key) {
    std::lock_guard<std::mutex> lock(dbMutex);
    StmtGuard sel(prepareOrThrow(
        "SELECT key, status, status_msg, headers, body, retrieved_at "
        "FROM entries WHERE ns=? AND key=?;"));
    sqlite3_bind_text(sel.stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(sel.stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(sel.stmt);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) {
        throw StoreError(std::string("sqlite get: ") + sqlite3_errmsg(db));
    }
    return readEntryRow(sel.stmt);
}

void SqliteStore::put(const std::string &ns, const std::string &key, const CacheEntry &entry) {
    std::string headers = json(entry.headers).dump();

    std::lock_guard<std::mutex> lock(dbMutex);
    execOrThrow("BEGIN IMMEDIATE;");
    try {
        insertNamespaceUnsafe(ns);

        StmtGuard ins(prepareOrThrow(
            "INSERT OR REPLACE INTO entries(ns, key, status, status_msg, headers, body, retrieved_at) "
            "VALUES(?, ?, ?, ?, ?, ?, ?);"));
        sqlite3_bind_text(ins.stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(ins.stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(ins.stmt, 3, entry.status);
        sqlite3_bind_text(ins.stmt, 4, entry.statusMsg.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(ins.stmt, 5, headers.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_blob(ins.stmt, 6, entry.body.data(), (int)entry.body.size(), SQLITE_TRANSIENT);
        sqlite3_bind_int64(ins.stmt, 7, entry.retrievedAtMillis());
        if (sqlite3_step(ins.stmt) != SQLITE_DONE) {
            throw StoreError(std::string("sqlite put: ") + sqlite3_errmsg(db));
        }
        execOrThrow("COMMIT;");
    } catch (const StoreError &) {
        char *err = nullptr;
        (void)sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, &err);
        if (err) sqlite3_free(err);
        throw;
    }
}

void SqliteStore::remove(const std::string &ns, const std::string &key) {
    std::lock_guard<std::mutex> lock(dbMutex);
    StmtGuard del(prepareOrThrow("DELETE FROM entries WHERE ns=? AND key=?;"));
    sqlite3_bind_text(del.stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(del.stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(del.stmt) != SQLITE_DONE) {
        throw StoreError(std::string("sqlite remove: ") + sqlite3_errmsg(db));
    }
}

void SqliteStore::openNamespace(const std::string &ns) {
    std::lock_guard<std::mutex> lock(dbMutex);
    insertNamespaceUnsafe(ns);
}

std::set<std::string> SqliteStore::listNamespaces() {
    std::lock_guard<std::mutex> lock(dbMutex);
    StmtGuard sel(prepareOrThrow("SELECT name FROM namespaces;"));

    std::set<std::string> names;
    int rc;
    while ((rc = sqlite3_step(sel.stmt)) == SQLITE_ROW) {
        names.insert(columnText(sel.stmt, 0));
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string("sqlite list namespaces: ") + sqlite3_errmsg(db));
    }
    return names;
}

void SqliteStore::deleteNamespace(const std::string &ns) {
    std::lock_guard<std::mutex> lock(dbMutex);
    execOrThrow("BEGIN IMMEDIATE;");
    try {
        StmtGuard delEntries(prepareOrThrow("DELETE FROM entries WHERE ns=?;"));
        sqlite3_bind_text(delEntries.stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(delEntries.stmt) != SQLITE_DONE) {
            throw StoreError(std::string("sqlite delete entries: ") + sqlite3_errmsg(db));
        }

        StmtGuard delNs(prepareOrThrow("DELETE FROM namespaces WHERE name=?;"));
        sqlite3_bind_text(delNs.stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(delNs.stmt) != SQLITE_DONE) {
            throw StoreError(std::string("sqlite delete namespace: ") + sqlite3_errmsg(db));
        }
        execOrThrow("COMMIT;");
    } catch (const StoreError &) {
        char *err = nullptr;
        (void)sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, &err);
        if (err) sqlite3_free(err);
        throw;
    }
}

std::vector<CacheEntry> SqliteStore::listEntries(const std::string &ns) {
    std::lock_guard<std::mutex> lock(dbMutex);
    StmtGuard sel(prepareOrThrow(
        "SELECT key, status, status_msg, headers, body, retrieved_at "
        "FROM entries WHERE ns=?;"));
    sqlite3_bind_text(sel.stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<CacheEntry> entries;
    int rc;
    while ((rc = sqlite3_step(sel.stmt)) == SQLITE_ROW) {
        entries.push_back(readEntryRow(sel.stmt));
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string("sqlite list entries: ") + sqlite3_errmsg(db));
    }
    return entries;
}

size_t SqliteStore::countEntries(const std::string &ns) {
    std::lock_guard<std::mutex> lock(dbMutex);
    StmtGuard sel(prepareOrThrow("SELECT COUNT(*) FROM entries WHERE ns=?;"));
    sqlite3_bind_text(sel.stmt, 1, ns.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(sel.stmt) != SQLITE_ROW) {
        throw StoreError(std::string("sqlite count: ") + sqlite3_errmsg(db));
    }
    return (size_t)sqlite3_column_int64(sel.stmt, 0);
}
