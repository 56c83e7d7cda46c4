#ifndef STRATEGYROUTER_HPP
#define STRATEGYROUTER_HPP

#include "fetcher.hpp"
#include "namespaceStore.hpp"
#include "requestClassifier.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>

// Runs a detached task on behalf of the given version; may drop it
using TaskSpawner = std::function<void(const std::string &version, std::function<void()> task)>;
using WallClock = std::function<std::chrono::system_clock::time_point()>;

// What a request needs to know about the version serving it
struct RouteContext {
    std::string version;
    std::string appShell;
    std::string runtime;
    std::shared_ptr<const std::set<std::string>> manifestKeys;
    std::string offlineKey;
};

class StrategyRouter {
public:
    StrategyRouter(NamespaceStore &store, Fetcher &fetcher, TaskSpawner spawn, WallClock clock);

    // Strategy table lookup
    StrategyDecision decide(RequestCategory category, const std::string &key, const RouteContext &ctx) const;

    // Always ends in a concrete response; network failures never escape
    Response route(const Request &req, RequestCategory category, const RouteContext &ctx, int requestId);

    Response cacheFirst(const Request &req, const std::string &key, const RouteContext &ctx, int requestId);
    Response networkFirst(const Request &req, const std::string &key, RequestCategory category,
                          const RouteContext &ctx, int requestId);
    Response staleWhileRevalidate(const Request &req, const std::string &key, const RouteContext &ctx, int requestId);
    Response bypass(const Request &req, int requestId);

    static Response notFoundPlaceholder();
    static Response offlinePage();
    static Response apiOfflineEnvelope(const std::string &timestamp);

private:
    NamespaceStore &store;
    Fetcher &fetcher;
    TaskSpawner spawn;
    WallClock clock;

    std::optional<CacheEntry> lookup(const std::string &ns, const std::string &key, int requestId);

    // GET and 2xx only; a store failure is logged and skipped
    void persist(const std::string &ns, const std::string &key, const Request &req,
                 const Response &res, int requestId);

    void refreshInBackground(const Request &req, const std::string &key, const std::string &ns,
                             const std::string &version, int requestId);
};

bool isSuccessStatus(int status);

#endif // STRATEGYROUTER_HPP
