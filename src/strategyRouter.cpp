#include "strategyRouter.hpp"
#include "logger.hpp"

#include <initializer_list>
#include <sstream>
#include <nlohmann/json.hpp>

static const char *OFFLINE_PLACEHOLDER_BODY = "Resource not available offline";

static const char *OFFLINE_PAGE_BODY =
    "<!DOCTYPE html>\n"
    "<html><head><meta charset=\"utf-8\"><title>Offline</title></head>\n"
    "<body><h1>Offline</h1><p>The dashboard is not reachable right now. "
    "Data will refresh once the connection is back.</p></body></html>\n";

bool isSuccessStatus(int status) {
    return status >= 200 && status < 300;
}

static std::string statusLine(const Response &res) {
    std::ostringstream line;
    line << res.version << " " << res.status_code << " " << res.status_msg;
    return line.str();
}

StrategyRouter::StrategyRouter(NamespaceStore &store, Fetcher &fetcher, TaskSpawner spawn, WallClock clock)
    : store(store), fetcher(fetcher), spawn(std::move(spawn)), clock(std::move(clock)) {}

StrategyDecision StrategyRouter::decide(RequestCategory category, const std::string &key,
                                        const RouteContext &ctx) const {
    switch (category) {
        case RequestCategory::CrossOrigin:
            return StrategyDecision::Bypass;
        case RequestCategory::Navigation:
        case RequestCategory::API:
            return StrategyDecision::NetworkFirstWithFallback;
        case RequestCategory::Static:
            if (ctx.manifestKeys && ctx.manifestKeys->count(key)) {
                return StrategyDecision::CacheFirst;
            }
            return StrategyDecision::StaleWhileRevalidate;
    }
    return StrategyDecision::Bypass;
}

Response StrategyRouter::route(const Request &req, RequestCategory category, const RouteContext &ctx, int requestId) {
    std::string key = makeEntryKey(req.method, req.url);
    StrategyDecision decision = decide(category, key, ctx);
    Logger::getInstance().logClassified(requestId, categoryName(category), strategyName(decision));

    Response res;
    switch (decision) {
        case StrategyDecision::CacheFirst:
            res = cacheFirst(req, key, ctx, requestId);
            break;
        case StrategyDecision::NetworkFirstWithFallback:
            res = networkFirst(req, key, category, ctx, requestId);
            break;
        case StrategyDecision::StaleWhileRevalidate:
            res = staleWhileRevalidate(req, key, ctx, requestId);
            break;
        case StrategyDecision::Bypass:
            res = bypass(req, requestId);
            break;
    }
    Logger::getInstance().logRespond(requestId, statusLine(res));
    return res;
}

std::optional<CacheEntry> StrategyRouter::lookup(const std::string &ns, const std::string &key, int requestId) {
    try {
        return store.get(ns, key);
    } catch (const StoreError &e) {
        Logger::getInstance().logError(requestId, "store read failed, treated as miss: " + std::string(e.what()));
        return std::nullopt;
    }
}

void StrategyRouter::persist(const std::string &ns, const std::string &key, const Request &req,
                             const Response &res, int requestId) {
    if (req.method != "GET") {
        Logger::getInstance().logNotCacheable(requestId, "method " + req.method);
        return;
    }
    if (!isSuccessStatus(res.status_code)) {
        Logger::getInstance().logNotCacheable(requestId, "status " + std::to_string(res.status_code));
        return;
    }

    CacheEntry entry(key, res, clock());
    try {
        store.put(ns, key, entry);
        Logger::getInstance().logCached(requestId, ns, entry.getRetrievedAtString());
    } catch (const StoreError &e) {
        Logger::getInstance().logError(requestId, "store write skipped: " + std::string(e.what()));
    }
}

void StrategyRouter::refreshInBackground(const Request &req, const std::string &key, const std::string &ns,
                                         const std::string &version, int requestId) {
    spawn(version, [this, req, key, ns, requestId]() {
        try {
            Response fresh = fetcher.fetch(req, requestId);
            if (isSuccessStatus(fresh.status_code)) {
                persist(ns, key, req, fresh, requestId);
            }
        } catch (const std::exception &e) {
            // the caller already has its answer
            Logger::getInstance().logNote(requestId, "background refresh of " + key + " dropped: " + e.what());
        }
    });
}

Response StrategyRouter::cacheFirst(const Request &req, const std::string &key, const RouteContext &ctx, int requestId) {
    std::optional<CacheEntry> cached = lookup(ctx.appShell, key, requestId);
    if (cached) {
        Logger::getInstance().logCacheStatus(requestId, "in cache (" + ctx.appShell + ")");
        if (req.method == "GET") {
            refreshInBackground(req, key, ctx.appShell, ctx.version, requestId);
        }
        return cached->toResponse();
    }

    Logger::getInstance().logCacheStatus(requestId, "not in cache");
    try {
        Response res = fetcher.fetch(req, requestId);
        persist(ctx.appShell, key, req, res, requestId);
        return res;
    } catch (const NetworkFailure &e) {
        Logger::getInstance().logWarning(requestId, std::string("network failed: ") + e.what());
        return notFoundPlaceholder();
    }
}

Response StrategyRouter::networkFirst(const Request &req, const std::string &key, RequestCategory category,
                                      const RouteContext &ctx, int requestId) {
    bool navigation = category == RequestCategory::Navigation;
    const std::string &primary = navigation ? ctx.appShell : ctx.runtime;
    const std::string &secondary = navigation ? ctx.runtime : ctx.appShell;

    try {
        Response res = fetcher.fetch(req, requestId);
        persist(primary, key, req, res, requestId);
        return res;
    } catch (const NetworkFailure &e) {
        Logger::getInstance().logWarning(requestId, std::string("network failed, trying cache: ") + e.what());
    }

    for (const std::string *ns : {&primary, &secondary}) {
        std::optional<CacheEntry> cached = lookup(*ns, key, requestId);
        if (cached) {
            Logger::getInstance().logCacheStatus(requestId, "in cache (" + *ns + ")");
            return cached->toResponse();
        }
    }
    Logger::getInstance().logCacheStatus(requestId, "not in cache");

    if (navigation) {
        for (const std::string *ns : {&ctx.appShell, &ctx.runtime}) {
            std::optional<CacheEntry> offline = lookup(*ns, ctx.offlineKey, requestId);
            if (offline) return offline->toResponse();
        }
        return offlinePage();
    }
    return apiOfflineEnvelope(formatIso8601(clock()));
}

Response StrategyRouter::staleWhileRevalidate(const Request &req, const std::string &key, const RouteContext &ctx,
                                              int requestId) {
    std::optional<CacheEntry> cached = lookup(ctx.runtime, key, requestId);
    if (cached) {
        Logger::getInstance().logCacheStatus(requestId, "in cache (" + ctx.runtime + "), revalidating");
        if (req.method == "GET") {
            refreshInBackground(req, key, ctx.runtime, ctx.version, requestId);
        }
        return cached->toResponse();
    }

    Logger::getInstance().logCacheStatus(requestId, "not in cache");
    try {
        Response res = fetcher.fetch(req, requestId);
        persist(ctx.runtime, key, req, res, requestId);
        return res;
    } catch (const NetworkFailure &e) {
        Logger::getInstance().logWarning(requestId, std::string("network failed: ") + e.what());
        return notFoundPlaceholder();
    }
}

Response StrategyRouter::bypass(const Request &req, int requestId) {
    try {
        return fetcher.fetch(req, requestId);
    } catch (const NetworkFailure &e) {
        Logger::getInstance().logError(requestId, std::string("bypass fetch failed: ") + e.what());
        return makeResponse(502, "Bad Gateway", "text/plain", "Bad Gateway");
    }
}

Response StrategyRouter::notFoundPlaceholder() {
    return makeResponse(404, "Not Found", "text/plain", OFFLINE_PLACEHOLDER_BODY);
}

Response StrategyRouter::offlinePage() {
    return makeResponse(503, "Service Unavailable", "text/html; charset=utf-8", OFFLINE_PAGE_BODY);
}

Response StrategyRouter::apiOfflineEnvelope(const std::string &timestamp) {
    nlohmann::json body = {
        {"error", "offline"},
        {"message", "Service not available offline"},
        {"timestamp", timestamp}
    };
    Response res = makeResponse(503, "Service Unavailable", "application/json", body.dump());
    res.headers["Cache-Control"] = "no-cache";
    return res;
}
