#include "lifecycleManager.hpp"
#include "logger.hpp"
#include "requestClassifier.hpp"

#include <chrono>

const char *lifecycleStateName(LifecycleState state) {
    switch (state) {
        case LifecycleState::Installing: return "Installing";
        case LifecycleState::Waiting:    return "Waiting";
        case LifecycleState::Activating: return "Activating";
        case LifecycleState::Active:     return "Active";
        case LifecycleState::Superseded: return "Superseded";
    }
    return "Unknown";
}

RouteContext VersionInstance::routeContext() const {
    auto keys = std::make_shared<std::set<std::string>>();
    for (const auto &path : manifest) {
        keys->insert(makeEntryKey("GET", path));
    }

    RouteContext ctx;
    ctx.version = version;
    ctx.appShell = appShellNamespace();
    ctx.runtime = runtimeNamespace();
    ctx.manifestKeys = keys;
    ctx.offlineKey = makeEntryKey("GET", offlineUrl);
    return ctx;
}

LifecycleManager::LifecycleManager(NamespaceStore &store, Fetcher &fetcher, const EvictionPolicy &eviction,
                                   ClientHub &clients, std::string appOrigin, WallClock clock)
    : store(store), fetcher(fetcher), eviction(eviction), clients(clients),
      appOrigin(std::move(appOrigin)), clock(std::move(clock)) {}

void LifecycleManager::transition(VersionInstance &instance, LifecycleState next) {
    Logger::getInstance().logLifecycle(instance.version,
        std::string(lifecycleStateName(instance.state)) + " -> " + lifecycleStateName(next));
    instance.state = next;
}

bool LifecycleManager::populateAsset(const std::string &ns, const std::string &path, int assetId) {
    UrlParts origin;
    UrlParts asset;
    if (!parseUrl(appOrigin, origin) || !parseUrl(path, asset)) {
        Logger::getInstance().logWarning(assetId, "asset " + path + " skipped: bad URL");
        return false;
    }

    Request req;
    req.method = "GET";
    req.url = origin.origin() + asset.pathAndQuery();
    req.headers["Host"] = origin.host + ":" + origin.port;

    std::string key = makeEntryKey("GET", path);
    try {
        Response res = fetcher.fetch(req, assetId);
        if (!isSuccessStatus(res.status_code)) {
            Logger::getInstance().logWarning(assetId, "asset " + path + " skipped: status " +
                                             std::to_string(res.status_code));
            return false;
        }
        store.put(ns, key, CacheEntry(key, res, clock()));
        return true;
    } catch (const NetworkFailure &e) {
        Logger::getInstance().logWarning(assetId, "asset " + path + " skipped: " + e.what());
    } catch (const StoreError &e) {
        Logger::getInstance().logWarning(assetId, "asset " + path + " not stored: " + e.what());
    }
    return false;
}

InstallReport LifecycleManager::install(const std::string &version, const std::vector<std::string> &manifest,
                                        const std::string &offlineUrl, bool strict, bool volunteerSkipWaiting) {
    std::lock_guard<std::mutex> installLock(installMutex);

    auto instance = std::make_unique<VersionInstance>();
    instance->version = version;
    instance->manifest = manifest;
    instance->offlineUrl = offlineUrl;
    Logger::getInstance().logLifecycle(version, "Installing");

    InstallReport report;
    report.version = version;

    std::string ns = instance->appShellNamespace();
    try {
        store.openNamespace(ns);
    } catch (const StoreError &e) {
        Logger::getInstance().logError(-1, "install of " + version + " failed: " + e.what());
        report.ok = false;
        return report;
    }

    // one attempt per asset, each independent of the others
    for (const auto &path : manifest) {
        ++report.attempted;
        if (populateAsset(ns, path, -1)) {
            ++report.cached;
        } else {
            report.failedAssets.push_back(path);
        }
    }

    Logger::getInstance().logNote(-1, "install of " + version + " cached " + std::to_string(report.cached) +
                                  "/" + std::to_string(report.attempted) + " assets");

    if (strict && !report.failedAssets.empty()) {
        report.ok = false;
        Logger::getInstance().logError(-1, "strict install of " + version + " failed on " +
                                       std::to_string(report.failedAssets.size()) + " assets");
        if (version != activeVersion()) {
            try {
                store.deleteNamespace(ns);
            } catch (const StoreError &e) {
                Logger::getInstance().logError(-1, "cannot drop " + ns + ": " + e.what());
            }
        }
        return report;
    }

    instance->skipWaiting = volunteerSkipWaiting;
    transition(*instance, LifecycleState::Waiting);

    // an activation in progress keeps its instance
    std::shared_lock<std::shared_mutex> gate(gateMutex);
    std::lock_guard<std::mutex> lock(stateMutex);
    if (pending) {
        Logger::getInstance().logNote(-1, "waiting version " + pending->version + " replaced by " + version);
    }
    pending = std::move(instance);
    return report;
}

bool LifecycleManager::activateIfReady() {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (!pending || pending->state != LifecycleState::Waiting) return false;

        size_t connected = clients.count();
        bool ready = pending->skipWaiting || !active || connected == 0;
        if (!ready) {
            Logger::getInstance().logNote(-1, pending->version + " waiting for " +
                                          std::to_string(connected) + " clients to close");
            return false;
        }
    }
    return activate();
}

bool LifecycleManager::skipWaiting() {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (!pending || pending->state != LifecycleState::Waiting) return false;
        pending->skipWaiting = true;
    }
    return activate();
}

bool LifecycleManager::clientsChanged() {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (!pending || pending->state != LifecycleState::Waiting) return false;
    }
    if (clients.count() != 0) return false;
    return activate();
}

bool LifecycleManager::activate() {
    // no request runs while the gate is held
    std::unique_lock<std::shared_mutex> gate(gateMutex);

    std::string version;
    std::string appShell;
    std::string runtime;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (!pending || pending->state != LifecycleState::Waiting) return false;
        transition(*pending, LifecycleState::Activating);
        version = pending->version;
        appShell = pending->appShellNamespace();
        runtime = pending->runtimeNamespace();
    }

    try {
        for (const auto &ns : store.listNamespaces()) {
            if (ns != appShell && ns != runtime) {
                store.deleteNamespace(ns);
                Logger::getInstance().logNote(-1, "deleted stale namespace " + ns);
            }
        }
        eviction.run(store, runtime);
    } catch (const StoreError &e) {
        Logger::getInstance().logError(-1, "activation of " + version + " aborted: " + e.what());
        std::lock_guard<std::mutex> lock(stateMutex);
        if (pending) transition(*pending, LifecycleState::Waiting);
        return false;
    }

    size_t claimed = clients.claimAll(version);

    std::lock_guard<std::mutex> lock(stateMutex);
    if (active) {
        transition(*active, LifecycleState::Superseded);
        superseded.push_back(active->version);
    }
    active = std::move(pending);
    transition(*active, LifecycleState::Active);
    Logger::getInstance().logNote(-1, version + " now controls " + std::to_string(claimed) + " clients");
    return true;
}

size_t LifecycleManager::runEviction() {
    std::shared_lock<std::shared_mutex> gate(gateMutex);
    std::optional<RouteContext> ctx = activeContext();
    if (!ctx) return 0;

    try {
        return eviction.run(store, ctx->runtime);
    } catch (const StoreError &e) {
        Logger::getInstance().logError(-1, "periodic eviction failed: " + std::string(e.what()));
        return 0;
    }
}

std::optional<LifecycleState> LifecycleManager::stateOf(const std::string &version) const {
    std::lock_guard<std::mutex> lock(stateMutex);
    if (active && active->version == version) return active->state;
    if (pending && pending->version == version) return pending->state;
    for (const auto &v : superseded) {
        if (v == version) return LifecycleState::Superseded;
    }
    return std::nullopt;
}

std::string LifecycleManager::activeVersion() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return active ? active->version : "";
}

std::string LifecycleManager::waitingVersion() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    if (pending && pending->state == LifecycleState::Waiting) return pending->version;
    return "";
}

std::optional<RouteContext> LifecycleManager::activeContext() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    if (!active) return std::nullopt;
    return active->routeContext();
}

std::shared_lock<std::shared_mutex> LifecycleManager::enterShared() const {
    return std::shared_lock<std::shared_mutex>(gateMutex);
}
