#ifndef LIFECYCLEMANAGER_HPP
#define LIFECYCLEMANAGER_HPP

#include "clientHub.hpp"
#include "evictionPolicy.hpp"
#include "fetcher.hpp"
#include "namespaceStore.hpp"
#include "strategyRouter.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

enum class LifecycleState {
    Installing,
    Waiting,
    Activating,
    Active,
    Superseded
};

const char *lifecycleStateName(LifecycleState state);

struct InstallReport {
    std::string version;
    size_t attempted = 0;
    size_t cached = 0;
    std::vector<std::string> failedAssets;
    bool ok = true;
};

// One deployed version of the agent
struct VersionInstance {
    std::string version;
    std::vector<std::string> manifest;
    std::string offlineUrl;
    LifecycleState state = LifecycleState::Installing;
    bool skipWaiting = false;

    std::string appShellNamespace() const { return "app-shell-" + version; }
    std::string runtimeNamespace() const { return "runtime-" + version; }
    RouteContext routeContext() const;
};

// Install and activation of versions. At most one version is Active and at
// most one is waiting to take over; requests enter through a shared gate that
// activation holds exclusively, so a half-activated version is never seen.
class LifecycleManager {
public:
    LifecycleManager(NamespaceStore &store, Fetcher &fetcher, const EvictionPolicy &eviction,
                     ClientHub &clients, std::string appOrigin,
                     WallClock clock = []() { return std::chrono::system_clock::now(); });

    // Populate the AppShell namespace of a new version. Per-asset failures are
    // logged and skipped unless strict is set, in which case the install fails
    // and the version is discarded. On success the version is Waiting.
    InstallReport install(const std::string &version, const std::vector<std::string> &manifest,
                          const std::string &offlineUrl, bool strict, bool volunteerSkipWaiting);

    // Activates the waiting version if it volunteered, nothing is active yet,
    // or no client is connected. Returns true if an activation ran.
    bool activateIfReady();

    // Waiting -> Activating now, regardless of connected clients
    bool skipWaiting();

    // Called when a client closed
    bool clientsChanged();

    // GC stale namespaces, evict Runtime, claim clients; all-or-nothing
    bool activate();

    // Periodic eviction of the active Runtime namespace
    size_t runEviction();

    std::optional<LifecycleState> stateOf(const std::string &version) const;
    std::string activeVersion() const;
    std::string waitingVersion() const;
    std::optional<RouteContext> activeContext() const;

    // Held by every request for its whole duration
    std::shared_lock<std::shared_mutex> enterShared() const;

private:
    NamespaceStore &store;
    Fetcher &fetcher;
    const EvictionPolicy &eviction;
    ClientHub &clients;
    std::string appOrigin;
    WallClock clock;

    mutable std::shared_mutex gateMutex;
    mutable std::mutex stateMutex;
    std::mutex installMutex;

    std::unique_ptr<VersionInstance> active;
    std::unique_ptr<VersionInstance> pending;
    std::vector<std::string> superseded;

    bool populateAsset(const std::string &ns, const std::string &path, int assetId);
    void transition(VersionInstance &instance, LifecycleState next);
};

#endif // LIFECYCLEMANAGER_HPP
