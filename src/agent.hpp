#ifndef AGENT_HPP
#define AGENT_HPP

#include "clientHub.hpp"
#include "config.hpp"
#include "controlChannel.hpp"
#include "evictionPolicy.hpp"
#include "fetcher.hpp"
#include "lifecycleManager.hpp"
#include "namespaceStore.hpp"
#include "notifier.hpp"
#include "requestClassifier.hpp"
#include "strategyRouter.hpp"
#include "threadPool.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

// The process-wide caching actor. Store and fetcher are owned by the caller
// and must outlive the agent.
class Agent {
public:
    Agent(const AgentConfig &config, NamespaceStore &store, Fetcher &fetcher,
          WallClock clock = []() { return std::chrono::system_clock::now(); });
    ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    // Install the configured version and activate it if nothing holds it back
    InstallReport start();

    // Install another version while the current one keeps serving
    InstallReport deploy(const AgentConfig &next);

    // RequestIntercept: never throws, always a concrete response
    Response intercept(const Request &req, int requestId);

    bool isControlRequest(const Request &req) const;
    Response handleControl(const Request &req, int requestId);

    RequestDescriptor describe(const Request &req) const;

    // Background sweep: Runtime eviction every eviction_interval_seconds and
    // idle client expiry. Not started when both are disabled.
    void startMaintenance();
    void stopMaintenance();

    // One sweep; eviction only runs once its interval has elapsed
    void runMaintenance();

    // Drops idle clients and lets a waiting version take over if none remain
    size_t expireIdleClients();

    // Blocks until every background refresh spawned so far has finished
    void waitForBackground();

    LifecycleManager &lifecycleManager() { return lifecycle; }
    ClientHub &clientHub() { return clients; }
    const AgentConfig &configuration() const { return config; }

private:
    AgentConfig config;
    NamespaceStore &store;
    Fetcher &fetcher;
    WallClock clock;

    RequestClassifier classifier;
    EvictionPolicy eviction;
    ClientHub clients;
    LifecycleManager lifecycle;
    ControlChannel control;
    Notifier notifications;
    StrategyRouter router;

    std::mutex maintenanceMutex;
    std::condition_variable maintenanceCondition;
    bool maintenanceStop;
    std::thread maintenance;
    std::chrono::steady_clock::time_point lastEviction;

    // last member: joined before anything its tasks touch goes away
    std::unique_ptr<ThreadPool> background;

    void spawnBackground(const std::string &version, std::function<void()> task);
    Request resolveAgainstOrigin(const Request &req) const;
    std::string controlPath(const Request &req) const;
    std::chrono::milliseconds maintenancePeriod() const;
};

#endif // AGENT_HPP
