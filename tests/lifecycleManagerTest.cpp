#include "lifecycleManager.hpp"
#include "memoryStore.hpp"
#include "testSupport.hpp"

#include <gtest/gtest.h>
#include <future>

class LifecycleManagerTest : public ::testing::Test {
protected:
    MemoryStore store;
    FakeFetcher fetcher;
    EvictionPolicy eviction{100, 0.2};
    ClientHub clients;
    LifecycleManager lifecycle{store, fetcher, eviction, clients, "http://localhost:8080"};

    void SetUp() override {
        fetcher.respondOk("GET /", "<html>root</html>", "text/html");
        fetcher.respondOk("GET /index.html", "<html>index</html>", "text/html");
        fetcher.respondOk("GET /main.css?v=3", "body{}", "text/css");
        fetcher.respondOk("GET /a.html", "<html>a</html>", "text/html");
        fetcher.respondOk("GET /b.js", "b()", "application/javascript");
    }

    InstallReport installAndActivate(const std::string &version, bool volunteer = true) {
        InstallReport report = lifecycle.install(version, {"/", "/index.html", "/main.css?v=3"},
                                                 "/offline.html", false, volunteer);
        lifecycle.activateIfReady();
        return report;
    }
};

TEST_F(LifecycleManagerTest, InstallCachesEveryManifestAsset) {
    InstallReport report = lifecycle.install("1.1.0", {"/", "/index.html", "/main.css?v=3"},
                                             "/offline.html", false, false);
    EXPECT_TRUE(report.ok);
    EXPECT_EQ(report.attempted, 3u);
    EXPECT_EQ(report.cached, 3u);
    EXPECT_TRUE(report.failedAssets.empty());
    EXPECT_EQ(store.countEntries("app-shell-1.1.0"), 3u);
    EXPECT_EQ(store.get("app-shell-1.1.0", "GET /main.css?v=3")->body, "body{}");
    EXPECT_EQ(lifecycle.stateOf("1.1.0"), LifecycleState::Waiting);
    EXPECT_EQ(lifecycle.waitingVersion(), "1.1.0");
    EXPECT_EQ(lifecycle.activeVersion(), "");
}

TEST_F(LifecycleManagerTest, PartialInstallStillActivatesAndServesWhatItHas) {
    fetcher.fail("GET /b.js");
    InstallReport report = lifecycle.install("1.1.0", {"/a.html", "/b.js"}, "/offline.html", false, false);

    EXPECT_TRUE(report.ok);
    EXPECT_EQ(report.cached, 1u);
    ASSERT_EQ(report.failedAssets.size(), 1u);
    EXPECT_EQ(report.failedAssets[0], "/b.js");

    EXPECT_TRUE(lifecycle.activateIfReady());
    EXPECT_EQ(lifecycle.activeVersion(), "1.1.0");
    EXPECT_TRUE(store.get("app-shell-1.1.0", "GET /a.html").has_value());
    EXPECT_FALSE(store.get("app-shell-1.1.0", "GET /b.js").has_value());
}

TEST_F(LifecycleManagerTest, ErrorStatusCountsAsFailedAsset) {
    InstallReport report = lifecycle.install("1.1.0", {"/a.html", "/missing.png"}, "/offline.html", false, false);
    EXPECT_TRUE(report.ok);
    EXPECT_EQ(report.cached, 1u);
    EXPECT_FALSE(store.get("app-shell-1.1.0", "GET /missing.png").has_value());
}

TEST_F(LifecycleManagerTest, StrictInstallFailsOnAnyMissingAsset) {
    fetcher.fail("GET /b.js");
    InstallReport report = lifecycle.install("1.1.0", {"/a.html", "/b.js"}, "/offline.html", true, true);

    EXPECT_FALSE(report.ok);
    EXPECT_FALSE(lifecycle.stateOf("1.1.0").has_value());
    EXPECT_EQ(lifecycle.waitingVersion(), "");
    EXPECT_FALSE(lifecycle.activateIfReady());
    EXPECT_EQ(store.listNamespaces().count("app-shell-1.1.0"), 0u);
}

TEST_F(LifecycleManagerTest, FirstVersionActivatesEvenWithClients) {
    std::string tab = clients.open("/");
    installAndActivate("1.0.0", false);

    EXPECT_EQ(lifecycle.activeVersion(), "1.0.0");
    EXPECT_EQ(lifecycle.stateOf("1.0.0"), LifecycleState::Active);

    auto msgs = clients.drain(tab);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0]["type"].get<std::string>(), "CONTROLLER_CHANGE");
    EXPECT_EQ(clients.snapshot()[0].controllerVersion, "1.0.0");
}

TEST_F(LifecycleManagerTest, ActivationDeletesEveryOtherNamespace) {
    Response res = makeResponse(200, "OK", "text/plain", "x");
    store.put("app-shell-1.0.0", "GET /", CacheEntry("GET /", res, CacheEntry::fromMillis(1)));
    store.put("runtime-1.0.0", "GET /api/x", CacheEntry("GET /api/x", res, CacheEntry::fromMillis(1)));
    store.put("runtime-1.1.0", "GET /api/x", CacheEntry("GET /api/x", res, CacheEntry::fromMillis(1)));
    store.openNamespace("something-else");

    installAndActivate("1.1.0");

    EXPECT_EQ(store.listNamespaces(), (std::set<std::string>{"app-shell-1.1.0", "runtime-1.1.0"}));
}

TEST_F(LifecycleManagerTest, SecondVersionWaitsForClientsToClose) {
    installAndActivate("1.0.0");
    std::string tab = clients.open("/");
    clients.drain(tab);

    lifecycle.install("1.1.0", {"/a.html"}, "/offline.html", false, false);
    EXPECT_FALSE(lifecycle.activateIfReady());
    EXPECT_EQ(lifecycle.activeVersion(), "1.0.0");
    EXPECT_EQ(lifecycle.stateOf("1.1.0"), LifecycleState::Waiting);

    // the old version keeps its namespaces while it serves
    EXPECT_EQ(store.listNamespaces().count("app-shell-1.0.0"), 1u);

    clients.close(tab);
    EXPECT_TRUE(lifecycle.clientsChanged());
    EXPECT_EQ(lifecycle.activeVersion(), "1.1.0");
    EXPECT_EQ(lifecycle.stateOf("1.0.0"), LifecycleState::Superseded);
    EXPECT_EQ(store.listNamespaces().count("app-shell-1.0.0"), 0u);
}

TEST_F(LifecycleManagerTest, SkipWaitingTakesOverConnectedClients) {
    installAndActivate("1.0.0");
    std::string tab = clients.open("/");
    clients.drain(tab);

    lifecycle.install("1.1.0", {"/a.html"}, "/offline.html", false, false);
    EXPECT_FALSE(lifecycle.activateIfReady());
    EXPECT_TRUE(lifecycle.skipWaiting());

    EXPECT_EQ(lifecycle.activeVersion(), "1.1.0");
    auto msgs = clients.drain(tab);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0]["version"].get<std::string>(), "1.1.0");

    EXPECT_FALSE(lifecycle.skipWaiting());
}

TEST_F(LifecycleManagerTest, VolunteeredVersionActivatesDespiteClients) {
    installAndActivate("1.0.0");
    clients.open("/");
    installAndActivate("1.1.0", true);
    EXPECT_EQ(lifecycle.activeVersion(), "1.1.0");
}

TEST_F(LifecycleManagerTest, ActivationEvictsOversizedRuntime) {
    for (int i = 0; i < 120; ++i) {
        std::string key = "GET /api/item/" + std::to_string(i);
        store.put("runtime-2.0.0", key,
                  CacheEntry(key, makeResponse(200, "OK", "application/json", "{}"), CacheEntry::fromMillis(i)));
    }
    installAndActivate("2.0.0");
    EXPECT_EQ(store.countEntries("runtime-2.0.0"), 96u);
    EXPECT_FALSE(store.get("runtime-2.0.0", "GET /api/item/0").has_value());
}

TEST_F(LifecycleManagerTest, ActiveContextDescribesTheActiveVersion) {
    EXPECT_FALSE(lifecycle.activeContext().has_value());
    installAndActivate("1.1.0");

    auto ctx = lifecycle.activeContext();
    ASSERT_TRUE(ctx.has_value());
    EXPECT_EQ(ctx->version, "1.1.0");
    EXPECT_EQ(ctx->appShell, "app-shell-1.1.0");
    EXPECT_EQ(ctx->runtime, "runtime-1.1.0");
    EXPECT_EQ(ctx->offlineKey, "GET /offline.html");
    EXPECT_EQ(ctx->manifestKeys->count("GET /main.css?v=3"), 1u);
    EXPECT_EQ(ctx->manifestKeys->count("GET /main.css"), 0u);
}

TEST_F(LifecycleManagerTest, RunEvictionWithoutActiveVersionIsNoop) {
    EXPECT_EQ(lifecycle.runEviction(), 0u);
}

TEST_F(LifecycleManagerTest, ActivationWaitsForInFlightRequests) {
    lifecycle.install("1.1.0", {"/a.html"}, "/offline.html", false, true);

    std::future<bool> activation;
    {
        auto gate = lifecycle.enterShared();
        activation = std::async(std::launch::async, [this]() { return lifecycle.activate(); });
        EXPECT_EQ(activation.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);
        EXPECT_EQ(lifecycle.activeVersion(), "");
    }
    EXPECT_TRUE(activation.get());
    EXPECT_EQ(lifecycle.activeVersion(), "1.1.0");
}

TEST(LifecycleClockTest, InstalledAssetsAreStampedWithInjectedClock) {
    MemoryStore store;
    FakeFetcher fetcher;
    EvictionPolicy eviction(100, 0.2);
    ClientHub clients;
    ManualClock clock(1750000000123LL);
    fetcher.respondOk("GET /a.html", "<html>a</html>", "text/html");

    LifecycleManager lifecycle(store, fetcher, eviction, clients, "http://localhost:8080", clock.asWallClock());
    ASSERT_TRUE(lifecycle.install("1.1.0", {"/a.html"}, "/offline.html", false, true).ok);

    auto entry = store.get("app-shell-1.1.0", "GET /a.html");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->retrievedAtMillis(), 1750000000123LL);
    EXPECT_EQ(entry->getRetrievedAtString(), "2025-06-15T15:06:40.123Z");
}

TEST(LifecycleStateTest, Names) {
    EXPECT_STREQ(lifecycleStateName(LifecycleState::Waiting), "Waiting");
    EXPECT_STREQ(lifecycleStateName(LifecycleState::Superseded), "Superseded");
}
