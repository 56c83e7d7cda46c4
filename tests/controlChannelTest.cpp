#include "controlChannel.hpp"
#include "memoryStore.hpp"
#include "testSupport.hpp"

#include <gtest/gtest.h>

class ControlChannelTest : public ::testing::Test {
protected:
    MemoryStore store;
    FakeFetcher fetcher;
    EvictionPolicy eviction{100, 0.2};
    ClientHub clients;
    LifecycleManager lifecycle{store, fetcher, eviction, clients, "http://localhost:8080"};
    ControlChannel control{store, lifecycle};

    void SetUp() override {
        fetcher.respondOk("GET /index.html", "<html></html>", "text/html");
    }
};

TEST(ControlMessageTest, ParsesKnownTypes) {
    auto msg = parseControlMessage(R"({"type": "SKIP_WAITING"})");
    ASSERT_TRUE(msg.has_value());
    EXPECT_TRUE(std::holds_alternative<SkipWaitingMessage>(*msg));

    msg = parseControlMessage(R"({"type": "CLEAR_CACHE", "extra": 1})");
    ASSERT_TRUE(msg.has_value());
    EXPECT_TRUE(std::holds_alternative<ClearCacheMessage>(*msg));
}

TEST(ControlMessageTest, RejectsEverythingElse) {
    EXPECT_FALSE(parseControlMessage("").has_value());
    EXPECT_FALSE(parseControlMessage("SKIP_WAITING").has_value());
    EXPECT_FALSE(parseControlMessage(R"({"kind": "GET_VERSION"})").has_value());
    EXPECT_FALSE(parseControlMessage(R"({"type": 7})").has_value());
    EXPECT_FALSE(parseControlMessage(R"({"type": "get_version"})").has_value());
    EXPECT_FALSE(parseControlMessage(R"(["GET_VERSION"])").has_value());
}

TEST_F(ControlChannelTest, GetVersionRepliesWithActiveVersion) {
    lifecycle.install("1.1.0", {"/index.html"}, "/offline.html", false, true);
    lifecycle.activateIfReady();

    auto reply = control.handleRaw(R"({"type": "GET_VERSION"})");
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["version"].get<std::string>(), "1.1.0");
}

TEST_F(ControlChannelTest, GetVersionBeforeActivationReportsWaitingVersion) {
    lifecycle.install("2.0.0", {"/index.html"}, "/offline.html", false, false);
    auto reply = control.handle(GetVersionMessage{});
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["version"].get<std::string>(), "2.0.0");
}

TEST_F(ControlChannelTest, ClearCacheDropsEveryNamespaceAndIsIdempotent) {
    lifecycle.install("1.1.0", {"/index.html"}, "/offline.html", false, true);
    lifecycle.activateIfReady();
    store.put("runtime-1.1.0", "GET /api/x",
              CacheEntry("GET /api/x", makeResponse(200, "OK", "application/json", "{}"), CacheEntry::fromMillis(1)));

    auto first = control.handleRaw(R"({"type": "CLEAR_CACHE"})");
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE((*first)["success"].get<bool>());
    EXPECT_TRUE(store.listNamespaces().empty());

    auto second = control.handleRaw(R"({"type": "CLEAR_CACHE"})");
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE((*second)["success"].get<bool>());
    EXPECT_TRUE(store.listNamespaces().empty());

    // the version keeps serving; it only lost its cache
    EXPECT_EQ(lifecycle.activeVersion(), "1.1.0");
}

TEST_F(ControlChannelTest, SkipWaitingActivatesWaitingVersionWithoutReply) {
    lifecycle.install("1.0.0", {"/index.html"}, "/offline.html", false, true);
    lifecycle.activateIfReady();
    clients.open("/");
    lifecycle.install("1.1.0", {"/index.html"}, "/offline.html", false, false);
    lifecycle.activateIfReady();
    ASSERT_EQ(lifecycle.activeVersion(), "1.0.0");

    EXPECT_FALSE(control.handleRaw(R"({"type": "SKIP_WAITING"})").has_value());
    EXPECT_EQ(lifecycle.activeVersion(), "1.1.0");
}

TEST_F(ControlChannelTest, SkipWaitingWithNothingWaitingIsHarmless) {
    EXPECT_FALSE(control.handle(SkipWaitingMessage{}).has_value());
    EXPECT_EQ(lifecycle.activeVersion(), "");
}

TEST_F(ControlChannelTest, ForceUpdateRepliesSuccess) {
    lifecycle.install("1.0.0", {"/index.html"}, "/offline.html", false, true);
    lifecycle.activateIfReady();
    clients.open("/");
    lifecycle.install("1.1.0", {"/index.html"}, "/offline.html", false, false);

    auto reply = control.handleRaw(R"({"type": "FORCE_UPDATE"})");
    ASSERT_TRUE(reply.has_value());
    EXPECT_TRUE((*reply)["success"].get<bool>());
    EXPECT_EQ(lifecycle.activeVersion(), "1.1.0");
}

TEST_F(ControlChannelTest, MalformedMessageGetsNoReplyAndChangesNothing) {
    lifecycle.install("1.1.0", {"/index.html"}, "/offline.html", false, true);
    lifecycle.activateIfReady();

    EXPECT_FALSE(control.handleRaw("{not json").has_value());
    EXPECT_FALSE(control.handleRaw(R"({"type": "SELF_DESTRUCT"})").has_value());
    EXPECT_EQ(store.countEntries("app-shell-1.1.0"), 1u);
}
