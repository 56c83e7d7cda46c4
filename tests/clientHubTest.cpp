#include "clientHub.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <thread>

TEST(ClientHubTest, OpenAssignsSequentialIds) {
    ClientHub hub;
    EXPECT_EQ(hub.open("/"), "client-1");
    EXPECT_EQ(hub.open("/settings"), "client-2");
    EXPECT_EQ(hub.count(), 2u);
    EXPECT_TRUE(hub.contains("client-2"));
}

TEST(ClientHubTest, TouchRegistersUnknownClientUnderItsOwnId) {
    ClientHub hub;
    hub.touch("tab-7", "/index.html");
    ASSERT_TRUE(hub.contains("tab-7"));
    hub.touch("tab-7", "/other");
    auto clients = hub.snapshot();
    ASSERT_EQ(clients.size(), 1u);
    EXPECT_EQ(clients[0].url, "/other");
}

TEST(ClientHubTest, BroadcastReachesEveryMailbox) {
    ClientHub hub;
    std::string a = hub.open("/");
    std::string b = hub.open("/");
    EXPECT_EQ(hub.broadcast({{"type", "PING"}}), 2u);

    auto msgs = hub.drain(a);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0]["type"].get<std::string>(), "PING");
    EXPECT_TRUE(hub.drain(a).empty());
    EXPECT_EQ(hub.drain(b).size(), 1u);
}

TEST(ClientHubTest, MailboxKeepsNewestMessages) {
    ClientHub hub(2);
    std::string id = hub.open("/");
    for (int i = 0; i < 5; ++i) {
        hub.post(id, {{"n", i}});
    }
    auto msgs = hub.drain(id);
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(msgs[0]["n"].get<int>(), 3);
    EXPECT_EQ(msgs[1]["n"].get<int>(), 4);
}

TEST(ClientHubTest, ClaimAllSwitchesControllerAndNotifies) {
    ClientHub hub;
    std::string a = hub.open("/");
    std::string b = hub.open("/");
    EXPECT_EQ(hub.claimAll("1.1.0"), 2u);

    for (const auto &client : hub.snapshot()) {
        EXPECT_EQ(client.controllerVersion, "1.1.0");
    }
    auto msgs = hub.drain(b);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0]["type"].get<std::string>(), "CONTROLLER_CHANGE");
    EXPECT_EQ(msgs[0]["version"].get<std::string>(), "1.1.0");
}

TEST(ClientHubTest, FocusFirstPicksRegistrationOrder) {
    ClientHub hub;
    EXPECT_EQ(hub.focusFirst(), "");
    std::string first = hub.open("/a");
    hub.open("/b");
    EXPECT_EQ(hub.focusFirst(), first);
    EXPECT_TRUE(hub.snapshot()[0].focused);
    EXPECT_FALSE(hub.snapshot()[1].focused);
}

TEST(ClientHubTest, CloseAndUnknownIds) {
    ClientHub hub;
    std::string id = hub.open("/");
    EXPECT_TRUE(hub.close(id));
    EXPECT_FALSE(hub.close(id));
    EXPECT_FALSE(hub.post(id, {{"type", "X"}}));
    EXPECT_TRUE(hub.drain(id).empty());
    EXPECT_EQ(hub.count(), 0u);
}

TEST(ClientHubTest, OpenSkipsIdsAlreadyClaimedByHeader) {
    ClientHub hub;
    hub.touch("client-2", "/");
    std::string opened = hub.open("/");
    EXPECT_NE(opened, "client-2");
    EXPECT_EQ(hub.count(), 2u);

    EXPECT_TRUE(hub.close("client-2"));
    EXPECT_TRUE(hub.close(opened));
    EXPECT_EQ(hub.count(), 0u);
    EXPECT_FALSE(hub.contains("client-2"));
}

TEST(ClientHubTest, ExpireIdleRemovesOnlyStaleClients) {
    ClientHub hub;
    hub.touch("tab-old", "/");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    auto mark = std::chrono::steady_clock::now();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    std::string fresh = hub.open("/");

    std::vector<std::string> expired = hub.expireIdle(std::chrono::minutes(30), mark + std::chrono::minutes(30));
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired[0], "tab-old");
    EXPECT_TRUE(hub.contains(fresh));
    EXPECT_EQ(hub.count(), 1u);
}

TEST(ClientHubTest, DrainKeepsClientAlive) {
    ClientHub hub;
    std::string id = hub.open("/");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    auto mark = std::chrono::steady_clock::now();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    hub.drain(id);

    EXPECT_TRUE(hub.expireIdle(std::chrono::seconds(60), mark + std::chrono::seconds(60)).empty());
    EXPECT_EQ(hub.expireIdle(std::chrono::seconds(60), mark + std::chrono::seconds(120)).size(), 1u);
    EXPECT_FALSE(hub.contains(id));
}
