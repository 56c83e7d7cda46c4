#include "fetcher.hpp"
#include "server.hpp"
#include "testSupport.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <sys/socket.h>
#include <unistd.h>

// Loopback origin serving exactly one connection with a scripted writer
class LoopbackOrigin {
public:
    explicit LoopbackOrigin(std::function<void(int)> writer) : server(0) {
        server.init();
        worker = std::thread([this, writer]() {
            sockaddr_in addr;
            socklen_t len = sizeof(addr);
            int fd = server.acceptConnection(addr, len);
            if (fd < 0) return;
            char buf[4096];
            recv(fd, buf, sizeof(buf), 0);
            writer(fd);
            close(fd);
        });
    }

    ~LoopbackOrigin() {
        if (worker.joinable()) worker.join();
    }

    std::string url(const std::string &path) const {
        return "http://127.0.0.1:" + std::to_string(server.get_port()) + path;
    }

private:
    Server server;
    std::thread worker;
};

TEST(HttpFetcherTest, ReadsPromptResponse) {
    LoopbackOrigin origin([](int fd) {
        std::string reply = "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 5\r\n\r\nhello";
        sendAll(fd, reply.data(), reply.size());
    });

    HttpFetcher fetcher(std::chrono::milliseconds(2000));
    Response res = fetcher.fetch(makeGet(origin.url("/ok")), 1);
    EXPECT_EQ(res.status_code, 200);
    EXPECT_EQ(res.body, "hello");
}

TEST(HttpFetcherTest, TrickledBodyStillHitsDeadline) {
    LoopbackOrigin origin([](int fd) {
        std::string head = "HTTP/1.1 200 OK\r\nContent-Length: 20\r\n\r\n";
        if (!sendAll(fd, head.data(), head.size())) return;
        // each byte arrives well inside the deadline, the whole body does not
        for (int i = 0; i < 20; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            if (!sendAll(fd, "x", 1)) return;
        }
    });

    HttpFetcher fetcher(std::chrono::milliseconds(500));
    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(fetcher.fetch(makeGet(origin.url("/slow")), 2), NetworkFailure);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(1500));
}

TEST(HttpFetcherTest, SilentOriginHitsDeadline) {
    LoopbackOrigin origin([](int) {
        std::this_thread::sleep_for(std::chrono::milliseconds(800));
    });

    HttpFetcher fetcher(std::chrono::milliseconds(300));
    EXPECT_THROW(fetcher.fetch(makeGet(origin.url("/hang")), 3), NetworkFailure);
}

TEST(HttpFetcherTest, RefusedConnectionIsNetworkFailure) {
    HttpFetcher fetcher(std::chrono::milliseconds(500));
    EXPECT_THROW(fetcher.fetch(makeGet("http://127.0.0.1:1/nothing"), 4), NetworkFailure);
}
