#ifndef CONNHANDLER_HPP
#define CONNHANDLER_HPP

#include <string>
#include <netinet/in.h>
#include <atomic>
#include <chrono>

#include "utils.hpp"

class Agent;
class ThreadPool;

struct ConnSettings {
    std::chrono::milliseconds networkTimeout{5000};
    std::chrono::milliseconds tunnelIdleTimeout{60000};
};

class connHandler {
public:
    connHandler(int clientFd, const sockaddr_in &clientAddr, Agent &agent,
                ThreadPool &tunnels, const ConnSettings &settings);
    ~connHandler();

    void handleConnection();

    // Copies bytes both ways until a side closes, nothing moves for
    // idleTimeout, or shutdown is requested. Neither socket is closed.
    static void relayUntilIdle(int clientFd, int serverFd, std::chrono::milliseconds idleTimeout, int reqId);

private:
    int clientFd;
    const sockaddr_in clientAddr;
    Agent &agent;
    ThreadPool &tunnels;
    ConnSettings settings;
    static std::atomic<int> requestCounter;

    std::string getClientIp() const;
    void reply(const Response &res, int reqId);

    // CONNECT targets are never intercepted; the tunnel runs on its own pool
    void handleConnect(const std::string &target, int reqId);
};

#endif // CONNHANDLER_HPP
