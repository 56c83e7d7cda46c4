#include "connHandler.hpp"
#include "agent.hpp"
#include "utils.hpp"
#include "logger.hpp"
#include "requestClassifier.hpp"
#include "server.hpp"
#include "threadPool.hpp"

#include <unistd.h>
#include <arpa/inet.h>
#include <sstream>
#include <cstring>
#include <cerrno>
#include <algorithm>
#include <sys/select.h>
#include <sys/time.h>

std::atomic<int> connHandler::requestCounter{0};

// How long a client may take to send its request
static const std::chrono::milliseconds CLIENT_READ_TIMEOUT(30000);

connHandler::connHandler(int clientFd, const sockaddr_in &clientAddr, Agent &agent,
                         ThreadPool &tunnels, const ConnSettings &settings)
    : clientFd(clientFd), clientAddr(clientAddr), agent(agent), tunnels(tunnels), settings(settings) {}

connHandler::~connHandler(){
    if(clientFd >= 0){
        close(clientFd);
    }
}

std::string connHandler::getClientIp() const{
    char ip_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &(clientAddr.sin_addr), ip_str, INET_ADDRSTRLEN);
    return std::string(ip_str);
}

void connHandler::handleConnection(){
    int reqId = requestCounter.fetch_add(1);

    if(!setSocketTimeout(clientFd, CLIENT_READ_TIMEOUT)){
        Logger::getInstance().logWarning(reqId, "cannot set client socket timeout");
    }

    Request req;
    try{
        req = readHttpRequestFromFd(clientFd, deadlineAfter(CLIENT_READ_TIMEOUT));
    } catch (const std::exception &e) {
        Logger::getInstance().logError(reqId, std::string("malformed request: ") + e.what());
        Logger::getInstance().logRespond(reqId, "HTTP/1.1 400 Bad Request");
        reply(makeResponse(400, "Bad Request", "text/plain", "Bad Request"), reqId);
        return;
    }

    {
        std::ostringstream oss;
        oss << req.method << " " << req.url << " " << req.version;
        Logger::getInstance().logNewRequest(reqId, oss.str(), getClientIp());
    }

    if(req.method == "CONNECT"){
        handleConnect(req.url, reqId);
        return;
    }

    Response res = agent.isControlRequest(req)
        ? agent.handleControl(req, reqId)
        : agent.intercept(req, reqId);

    // committed cache writes stay even when the reply is lost
    reply(res, reqId);
}

void connHandler::reply(const Response &res, int reqId){
    std::string wire = serializeResponseForClient(res);
    if(!sendAll(clientFd, wire.data(), wire.size())){
        Logger::getInstance().logNote(reqId, "client went away before the response was sent");
    }
}

void connHandler::handleConnect(const std::string &target, int reqId){
    std::string host = target;
    std::string port = "443";
    size_t col_pos = host.rfind(':');
    if(col_pos != std::string::npos){
        port = host.substr(col_pos + 1);
        host = host.substr(0, col_pos);
    }

    Logger::getInstance().logClassified(reqId, categoryName(RequestCategory::CrossOrigin),
                                          strategyName(StrategyDecision::Bypass));
    int serverFd = connectToOther(host, port, settings.networkTimeout);
    if(serverFd < 0){
        Logger::getInstance().logRespond(reqId, "HTTP/1.1 502 Bad Gateway");
        reply(makeResponse(502, "Bad Gateway", "text/plain", ""), reqId);
        return;
    }

    Logger::getInstance().logRespond(reqId, "HTTP/1.1 200 Connection Established");
    const char *established = "HTTP/1.1 200 Connection Established\r\n"
                              "Proxy-Agent: offline-agent/1.0\r\n"
                              "\r\n";
    if(!sendAll(clientFd, established, strlen(established))){
        close(serverFd);
        Logger::getInstance().logTunnelClosed(reqId);
        return;
    }

    // the tunnel pool owns both sockets from here on
    int tunnelClient = clientFd;
    std::chrono::milliseconds idleTimeout = settings.tunnelIdleTimeout;
    bool queued = tunnels.enqueue([tunnelClient, serverFd, idleTimeout, reqId]() {
        relayUntilIdle(tunnelClient, serverFd, idleTimeout, reqId);
        close(tunnelClient);
        close(serverFd);
        Logger::getInstance().logTunnelClosed(reqId);
    });
    if(!queued){
        close(serverFd);
        Logger::getInstance().logTunnelClosed(reqId);
        return;
    }
    clientFd = -1;
}

// Moves one read's worth of bytes; false once either side is done
static bool relay(int from, int to, char *buf, size_t bufSize){
    ssize_t nBytes = recv(from, buf, bufSize, 0);
    if(nBytes <= 0){
        return false;
    }
    return sendAll(to, buf, (size_t)nBytes);
}

void connHandler::relayUntilIdle(int clientFd, int serverFd, std::chrono::milliseconds idleTimeout, int reqId){
    int maxFd = std::max(clientFd, serverFd);
    char buf[8192];
    auto lastTraffic = std::chrono::steady_clock::now();

    while(!Server::shutdownRequested()){
        fd_set readable;
        FD_ZERO(&readable);
        FD_SET(clientFd, &readable);
        FD_SET(serverFd, &readable);

        // wake up every second to notice idleness and shutdown
        struct timeval slice;
        slice.tv_sec = 1;
        slice.tv_usec = 0;
        int ready = select(maxFd + 1, &readable, nullptr, nullptr, &slice);
        if(ready < 0){
            if(errno == EINTR) continue;
            Logger::getInstance().logError(reqId, std::string("tunnel select failed: ") + strerror(errno));
            return;
        }
        if(ready == 0){
            if(std::chrono::steady_clock::now() - lastTraffic >= idleTimeout){
                Logger::getInstance().logNote(reqId, "tunnel idle, closing");
                return;
            }
            continue;
        }

        lastTraffic = std::chrono::steady_clock::now();
        if(FD_ISSET(clientFd, &readable) && !relay(clientFd, serverFd, buf, sizeof(buf))){
            return;
        }
        if(FD_ISSET(serverFd, &readable) && !relay(serverFd, clientFd, buf, sizeof(buf))){
            return;
        }
    }
}
