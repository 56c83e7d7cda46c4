#ifndef TESTSUPPORT_HPP
#define TESTSUPPORT_HPP

#include "fetcher.hpp"
#include "requestClassifier.hpp"
#include "strategyRouter.hpp"
#include "utils.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>

// Scripted origin. Responses are looked up by entry key ("GET /path?q");
// unknown keys answer 404 like a real server would.
class FakeFetcher : public Fetcher {
public:
    Response fetch(const Request &req, int) override {
        std::string key = makeEntryKey(req.method, req.url);
        std::lock_guard<std::mutex> lock(mtx);
        ++calls[key];
        lastRequests[key] = req;
        if (offline || failing.count(key)) {
            throw NetworkFailure("scripted failure for " + key);
        }
        auto it = responses.find(key);
        if (it == responses.end()) {
            return makeResponse(404, "Not Found", "text/plain", "missing");
        }
        return it->second;
    }

    void respond(const std::string &key, const Response &res) {
        std::lock_guard<std::mutex> lock(mtx);
        responses[key] = res;
    }

    void respondOk(const std::string &key, const std::string &body,
                   const std::string &contentType = "text/plain") {
        respond(key, makeResponse(200, "OK", contentType, body));
    }

    void fail(const std::string &key) {
        std::lock_guard<std::mutex> lock(mtx);
        failing.insert(key);
    }

    void setOffline(bool value) {
        std::lock_guard<std::mutex> lock(mtx);
        offline = value;
    }

    int callCount(const std::string &key) {
        std::lock_guard<std::mutex> lock(mtx);
        return calls[key];
    }

    int totalCalls() {
        std::lock_guard<std::mutex> lock(mtx);
        int n = 0;
        for (const auto &kv : calls) n += kv.second;
        return n;
    }

    Request lastRequest(const std::string &key) {
        std::lock_guard<std::mutex> lock(mtx);
        return lastRequests[key];
    }

private:
    std::mutex mtx;
    std::map<std::string, Response> responses;
    std::set<std::string> failing;
    std::map<std::string, int> calls;
    std::map<std::string, Request> lastRequests;
    bool offline = false;
};

// Settable wall clock, milliseconds since the epoch
class ManualClock {
public:
    explicit ManualClock(long long startMs = 1700000000000LL) : nowMs(startMs) {}

    void set(long long ms) { nowMs = ms; }
    void advance(long long ms) { nowMs += ms; }

    WallClock asWallClock() {
        return [this]() {
            return std::chrono::system_clock::time_point(std::chrono::milliseconds(nowMs.load()));
        };
    }

private:
    std::atomic<long long> nowMs;
};

inline Request makeGet(const std::string &url) {
    Request req;
    req.method = "GET";
    req.url = url;
    return req;
}

#endif // TESTSUPPORT_HPP
