#include "agent.hpp"
#include "logger.hpp"

#include <algorithm>
#include <sstream>

using nlohmann::json;

static const char *CLIENT_ID_HEADER = "X-Client-Id";

static NotificationDefaults notificationDefaults(const AgentConfig &config) {
    NotificationDefaults defaults;
    defaults.title = config.notificationTitle;
    defaults.body = config.notificationBody;
    defaults.icon = config.notificationIcon;
    defaults.badge = config.notificationBadge;
    return defaults;
}

static Response jsonResponse(int status, const std::string &statusMsg, const json &body) {
    Response res = makeResponse(status, statusMsg, "application/json", body.dump());
    res.headers["Cache-Control"] = "no-store";
    return res;
}

static Response emptyResponse(int status, const std::string &statusMsg) {
    Response res;
    res.status_code = status;
    res.status_msg = statusMsg;
    return res;
}

static std::string queryParam(const std::string &query, const std::string &name) {
    std::istringstream iss(query);
    std::string pair;
    while (std::getline(iss, pair, '&')) {
        size_t eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == name) {
            return pair.substr(eq + 1);
        }
    }
    return "";
}

Agent::Agent(const AgentConfig &config, NamespaceStore &store, Fetcher &fetcher, WallClock clock)
    : config(config),
      store(store),
      fetcher(fetcher),
      clock(clock),
      classifier(config.appOrigin, config.apiPrefix),
      eviction(config.runtimeCapacity, config.evictionFraction),
      clients(),
      lifecycle(store, fetcher, eviction, clients, config.appOrigin, clock),
      control(store, lifecycle),
      notifications(clients, notificationDefaults(config), clock),
      router(store, fetcher,
             [this](const std::string &version, std::function<void()> task) {
                 spawnBackground(version, std::move(task));
             },
             clock),
      maintenanceStop(false),
      lastEviction(std::chrono::steady_clock::now()),
      background(std::make_unique<ThreadPool>(config.backgroundThreads, "background")) {}

Agent::~Agent() {
    stopMaintenance();
    background.reset();
}

void Agent::spawnBackground(const std::string &version, std::function<void()> task) {
    bool queued = background->enqueue([this, version, task]() {
        auto gate = lifecycle.enterShared();
        if (lifecycle.activeVersion() != version) {
            Logger::getInstance().logNote(-1, "background task of superseded version " + version + " dropped");
            return;
        }
        task();
    });
    if (!queued) {
        Logger::getInstance().logNote(-1, "background pool stopping, refresh for " + version + " skipped");
    }
}

InstallReport Agent::start() {
    return deploy(config);
}

InstallReport Agent::deploy(const AgentConfig &next) {
    InstallReport report = lifecycle.install(next.version, next.manifest, next.offlineUrl,
                                             next.strictInstall, next.skipWaitingOnInstall);
    if (report.ok) {
        lifecycle.activateIfReady();
    }
    return report;
}

Request Agent::resolveAgainstOrigin(const Request &req) const {
    if (req.url.empty() || req.url.front() != '/') return req;

    // origin-form: the agent fronts the app origin
    Request out = req;
    UrlParts origin;
    if (parseUrl(config.appOrigin, origin)) {
        out.url = origin.origin() + req.url;
        eraseHeader(out.headers, "Host");
        out.headers["Host"] = origin.host + ":" + origin.port;
    }
    return out;
}

RequestDescriptor Agent::describe(const Request &req) const {
    RequestDescriptor desc;
    desc.method = req.method;
    desc.url = req.url;
    desc.acceptHeader = headerValue(req.headers, "Accept");
    desc.isNavigation = toLower(headerValue(req.headers, "Sec-Fetch-Mode")) == "navigate";
    return desc;
}

Response Agent::intercept(const Request &req, int requestId) {
    try {
        Request routed = resolveAgainstOrigin(req);

        std::string clientId = headerValue(routed.headers, CLIENT_ID_HEADER);
        if (!clientId.empty()) {
            UrlParts parts;
            clients.touch(clientId, parseUrl(routed.url, parts) ? parts.pathAndQuery() : "");
            eraseHeader(routed.headers, CLIENT_ID_HEADER);
        }

        RequestCategory category = classifier.classify(describe(routed));
        if (category == RequestCategory::CrossOrigin) {
            return router.route(routed, category, RouteContext(), requestId);
        }

        auto gate = lifecycle.enterShared();
        std::optional<RouteContext> ctx = lifecycle.activeContext();
        if (!ctx) {
            // nothing controls this client yet
            Logger::getInstance().logNote(requestId, "no active version, passing through");
            return router.bypass(routed, requestId);
        }
        return router.route(routed, category, *ctx, requestId);
    } catch (const std::exception &e) {
        Logger::getInstance().logError(requestId, std::string("request handling failed: ") + e.what());
    } catch (...) {
        Logger::getInstance().logError(requestId, "request handling failed with a non-standard exception");
    }
    return makeResponse(500, "Internal Server Error", "text/plain", "Internal agent error");
}

std::string Agent::controlPath(const Request &req) const {
    UrlParts parts;
    if (!parseUrl(req.url, parts)) return "";
    if (!parts.scheme.empty() && parts.origin() != classifier.origin()) return "";

    const std::string &prefix = config.controlPrefix;
    if (parts.path.compare(0, prefix.size(), prefix) != 0) return "";
    std::string rest = parts.path.substr(prefix.size());
    if (!rest.empty() && rest.front() != '/') return "";
    return rest.empty() ? "/" : rest;
}

bool Agent::isControlRequest(const Request &req) const {
    return !controlPath(req).empty();
}

Response Agent::handleControl(const Request &req, int requestId) {
    std::string path = controlPath(req);
    UrlParts parts;
    parseUrl(req.url, parts);

    Response res;
    try {
        if (req.method == "POST" && path == "/message") {
            std::optional<json> reply = control.handleRaw(req.body);
            res = reply ? jsonResponse(200, "OK", *reply) : emptyResponse(204, "No Content");
        } else if (req.method == "POST" && path == "/push") {
            res = notifications.onPush(req.body)
                ? emptyResponse(202, "Accepted")
                : jsonResponse(400, "Bad Request", {{"error", "invalid push payload"}});
        } else if (req.method == "POST" && path == "/notificationclick") {
            res = jsonResponse(200, "OK", {{"client", notifications.onNotificationClick()}});
        } else if (req.method == "POST" && path == "/sync") {
            std::string tag = queryParam(parts.query, "tag");
            res = jsonResponse(200, "OK", {{"notified", notifications.onBackgroundSync(tag)}});
        } else if (req.method == "POST" && path == "/clients") {
            std::string url = "/";
            if (!req.body.empty()) {
                json body = json::parse(req.body, nullptr, false);
                if (body.is_object() && body.contains("url") && body["url"].is_string()) {
                    url = body["url"].get<std::string>();
                }
            }
            res = jsonResponse(201, "Created", {{"id", clients.open(url)}});
        } else if (path.compare(0, 9, "/clients/") == 0) {
            std::string rest = path.substr(9);
            size_t slash = rest.find('/');
            std::string id = rest.substr(0, slash);
            std::string action = slash == std::string::npos ? "" : rest.substr(slash);

            if (req.method == "GET" && action == "/messages") {
                if (!clients.contains(id)) {
                    res = jsonResponse(404, "Not Found", {{"error", "unknown client"}});
                } else {
                    res = jsonResponse(200, "OK", json(clients.drain(id)));
                }
            } else if (req.method == "DELETE" && action.empty()) {
                if (clients.close(id)) {
                    lifecycle.clientsChanged();
                    res = emptyResponse(204, "No Content");
                } else {
                    res = jsonResponse(404, "Not Found", {{"error", "unknown client"}});
                }
            } else {
                res = jsonResponse(404, "Not Found", {{"error", "unknown control endpoint"}});
            }
        } else if (req.method == "GET" && path == "/status") {
            res = jsonResponse(200, "OK", {
                {"active", lifecycle.activeVersion()},
                {"waiting", lifecycle.waitingVersion()},
                {"clients", clients.count()}
            });
        } else {
            res = jsonResponse(404, "Not Found", {{"error", "unknown control endpoint"}});
        }
    } catch (const std::exception &e) {
        Logger::getInstance().logError(requestId, std::string("control request failed: ") + e.what());
        res = makeResponse(500, "Internal Server Error", "text/plain", "Internal agent error");
    }

    std::ostringstream line;
    line << res.version << " " << res.status_code << " " << res.status_msg;
    Logger::getInstance().logRespond(requestId, line.str());
    return res;
}

std::chrono::milliseconds Agent::maintenancePeriod() const {
    std::chrono::milliseconds period(0);
    if (config.evictionInterval.count() > 0) {
        period = config.evictionInterval;
    }
    if (config.clientIdleTimeout.count() > 0) {
        std::chrono::milliseconds sweep = std::max(std::chrono::milliseconds(1000), config.clientIdleTimeout / 2);
        period = period.count() > 0 ? std::min(period, sweep) : sweep;
    }
    return period;
}

void Agent::runMaintenance() {
    if (config.evictionInterval.count() > 0) {
        auto now = std::chrono::steady_clock::now();
        if (now - lastEviction >= config.evictionInterval) {
            lifecycle.runEviction();
            lastEviction = now;
        }
    }
    expireIdleClients();
}

size_t Agent::expireIdleClients() {
    if (config.clientIdleTimeout.count() <= 0) return 0;

    std::vector<std::string> expired = clients.expireIdle(config.clientIdleTimeout);
    if (!expired.empty()) {
        lifecycle.clientsChanged();
    }
    return expired.size();
}

void Agent::startMaintenance() {
    std::chrono::milliseconds period = maintenancePeriod();
    if (period.count() <= 0 || maintenance.joinable()) return;

    {
        std::lock_guard<std::mutex> lock(maintenanceMutex);
        maintenanceStop = false;
    }
    lastEviction = std::chrono::steady_clock::now();
    maintenance = std::thread([this, period]() {
        std::unique_lock<std::mutex> lock(maintenanceMutex);
        while (!maintenanceCondition.wait_for(lock, period, [this]{ return maintenanceStop; })) {
            lock.unlock();
            try {
                runMaintenance();
            } catch (const std::exception &e) {
                Logger::getInstance().logError(-1, std::string("maintenance sweep failed: ") + e.what());
            }
            lock.lock();
        }
    });
}

void Agent::stopMaintenance() {
    {
        std::lock_guard<std::mutex> lock(maintenanceMutex);
        maintenanceStop = true;
    }
    maintenanceCondition.notify_all();
    if (maintenance.joinable()) {
        maintenance.join();
    }
}

void Agent::waitForBackground() {
    background->waitIdle();
}
