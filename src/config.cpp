#include "config.hpp"
#include "requestClassifier.hpp"

#include <fstream>
#include <sstream>
#include <iostream>
#include <cmath>
#include <nlohmann/json.hpp>
using nlohmann::json;

template<typename T>
static void readIfPresent(const json &j, const char *key, T &out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

static std::string applyAssetsVersion(const std::string &path, const std::string &assetsVersion) {
    if (assetsVersion.empty()) return path;
    char sep = path.find('?') == std::string::npos ? '?' : '&';
    return path + sep + "v=" + assetsVersion;
}

bool AgentConfig::loadFromFile(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] cannot open file: " << path << "\n";
        return false;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return loadFromString(ss.str());
}

bool AgentConfig::loadFromString(const std::string &text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception &e) {
        std::cerr << "[Config] invalid JSON: " << e.what() << "\n";
        return false;
    }
    if (!j.is_object()) {
        std::cerr << "[Config] top level must be an object\n";
        return false;
    }

    try {
        readIfPresent(j, "listen_port", listenPort);
        readIfPresent(j, "app_origin", appOrigin);
        readIfPresent(j, "version", version);
        readIfPresent(j, "assets_version", assetsVersion);
        readIfPresent(j, "api_prefix", apiPrefix);
        readIfPresent(j, "control_prefix", controlPrefix);
        readIfPresent(j, "offline_url", offlineUrl);
        readIfPresent(j, "runtime_capacity", runtimeCapacity);
        readIfPresent(j, "eviction_fraction", evictionFraction);
        readIfPresent(j, "store_path", storePath);
        readIfPresent(j, "log_path", logPath);
        readIfPresent(j, "worker_threads", workerThreads);
        readIfPresent(j, "background_threads", backgroundThreads);
        readIfPresent(j, "tunnel_threads", tunnelThreads);
        readIfPresent(j, "skip_waiting_on_install", skipWaitingOnInstall);
        readIfPresent(j, "strict_install", strictInstall);
        readIfPresent(j, "notification_title", notificationTitle);
        readIfPresent(j, "notification_body", notificationBody);
        readIfPresent(j, "notification_icon", notificationIcon);
        readIfPresent(j, "notification_badge", notificationBadge);

        if (j.contains("eviction_interval_seconds")) {
            evictionInterval = std::chrono::seconds(j["eviction_interval_seconds"].get<long long>());
        }
        if (j.contains("network_timeout_ms")) {
            networkTimeout = std::chrono::milliseconds(j["network_timeout_ms"].get<long long>());
        }
        if (j.contains("tunnel_idle_timeout_ms")) {
            tunnelIdleTimeout = std::chrono::milliseconds(j["tunnel_idle_timeout_ms"].get<long long>());
        }
        if (j.contains("client_idle_timeout_ms")) {
            clientIdleTimeout = std::chrono::milliseconds(j["client_idle_timeout_ms"].get<long long>());
        }

        // "manifest": ["/index.html", {"path": "/main.css", "versioned": true}]
        if (j.contains("manifest")) {
            if (!j["manifest"].is_array()) {
                std::cerr << "[Config] 'manifest' must be an array\n";
                return false;
            }
            manifest.clear();
            for (const auto &item : j["manifest"]) {
                if (item.is_string()) {
                    manifest.push_back(item.get<std::string>());
                } else if (item.is_object() && item.contains("path") && item["path"].is_string()) {
                    std::string p = item["path"].get<std::string>();
                    if (item.value("versioned", false)) p = applyAssetsVersion(p, assetsVersion);
                    manifest.push_back(p);
                } else {
                    std::cerr << "[Config] invalid manifest entry: " << item.dump() << "\n";
                    return false;
                }
            }
        }
    } catch (const json::exception &e) {
        std::cerr << "[Config] wrong value type: " << e.what() << "\n";
        return false;
    }

    std::string error;
    if (!validate(error)) {
        std::cerr << "[Config] " << error << "\n";
        return false;
    }
    return true;
}

bool AgentConfig::validate(std::string &error) const {
    if (listenPort < 0 || listenPort > 65535) {
        error = "listen_port out of range";
        return false;
    }
    UrlParts origin;
    if (!parseUrl(appOrigin, origin) || origin.scheme.empty()) {
        error = "app_origin must be an absolute http(s) URL: " + appOrigin;
        return false;
    }
    if (version.empty()) {
        error = "version must not be empty";
        return false;
    }
    if (apiPrefix.empty() || apiPrefix.front() != '/') {
        error = "api_prefix must start with '/'";
        return false;
    }
    if (controlPrefix.empty() || controlPrefix.front() != '/') {
        error = "control_prefix must start with '/'";
        return false;
    }
    if (runtimeCapacity == 0) {
        error = "runtime_capacity must be positive";
        return false;
    }
    if (!(evictionFraction > 0.0 && evictionFraction <= 1.0) || std::isnan(evictionFraction)) {
        error = "eviction_fraction must be in (0, 1]";
        return false;
    }
    if (networkTimeout.count() <= 0) {
        error = "network_timeout_ms must be positive";
        return false;
    }
    if (evictionInterval.count() < 0) {
        error = "eviction_interval_seconds must not be negative";
        return false;
    }
    if (workerThreads == 0 || backgroundThreads == 0 || tunnelThreads == 0) {
        error = "worker_threads, background_threads and tunnel_threads must be positive";
        return false;
    }
    if (tunnelIdleTimeout.count() <= 0) {
        error = "tunnel_idle_timeout_ms must be positive";
        return false;
    }
    if (clientIdleTimeout.count() < 0) {
        error = "client_idle_timeout_ms must not be negative";
        return false;
    }
    return true;
}
