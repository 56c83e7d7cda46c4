#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <vector>
#include <chrono>
#include <cstddef>

// Deploy-time settings of the agent. Every key of the JSON file is optional.
struct AgentConfig {
    int listenPort = 8080;
    std::string appOrigin = "http://localhost:8080";
    std::string version = "1.1.0";
    std::string assetsVersion;
    std::string apiPrefix = "/api/";
    std::string controlPrefix = "/__agent";
    std::string offlineUrl = "/offline.html";

    // Ordered asset paths, cache-busting parameter already applied
    std::vector<std::string> manifest;

    size_t runtimeCapacity = 100;
    double evictionFraction = 0.2;
    std::chrono::seconds evictionInterval{0};
    std::chrono::milliseconds networkTimeout{5000};

    std::string storePath = "cache.db";
    std::string logPath = "offline-agent.log";
    size_t workerThreads = 4;
    size_t backgroundThreads = 2;
    size_t tunnelThreads = 8;

    // CONNECT tunnels close after this long without traffic
    std::chrono::milliseconds tunnelIdleTimeout{60000};
    // Clients unseen for this long are dropped; 0 keeps them forever
    std::chrono::milliseconds clientIdleTimeout{1800000};

    bool skipWaitingOnInstall = true;
    bool strictInstall = false;

    std::string notificationTitle = "Inverter Dashboard";
    std::string notificationBody = "New notification";
    std::string notificationIcon = "/icons/icon-192.png";
    std::string notificationBadge = "/icons/icon-72.png";

    std::string appShellNamespace() const { return "app-shell-" + version; }
    std::string runtimeNamespace() const { return "runtime-" + version; }

    // Desc: read and validate a JSON config file
    // In: path of the file
    // Out: false (with a message on stderr) if missing, malformed or invalid
    bool loadFromFile(const std::string &path);

    // Same as loadFromFile, from an in-memory JSON document
    bool loadFromString(const std::string &text);

    bool validate(std::string &error) const;
};

#endif // CONFIG_HPP
