#include "clientHub.hpp"
#include "logger.hpp"

ClientHub::ClientHub(size_t mailboxLimit) : mailboxLimit(mailboxLimit), nextId(1) {}

ClientRecord *ClientHub::findUnsafe(const std::string &id) {
    for (auto &kv : clients) {
        if (kv.second.id == id) return &kv.second;
    }
    return nullptr;
}

void ClientHub::enqueueUnsafe(ClientRecord &client, const nlohmann::json &message) {
    client.mailbox.push_back(message);
    while (client.mailbox.size() > mailboxLimit) {
        client.mailbox.pop_front();
    }
}

std::string ClientHub::open(const std::string &url) {
    std::lock_guard<std::mutex> lock(hubMutex);
    // X-Client-Id may already have claimed a generated-looking id
    unsigned long long seq;
    std::string id;
    do {
        seq = nextId++;
        id = "client-" + std::to_string(seq);
    } while (findUnsafe(id));

    ClientRecord record;
    record.id = id;
    record.url = url.empty() ? "/" : url;
    record.lastSeen = std::chrono::steady_clock::now();
    clients[seq] = record;
    Logger::getInstance().logNote(-1, "client " + record.id + " opened at " + record.url);
    return record.id;
}

void ClientHub::touch(const std::string &id, const std::string &url) {
    std::lock_guard<std::mutex> lock(hubMutex);
    ClientRecord *client = findUnsafe(id);
    if (client) {
        if (!url.empty()) client->url = url;
        client->lastSeen = std::chrono::steady_clock::now();
        return;
    }

    // a client we have not seen before keeps its own id
    ClientRecord record;
    record.id = id;
    record.url = url.empty() ? "/" : url;
    record.lastSeen = std::chrono::steady_clock::now();
    clients[nextId++] = record;
}

bool ClientHub::close(const std::string &id) {
    std::lock_guard<std::mutex> lock(hubMutex);
    for (auto it = clients.begin(); it != clients.end(); ++it) {
        if (it->second.id == id) {
            clients.erase(it);
            Logger::getInstance().logNote(-1, "client " + id + " closed");
            return true;
        }
    }
    return false;
}

std::vector<std::string> ClientHub::expireIdle(std::chrono::milliseconds maxIdle,
                                               std::chrono::steady_clock::time_point now) {
    std::lock_guard<std::mutex> lock(hubMutex);
    std::vector<std::string> expired;
    for (auto it = clients.begin(); it != clients.end();) {
        if (now - it->second.lastSeen > maxIdle) {
            expired.push_back(it->second.id);
            Logger::getInstance().logNote(-1, "client " + it->second.id + " expired after idling");
            it = clients.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

size_t ClientHub::broadcast(const nlohmann::json &message) {
    std::lock_guard<std::mutex> lock(hubMutex);
    for (auto &kv : clients) {
        enqueueUnsafe(kv.second, message);
    }
    return clients.size();
}

bool ClientHub::post(const std::string &id, const nlohmann::json &message) {
    std::lock_guard<std::mutex> lock(hubMutex);
    ClientRecord *client = findUnsafe(id);
    if (!client) return false;
    enqueueUnsafe(*client, message);
    return true;
}

std::vector<nlohmann::json> ClientHub::drain(const std::string &id) {
    std::lock_guard<std::mutex> lock(hubMutex);
    std::vector<nlohmann::json> out;
    ClientRecord *client = findUnsafe(id);
    if (!client) return out;

    out.assign(client->mailbox.begin(), client->mailbox.end());
    client->mailbox.clear();
    client->lastSeen = std::chrono::steady_clock::now();
    return out;
}

size_t ClientHub::claimAll(const std::string &version) {
    std::lock_guard<std::mutex> lock(hubMutex);
    for (auto &kv : clients) {
        kv.second.controllerVersion = version;
        enqueueUnsafe(kv.second, {{"type", "CONTROLLER_CHANGE"}, {"version", version}});
    }
    return clients.size();
}

std::string ClientHub::focusFirst() {
    std::lock_guard<std::mutex> lock(hubMutex);
    if (clients.empty()) return "";

    for (auto &kv : clients) {
        kv.second.focused = false;
    }
    ClientRecord &first = clients.begin()->second;
    first.focused = true;
    enqueueUnsafe(first, {{"type", "FOCUS"}});
    return first.id;
}

size_t ClientHub::count() const {
    std::lock_guard<std::mutex> lock(hubMutex);
    return clients.size();
}

bool ClientHub::contains(const std::string &id) const {
    std::lock_guard<std::mutex> lock(hubMutex);
    for (const auto &kv : clients) {
        if (kv.second.id == id) return true;
    }
    return false;
}

std::vector<ClientRecord> ClientHub::snapshot() const {
    std::lock_guard<std::mutex> lock(hubMutex);
    std::vector<ClientRecord> out;
    out.reserve(clients.size());
    for (const auto &kv : clients) {
        out.push_back(kv.second);
    }
    return out;
}
