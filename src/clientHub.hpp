#ifndef CLIENTHUB_HPP
#define CLIENTHUB_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// A connected dashboard window/tab
struct ClientRecord {
    std::string id;
    std::string url;
    std::string controllerVersion;     // empty while uncontrolled
    bool focused = false;
    std::deque<nlohmann::json> mailbox;
    std::chrono::steady_clock::time_point lastSeen;    // open, touch or drain
};

// Registry of connected clients and their pending messages.
class ClientHub {
public:
    explicit ClientHub(size_t mailboxLimit = 64);

    std::string open(const std::string &url);
    void touch(const std::string &id, const std::string &url);
    bool close(const std::string &id);

    // Removes clients not seen for longer than maxIdle; returns their ids
    std::vector<std::string> expireIdle(std::chrono::milliseconds maxIdle,
                                        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    // Returns the number of clients that received the message
    size_t broadcast(const nlohmann::json &message);
    bool post(const std::string &id, const nlohmann::json &message);

    // Empties the mailbox; empty for an unknown client
    std::vector<nlohmann::json> drain(const std::string &id);

    // Every client switches controller under one lock and is told so
    size_t claimAll(const std::string &version);

    // Focus the first client, in registration order. Empty if none.
    std::string focusFirst();

    size_t count() const;
    bool contains(const std::string &id) const;
    std::vector<ClientRecord> snapshot() const;

private:
    size_t mailboxLimit;
    unsigned long long nextId;
    std::map<unsigned long long, ClientRecord> clients;   // registration order
    mutable std::mutex hubMutex;

    void enqueueUnsafe(ClientRecord &client, const nlohmann::json &message);
    ClientRecord *findUnsafe(const std::string &id);
};

#endif // CLIENTHUB_HPP
