#ifndef CONTROLCHANNEL_HPP
#define CONTROLCHANNEL_HPP

#include "lifecycleManager.hpp"
#include "namespaceStore.hpp"

#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

struct SkipWaitingMessage {};
struct GetVersionMessage {};
struct ClearCacheMessage {};
struct ForceUpdateMessage {};

// Closed set; anything else on the wire is ignored
using ControlMessage = std::variant<SkipWaitingMessage, GetVersionMessage, ClearCacheMessage, ForceUpdateMessage>;

// {"type": "SKIP_WAITING" | "GET_VERSION" | "CLEAR_CACHE" | "FORCE_UPDATE"}
std::optional<ControlMessage> parseControlMessage(const std::string &body);

class ControlChannel {
public:
    ControlChannel(NamespaceStore &store, LifecycleManager &lifecycle);

    // Reply payload, nullopt when the message gets no reply
    std::optional<nlohmann::json> handle(const ControlMessage &msg);

    // Malformed or unknown messages are logged and get no reply
    std::optional<nlohmann::json> handleRaw(const std::string &body);

private:
    NamespaceStore &store;
    LifecycleManager &lifecycle;

    nlohmann::json clearAll();
};

#endif // CONTROLCHANNEL_HPP
