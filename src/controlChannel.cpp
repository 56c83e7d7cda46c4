#include "controlChannel.hpp"
#include "logger.hpp"

#include <functional>

using nlohmann::json;

std::optional<ControlMessage> parseControlMessage(const std::string &body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception &e) {
        Logger::getInstance().logWarning(-1, std::string("control message is not JSON: ") + e.what());
        return std::nullopt;
    }

    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        Logger::getInstance().logWarning(-1, "control message without type: " + j.dump());
        return std::nullopt;
    }

    std::string type = j["type"].get<std::string>();
    if (type == "SKIP_WAITING") return ControlMessage(SkipWaitingMessage{});
    if (type == "GET_VERSION") return ControlMessage(GetVersionMessage{});
    if (type == "CLEAR_CACHE") return ControlMessage(ClearCacheMessage{});
    if (type == "FORCE_UPDATE") return ControlMessage(ForceUpdateMessage{});

    Logger::getInstance().logWarning(-1, "unknown control message type " + type);
    return std::nullopt;
}

ControlChannel::ControlChannel(NamespaceStore &store, LifecycleManager &lifecycle)
    : store(store), lifecycle(lifecycle) {}

json ControlChannel::clearAll() {
    try {
        size_t dropped = 0;
        for (const auto &ns : store.listNamespaces()) {
            store.deleteNamespace(ns);
            ++dropped;
        }
        Logger::getInstance().logNote(-1, "cleared " + std::to_string(dropped) + " namespaces");
        return {{"success", true}};
    } catch (const StoreError &e) {
        Logger::getInstance().logError(-1, std::string("clear cache failed: ") + e.what());
        return {{"success", false}, {"error", e.what()}};
    }
}

namespace {

// One overload per message type; a new type without a handler does not compile
struct ControlVisitor {
    LifecycleManager &lifecycle;
    std::function<json()> clearAll;

    std::optional<json> operator()(const SkipWaitingMessage &) const {
        Logger::getInstance().logNote(-1, "control: SKIP_WAITING");
        lifecycle.skipWaiting();
        return std::nullopt;
    }

    std::optional<json> operator()(const GetVersionMessage &) const {
        std::string version = lifecycle.activeVersion();
        if (version.empty()) version = lifecycle.waitingVersion();
        return json{{"version", version}};
    }

    std::optional<json> operator()(const ClearCacheMessage &) const {
        Logger::getInstance().logNote(-1, "control: CLEAR_CACHE");
        return clearAll();
    }

    std::optional<json> operator()(const ForceUpdateMessage &) const {
        Logger::getInstance().logNote(-1, "control: FORCE_UPDATE");
        lifecycle.skipWaiting();
        return json{{"success", true}};
    }
};

}

std::optional<json> ControlChannel::handle(const ControlMessage &msg) {
    return std::visit(ControlVisitor{lifecycle, [this]() { return clearAll(); }}, msg);
}

std::optional<json> ControlChannel::handleRaw(const std::string &body) {
    std::optional<ControlMessage> msg = parseControlMessage(body);
    if (!msg) return std::nullopt;
    return handle(*msg);
}
