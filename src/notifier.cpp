#include "notifier.hpp"
#include "logger.hpp"
#include "utils.hpp"

using nlohmann::json;

const char *Notifier::BACKGROUND_SYNC_TAG = "background-sync";

Notifier::Notifier(ClientHub &clients, NotificationDefaults defaults, WallClock clock)
    : clients(clients), defaults(std::move(defaults)), clock(std::move(clock)) {}

bool Notifier::onPush(const std::string &payload) {
    json data;
    try {
        data = json::parse(payload);
    } catch (const json::exception &e) {
        Logger::getInstance().logWarning(-1, std::string("push payload not displayed: ") + e.what());
        return false;
    }
    if (!data.is_object()) {
        Logger::getInstance().logWarning(-1, "push payload not displayed: not an object");
        return false;
    }

    json notification = {
        {"type", "NOTIFICATION"},
        {"title", data.contains("title") && data["title"].is_string() ? data["title"].get<std::string>() : defaults.title},
        {"body", data.contains("body") && data["body"].is_string() ? data["body"].get<std::string>() : defaults.body},
        {"icon", defaults.icon},
        {"badge", defaults.badge},
        {"data", data}
    };

    size_t shown = clients.broadcast(notification);
    Logger::getInstance().logNote(-1, "notification \"" + notification["title"].get<std::string>() +
                                  "\" shown on " + std::to_string(shown) + " clients");
    return true;
}

std::string Notifier::onNotificationClick() {
    std::string focused = clients.focusFirst();
    if (!focused.empty()) {
        Logger::getInstance().logNote(-1, "notification click focused " + focused);
        return focused;
    }
    return clients.open("/");
}

size_t Notifier::onBackgroundSync(const std::string &tag) {
    if (tag != BACKGROUND_SYNC_TAG) {
        Logger::getInstance().logNote(-1, "sync tag " + tag + " ignored");
        return 0;
    }
    json message = {
        {"type", "BACKGROUND_SYNC"},
        {"timestamp", formatIso8601(clock())}
    };
    return clients.broadcast(message);
}
