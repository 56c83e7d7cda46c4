#ifndef NOTIFIER_HPP
#define NOTIFIER_HPP

#include "clientHub.hpp"
#include "strategyRouter.hpp"

#include <string>
#include <nlohmann/json.hpp>

struct NotificationDefaults {
    std::string title = "Inverter Dashboard";
    std::string body = "New notification";
    std::string icon = "/icons/icon-192.png";
    std::string badge = "/icons/icon-72.png";
};

// Push display, notification click and background-sync broadcast.
// Background sync only tells clients to refresh; nothing is queued or replayed.
class Notifier {
public:
    Notifier(ClientHub &clients, NotificationDefaults defaults, WallClock clock);

    // Returns false when the payload cannot be decoded (logged, non-fatal)
    bool onPush(const std::string &payload);

    // Id of the focused or newly opened client
    std::string onNotificationClick();

    // Returns the number of clients notified; unknown tags are ignored
    size_t onBackgroundSync(const std::string &tag);

    static const char *BACKGROUND_SYNC_TAG;

private:
    ClientHub &clients;
    NotificationDefaults defaults;
    WallClock clock;
};

#endif // NOTIFIER_HPP
