#ifndef REQUESTCLASSIFIER_HPP
#define REQUESTCLASSIFIER_HPP

#include <string>

enum class RequestCategory {
    Navigation,
    API,
    Static,
    CrossOrigin
};

enum class StrategyDecision {
    CacheFirst,
    NetworkFirstWithFallback,
    StaleWhileRevalidate,
    Bypass
};

// Derived from an inbound request, never mutated afterwards.
struct RequestDescriptor {
    std::string method;
    std::string url;            // absolute, or origin-relative
    std::string acceptHeader;
    bool isNavigation = false;
};

struct UrlParts {
    std::string scheme;         // lower-case, empty for a relative URL
    std::string host;           // lower-case
    std::string port;           // explicit, default port filled in
    std::string path;           // always starts with '/'
    std::string query;          // without '?'

    std::string origin() const;
    std::string pathAndQuery() const;
};

// Split an absolute or origin-relative URL. The fragment is dropped.
bool parseUrl(const std::string &url, UrlParts &out);

// "GET /main.css?v=2" from a method and any URL form, "./x" resolved to "/x"
std::string makeEntryKey(const std::string &method, const std::string &url);

const char *categoryName(RequestCategory category);
const char *strategyName(StrategyDecision decision);

class RequestClassifier {
public:
    RequestClassifier(const std::string &agentOrigin, std::string apiPrefix);

    // Pure: no storage, no clock, no network.
    RequestCategory classify(const RequestDescriptor &desc) const;

    const std::string &origin() const { return agentOrigin; }

private:
    std::string agentOrigin;
    std::string apiPrefix;
};

#endif // REQUESTCLASSIFIER_HPP
