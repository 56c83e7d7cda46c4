#include "requestClassifier.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>

static std::string defaultPort(const std::string &scheme) {
    if (scheme == "http" || scheme == "ws") return "80";
    if (scheme == "https" || scheme == "wss") return "443";
    return "";
}

std::string UrlParts::origin() const {
    if (scheme.empty()) return "";
    return scheme + "://" + host + ":" + port;
}

std::string UrlParts::pathAndQuery() const {
    if (query.empty()) return path;
    return path + "?" + query;
}

bool parseUrl(const std::string &url, UrlParts &out) {
    out = UrlParts();
    if (url.empty()) return false;

    std::string rest = url;
    size_t hashPos = rest.find('#');
    if (hashPos != std::string::npos) rest = rest.substr(0, hashPos);

    size_t schemeEnd = rest.find("://");
    size_t firstSlash = rest.find('/');
    if (schemeEnd != std::string::npos && (firstSlash == std::string::npos || schemeEnd < firstSlash)) {
        out.scheme = toLower(rest.substr(0, schemeEnd));
        if (out.scheme.empty()) return false;
        rest = rest.substr(schemeEnd + 3);

        size_t authorityEnd = rest.find_first_of("/?");
        std::string authority = rest.substr(0, authorityEnd);
        rest = authorityEnd == std::string::npos ? "" : rest.substr(authorityEnd);

        // strip userinfo
        size_t at = authority.rfind('@');
        if (at != std::string::npos) authority = authority.substr(at + 1);
        if (authority.empty()) return false;

        size_t colon = authority.rfind(':');
        if (colon != std::string::npos && authority.find(']') == std::string::npos) {
            out.host = toLower(authority.substr(0, colon));
            out.port = authority.substr(colon + 1);
            if (out.port.empty() ||
                !std::all_of(out.port.begin(), out.port.end(), [](unsigned char c){ return std::isdigit(c); })) {
                return false;
            }
        } else {
            out.host = toLower(authority);
        }
        if (out.host.empty()) return false;
        if (out.port.empty()) out.port = defaultPort(out.scheme);
    }

    size_t q = rest.find('?');
    std::string path = q == std::string::npos ? rest : rest.substr(0, q);
    out.query = q == std::string::npos ? "" : rest.substr(q + 1);

    if (path.compare(0, 2, "./") == 0) path = path.substr(1);
    else if (path == ".") path = "/";
    if (path.empty() || path.front() != '/') path = "/" + path;
    out.path = path;
    return true;
}

std::string makeEntryKey(const std::string &method, const std::string &url) {
    std::string m = method;
    std::transform(m.begin(), m.end(), m.begin(),
                   [](unsigned char c){ return (char)std::toupper(c); });

    UrlParts parts;
    if (!parseUrl(url, parts)) return m + " " + url;
    return m + " " + parts.pathAndQuery();
}

const char *categoryName(RequestCategory category) {
    switch (category) {
        case RequestCategory::Navigation:  return "Navigation";
        case RequestCategory::API:         return "API";
        case RequestCategory::Static:      return "Static";
        case RequestCategory::CrossOrigin: return "CrossOrigin";
    }
    return "Unknown";
}

const char *strategyName(StrategyDecision decision) {
    switch (decision) {
        case StrategyDecision::CacheFirst:               return "CacheFirst";
        case StrategyDecision::NetworkFirstWithFallback: return "NetworkFirstWithFallback";
        case StrategyDecision::StaleWhileRevalidate:     return "StaleWhileRevalidate";
        case StrategyDecision::Bypass:                   return "Bypass";
    }
    return "Unknown";
}

RequestClassifier::RequestClassifier(const std::string &agentOrigin, std::string apiPrefix)
    : apiPrefix(std::move(apiPrefix)) {
    UrlParts parts;
    if (parseUrl(agentOrigin, parts)) this->agentOrigin = parts.origin();
}

RequestCategory RequestClassifier::classify(const RequestDescriptor &desc) const {
    UrlParts parts;
    if (!parseUrl(desc.url, parts)) {
        return RequestCategory::CrossOrigin;
    }

    // relative URLs resolve against our own origin
    if (!parts.scheme.empty() && parts.origin() != agentOrigin) {
        return RequestCategory::CrossOrigin;
    }

    if (desc.isNavigation || toLower(desc.acceptHeader).find("text/html") != std::string::npos) {
        return RequestCategory::Navigation;
    }

    if (parts.path.compare(0, apiPrefix.size(), apiPrefix) == 0) {
        return RequestCategory::API;
    }

    return RequestCategory::Static;
}
