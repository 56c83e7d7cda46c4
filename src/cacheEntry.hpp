#ifndef CACHEENTRY_HPP
#define CACHEENTRY_HPP

#include "utils.hpp"
#include <chrono>
#include <map>
#include <string>

// Synthesized on every stored entry, ISO-8601 UTC
extern const char *RETRIEVED_AT_HEADER;

// Immutable snapshot of one cached response. A write replaces the whole entry.
class CacheEntry{
    public:
        std::string key;
        int status;
        std::string statusMsg;
        std::map<std::string, std::string> headers;
        std::string body;
        std::chrono::system_clock::time_point retrievedAt;

        CacheEntry();
        CacheEntry(std::string key, const Response &response, std::chrono::system_clock::time_point retrievedAt);

        Response toResponse() const;
        std::string getRetrievedAtString() const;

        long long retrievedAtMillis() const;
        static std::chrono::system_clock::time_point fromMillis(long long ms);
};

bool operator==(const CacheEntry &a, const CacheEntry &b);

#endif // CACHEENTRY_HPP
