#ifndef FETCHER_HPP
#define FETCHER_HPP

#include "utils.hpp"
#include <chrono>
#include <stdexcept>
#include <string>

// A fetch attempt that was refused, reset or ran past its deadline
class NetworkFailure : public std::runtime_error {
public:
    explicit NetworkFailure(const std::string &what) : std::runtime_error(what) {}
};

// Network access to the origin. Any HTTP status is a completed fetch;
// only transport failures throw.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    // req.url is absolute or origin-relative (resolved against the Host header)
    virtual Response fetch(const Request &req, int requestId) = 0;
};

class HttpFetcher : public Fetcher {
public:
    explicit HttpFetcher(std::chrono::milliseconds timeout);

    Response fetch(const Request &req, int requestId) override;

private:
    std::chrono::milliseconds timeout;

    // Splits target into host/port and rewrites the request line to origin-form
    Request prepareOutbound(const Request &req, std::string &host, std::string &port) const;
};

#endif // FETCHER_HPP
