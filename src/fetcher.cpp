#include "fetcher.hpp"
#include "logger.hpp"
#include "requestClassifier.hpp"

#include <unistd.h>
#include <sstream>

HttpFetcher::HttpFetcher(std::chrono::milliseconds timeout) : timeout(timeout) {}

Request HttpFetcher::prepareOutbound(const Request &req, std::string &host, std::string &port) const {
    Request out = req;

    UrlParts parts;
    if (!parseUrl(req.url, parts)) {
        throw NetworkFailure("unparseable URL " + req.url);
    }

    if (!parts.scheme.empty()) {
        if (parts.scheme != "http") {
            throw NetworkFailure("unsupported scheme " + parts.scheme);
        }
        host = parts.host;
        port = parts.port;
    } else {
        std::string hostHeader = headerValue(req.headers, "Host");
        if (hostHeader.empty()) {
            throw NetworkFailure("no Host for relative URL " + req.url);
        }
        size_t colonPos = hostHeader.rfind(':');
        if (colonPos != std::string::npos) {
            host = hostHeader.substr(0, colonPos);
            port = hostHeader.substr(colonPos + 1);
        } else {
            host = hostHeader;
            port = "80";
        }
    }

    out.url = parts.pathAndQuery();
    // one request per upstream connection
    for (auto it = out.headers.begin(); it != out.headers.end();) {
        std::string name = toLower(it->first);
        if (name == "connection" || name == "proxy-connection" || name == "keep-alive") {
            it = out.headers.erase(it);
        } else {
            ++it;
        }
    }
    out.headers["Connection"] = "close";
    if (headerValue(out.headers, "Host").empty()) {
        out.headers["Host"] = port == "80" ? host : host + ":" + port;
    }
    return out;
}

Response HttpFetcher::fetch(const Request &req, int requestId){
    std::string host;
    std::string port;
    Request outbound = prepareOutbound(req, host, port);

    {
        std::ostringstream line;
        line << outbound.method << " " << outbound.url << " " << outbound.version;
        Logger::getInstance().logRequesting(requestId, line.str(), host);
    }

    // one deadline covers connect, send and the whole response
    Deadline deadline = deadlineAfter(timeout);
    int fd = connectToOther(host, port, timeout);
    if(fd < 0){
        throw NetworkFailure("cannot connect to " + host + ":" + port);
    }

    Response res;
    try {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if(left.count() <= 0){
            throw NetworkFailure("deadline passed while connecting to " + host);
        }
        if(!setSocketTimeout(fd, left)){
            throw NetworkFailure("cannot set socket deadline");
        }

        std::string reqBytes = requestToString(outbound, "");
        if(!sendAll(fd, reqBytes.data(), reqBytes.size())){
            throw NetworkFailure("send to " + host + " failed");
        }

        res = readHttpResponseFromFd(fd, outbound.method == "HEAD", deadline);
    } catch (const NetworkFailure &) {
        close(fd);
        throw;
    } catch (const std::exception &e) {
        close(fd);
        throw NetworkFailure(std::string("reading response from ") + host + ": " + e.what());
    }
    close(fd);

    Logger::getInstance().logReceived(requestId, responseToLogString(res), host);
    return res;
}
