#ifndef UTILS_HPP
#define UTILS_HPP

#include <netinet/in.h>
#include <string>
#include <map>
#include <chrono>

typedef struct {
    std::string method;
    std::string url;
    std::string version = "HTTP/1.1";
    std::string body;
    std::map<std::string, std::string> headers;
} Request;

typedef struct {
    std::string version = "HTTP/1.1";
    int status_code = 0;
    std::string status_msg;
    std::map<std::string, std::string> headers;
    std::string body;
} Response;

// Absolute time by which a whole read must finish
using Deadline = std::chrono::steady_clock::time_point;

inline Deadline noDeadline() { return Deadline::max(); }

inline Deadline deadlineAfter(std::chrono::milliseconds timeout) {
    return std::chrono::steady_clock::now() + timeout;
}

// Connect helper. A zero timeout means a plain blocking connect.
int connectToOther(const std::string &host, const std::string &portStr,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

// Apply send/receive timeouts to an already connected socket
bool setSocketTimeout(int fd, std::chrono::milliseconds timeout);

// Robust send (handles partial writes)
bool sendAll(int fd, const char *data, size_t len);

// Read full HTTP request from socket (header + optional body).
// Throws "Socket read timed out" once the deadline passes, however slowly
// bytes keep arriving.
Request readHttpRequestFromFd(int clientFd, Deadline deadline = noDeadline());

// Read full HTTP response from socket (header + body using CL/chunked/close).
// HEAD responses carry no body regardless of Content-Length.
Response readHttpResponseFromFd(int serverFd, bool headRequest = false, Deadline deadline = noDeadline());

// Parsing (these expect a complete message string)
Request parseRequest(const std::string &request);
Response parseResponse(const std::string &response);

// Serialize request to wire bytes (optionally inject extra header lines)
std::string requestToString(const Request &request, const std::string &extraHeaderBlock);

// Serialize response to wire bytes (do NOT truncate; keep binary safe).
// If response was chunked and already decoded, convert to Content-Length.
std::string serializeResponseForClient(Response response);

// String for logging only (may truncate body)
std::string responseToLogString(const Response &response);

std::string handleChunk(const std::string &chunkedBody);

// Case-insensitive header lookup, empty string when absent
std::string headerValue(const std::map<std::string, std::string> &headers, const std::string &name);

// Case-insensitive removal of every header with the given name
void eraseHeader(std::map<std::string, std::string> &headers, const std::string &name);

// Build a complete response with Content-Type and Content-Length set
Response makeResponse(int status, const std::string &statusMsg,
                      const std::string &contentType, const std::string &body);

// 2026-10-19T08:49:37.120Z
std::string formatIso8601(std::chrono::system_clock::time_point tp);

std::string toLower(std::string s);

#endif // UTILS_HPP
