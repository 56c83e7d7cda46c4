#include "utils.hpp"
#include "logger.hpp"
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <climits>
#include <sstream>
#include <vector>
#include <iomanip>
#include <ctime>
#include <algorithm>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/time.h>

// -----------------------------
// Small helpers
// -----------------------------
std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

// recv() failure: distinguish a deadline hit from a closed peer
static void throwIfTimedOut(ssize_t n) {
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        throw std::runtime_error("Socket read timed out");
    }
}

// Robust send: keep sending until all bytes are written.
bool sendAll(int fd, const char *data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n <= 0) return false;
        sent += (size_t)n;
    }
    return true;
}

std::string headerValue(const std::map<std::string, std::string> &headers, const std::string &name) {
    auto it = headers.find(name);
    if (it != headers.end()) return it->second;

    std::string wanted = toLower(name);
    for (const auto &kv : headers) {
        if (toLower(kv.first) == wanted) return kv.second;
    }
    return "";
}

void eraseHeader(std::map<std::string, std::string> &headers, const std::string &name) {
    std::string wanted = toLower(name);
    for (auto it = headers.begin(); it != headers.end();) {
        if (toLower(it->first) == wanted) it = headers.erase(it);
        else ++it;
    }
}

// -----------------------------
// Framing helpers
// -----------------------------

// Largest message accepted from either side
static const size_t MAX_MESSAGE_BYTES = 50 * 1024 * 1024;

// recv() that gives up when the deadline passes before data arrives
static ssize_t recvBefore(int fd, char *buf, size_t len, Deadline deadline) {
    if (deadline == noDeadline()) {
        return recv(fd, buf, len, 0);
    }

    int ready;
    do {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            throw std::runtime_error("Socket read timed out");
        }
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        ready = poll(&pfd, 1, (int)std::min<long long>(left.count(), INT_MAX));
    } while (ready < 0 && errno == EINTR);

    if (ready == 0) {
        throw std::runtime_error("Socket read timed out");
    }
    if (ready < 0) {
        throw std::runtime_error(std::string("poll failed: ") + strerror(errno));
    }
    return recv(fd, buf, len, 0);
}

// Append received bytes to buf until marker shows up or the peer closes
static void recvUntilMarker(int fd, std::string &buf, const std::string &marker, Deadline deadline) {
    std::vector<char> tmp(8192);
    while (buf.find(marker) == std::string::npos) {
        ssize_t n = recvBefore(fd, tmp.data(), tmp.size(), deadline);
        if (n <= 0) {
            throwIfTimedOut(n);
            return;
        }
        buf.append(tmp.data(), (size_t)n);
        if (buf.size() > MAX_MESSAGE_BYTES) throw std::runtime_error("Message too large");
    }
}

static void recvUntilClosed(int fd, std::string &buf, Deadline deadline) {
    std::vector<char> tmp(8192);
    for (;;) {
        ssize_t n = recvBefore(fd, tmp.data(), tmp.size(), deadline);
        if (n <= 0) {
            throwIfTimedOut(n);
            return;
        }
        buf.append(tmp.data(), (size_t)n);
        if (buf.size() > MAX_MESSAGE_BYTES) throw std::runtime_error("Message too large");
    }
}

static void recvAtLeast(int fd, std::string &buf, size_t len, Deadline deadline) {
    std::vector<char> tmp(8192);
    while (buf.size() < len) {
        ssize_t n = recvBefore(fd, tmp.data(), std::min(tmp.size(), len - buf.size()), deadline);
        if (n <= 0) {
            throwIfTimedOut(n);
            throw std::runtime_error("Socket closed before receiving enough bytes");
        }
        buf.append(tmp.data(), (size_t)n);
    }
}

// Header block including the blank line; body bytes read along with it go to rest
static std::string recvHead(int fd, std::string &rest, Deadline deadline) {
    std::string buf;
    recvUntilMarker(fd, buf, "\r\n\r\n", deadline);
    size_t end = buf.find("\r\n\r\n");
    if (end == std::string::npos) {
        throw std::runtime_error("Connection closed inside the header block");
    }
    rest = buf.substr(end + 4);
    return buf.substr(0, end + 4);
}

// Header lines up to the blank line. Strict mode rejects a line without ':'.
static void readHeaderLines(std::istream &in, std::map<std::string, std::string> &headers, bool strict) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) return;

        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            if (strict) throw std::runtime_error("Invalid header: " + line);
            continue;
        }
        std::string value = line.substr(colon + 1);
        size_t first = value.find_first_not_of(" \t");
        headers[line.substr(0, colon)] = first == std::string::npos ? "" : value.substr(first);
    }
}

static std::map<std::string, std::string> headerFieldsOf(const std::string &head) {
    std::istringstream iss(head);
    std::string startLine;
    std::getline(iss, startLine);

    std::map<std::string, std::string> headers;
    readHeaderLines(iss, headers, false);
    return headers;
}

// -1 when the header is absent
static long long contentLength(const std::map<std::string, std::string> &headers) {
    std::string cl = headerValue(headers, "Content-Length");
    if (cl.empty()) return -1;

    long long len = 0;
    try {
        len = std::stoll(cl);
    } catch (const std::exception &) {
        throw std::runtime_error("Invalid Content-Length");
    }
    if (len < 0) throw std::runtime_error("Negative Content-Length");
    if ((unsigned long long)len > MAX_MESSAGE_BYTES) throw std::runtime_error("Message too large");
    return len;
}

static std::string readBody(std::istream &in, size_t len) {
    if (len == 0) return "";
    std::string body(len, '\0');
    in.read(&body[0], (std::streamsize)len);
    if ((size_t)in.gcount() != len) {
        throw std::runtime_error("Incomplete body for Content-Length");
    }
    return body;
}

static std::string readRemaining(std::istream &in) {
    std::string rest;
    char buf[4096];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        rest.append(buf, (size_t)in.gcount());
    }
    return rest;
}

static void parseStatusAndHeaders(std::istream &in, Response &res) {
    std::string line;
    if(!std::getline(in, line)){
        throw std::runtime_error("Invalid response (no status line)");
    }
    if(!line.empty() && line.back() == '\r') line.pop_back();

    std::istringstream statusLine(line);
    statusLine >> res.version >> res.status_code;
    if(statusLine.fail()){
        throw std::runtime_error("Invalid status line: " + line);
    }
    std::getline(statusLine, res.status_msg);
    size_t first = res.status_msg.find_first_not_of(' ');
    res.status_msg = first == std::string::npos ? "" : res.status_msg.substr(first);

    readHeaderLines(in, res.headers, true);
}

// -----------------------------
// connectToOther
// -----------------------------

// Non-blocking connect bounded by timeout; restores blocking mode on success.
static bool connectWithTimeout(int fd, const sockaddr *addr, socklen_t len, std::chrono::milliseconds timeout) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) return false;

    int rc = connect(fd, addr, len);
    if (rc < 0 && errno != EINPROGRESS) return false;

    if (rc < 0) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, (int)timeout.count());
        if (ready <= 0) return false;

        int soError = 0;
        socklen_t soLen = sizeof(soError);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &soLen) < 0 || soError != 0) {
            return false;
        }
    }
    return fcntl(fd, F_SETFL, flags) >= 0;
}

int connectToOther(const std::string &host, const std::string &portStr, std::chrono::milliseconds timeout){
    struct addrinfo hints, *serverInfo;
    memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    int status = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &serverInfo);
    if(status != 0){
        Logger::getInstance().logWarning(-1, "getaddrinfo " + host + ": " + gai_strerror(status));
        return -1;
    }

    struct addrinfo *p;
    int socketFd = -1;
    for(p = serverInfo; p != nullptr; p = p->ai_next){
        socketFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if(socketFd < 0) continue;

        bool connected = timeout.count() > 0
            ? connectWithTimeout(socketFd, p->ai_addr, p->ai_addrlen, timeout)
            : connect(socketFd, p->ai_addr, p->ai_addrlen) == 0;
        if(!connected){
            close(socketFd);
            socketFd = -1;
            continue;
        }
        break;
    }
    freeaddrinfo(serverInfo);
    return socketFd;
}

bool setSocketTimeout(int fd, std::chrono::milliseconds timeout){
    struct timeval tv;
    tv.tv_sec = (time_t)(timeout.count() / 1000);
    tv.tv_usec = (suseconds_t)((timeout.count() % 1000) * 1000);
    if(setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) return false;
    if(setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) return false;
    return true;
}

// -----------------------------
// parseRequest / parseResponse
// Require full body bytes when Content-Length exists.
// -----------------------------
Request parseRequest(const std::string &request){
    std::istringstream iss(request);
    std::string line;
    Request req;

    if(!std::getline(iss, line)){
        throw std::runtime_error("Invalid request (no start line)");
    }
    if(!line.empty() && line.back() == '\r') line.pop_back();

    std::istringstream firstLine(line);
    firstLine >> req.method >> req.url >> req.version;
    if(req.method.empty() || req.url.empty()){
        throw std::runtime_error("Invalid request line: " + line);
    }

    readHeaderLines(iss, req.headers, true);

    // requests are framed by Content-Length only
    long long len = contentLength(req.headers);
    req.body = len > 0 ? readBody(iss, (size_t)len) : "";
    return req;
}

Response parseResponse(const std::string &response){
    std::istringstream iss(response);
    Response res;
    parseStatusAndHeaders(iss, res);

    if (toLower(headerValue(res.headers, "Transfer-Encoding")) == "chunked") {
        res.body = handleChunk(readRemaining(iss));
        eraseHeader(res.headers, "Transfer-Encoding");
        return res;
    }

    // without a length the body runs to the end (Connection: close framing)
    long long len = contentLength(res.headers);
    res.body = len >= 0 ? readBody(iss, (size_t)len) : readRemaining(iss);
    return res;
}

// -----------------------------
// Chunk decoding
// -----------------------------
std::string handleChunk(const std::string &chunkedBody) {
    std::istringstream stream(chunkedBody);
    std::string final_string;
    std::string line;

    while (std::getline(stream, line)) {
        if(line.empty() || line == "\r") continue;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        size_t chunkSize = 0;
        std::istringstream sizeStream(line);
        sizeStream >> std::hex >> chunkSize;
        if (chunkSize == 0) {
            break;
        }

        std::vector<char> buffer(chunkSize);
        stream.read(buffer.data(), (std::streamsize)chunkSize);

        if (stream.gcount() != (std::streamsize)chunkSize) {
            throw std::runtime_error("Chunk data size mismatch");
        }

        final_string.append(buffer.data(), chunkSize);

        // Consume CRLF after chunk data
        if (!std::getline(stream, line)) {
            throw std::runtime_error("Missing CRLF after chunk");
        }
    }

    return final_string;
}

std::string formatIso8601(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = (std::time_t)(ms / 1000);
    long long frac = ms % 1000;
    if (frac < 0) {
        frac += 1000;
        secs -= 1;
    }

    std::tm tm = {};
    gmtime_r(&secs, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << frac << 'Z';
    return oss.str();
}

Response makeResponse(int status, const std::string &statusMsg,
                      const std::string &contentType, const std::string &body) {
    Response res;
    res.status_code = status;
    res.status_msg = statusMsg;
    res.headers["Content-Type"] = contentType;
    res.headers["Content-Length"] = std::to_string(body.size());
    res.body = body;
    return res;
}

// -----------------------------
// Wire serializers
// -----------------------------
std::string requestToString(const Request &request, const std::string &extraHeaderBlock){
    std::ostringstream oss;
    oss << request.method << " " << request.url << " " << request.version << "\r\n";
    for(const auto &h: request.headers){
        oss << h.first << ": " << h.second << "\r\n";
    }
    // extraHeaderBlock must contain complete lines ending with \r\n
    if(!extraHeaderBlock.empty()){
        oss << extraHeaderBlock;
    }
    oss << "\r\n";
    if(!request.body.empty()){
        oss.write(request.body.data(), (std::streamsize)request.body.size());
    }
    return oss.str();
}

std::string serializeResponseForClient(Response response){
    // bodies are held decoded; framing is recomputed for the client
    eraseHeader(response.headers, "Transfer-Encoding");
    eraseHeader(response.headers, "Content-Length");
    eraseHeader(response.headers, "Connection");
    response.headers["Content-Length"] = std::to_string(response.body.size());
    response.headers["Connection"] = "close";

    std::ostringstream oss;
    oss << response.version << " " << response.status_code << " " << response.status_msg << "\r\n";
    for(const auto &h: response.headers){
        oss << h.first << ": " << h.second << "\r\n";
    }
    oss << "\r\n";
    if(!response.body.empty()){
        oss.write(response.body.data(), (std::streamsize)response.body.size());
    }
    return oss.str();
}

// Log string only: may truncate body to avoid huge logs.
std::string responseToLogString(const Response &response){
    std::ostringstream oss;
    oss << response.version << " " << response.status_code << " " << response.status_msg;

    const size_t kMax = 200;
    size_t n = std::min(kMax, response.body.size());
    if (n > 0) {
        oss << " [";
        oss.write(response.body.data(), (std::streamsize)n);
        if (response.body.size() > n) oss << "...";
        oss << "]";
    }
    return oss.str();
}

// -----------------------------
// Socket framing readers
// Content-Length or chunked framing first; reading to close is the last resort.
// -----------------------------
Request readHttpRequestFromFd(int clientFd, Deadline deadline){
    std::string body;
    std::string head = recvHead(clientFd, body, deadline);

    long long len = contentLength(headerFieldsOf(head));
    if (len > 0) {
        recvAtLeast(clientFd, body, (size_t)len, deadline);
        body.resize((size_t)len);
    } else {
        body.clear();
    }
    return parseRequest(head + body);
}

Response readHttpResponseFromFd(int serverFd, bool headRequest, Deadline deadline){
    std::string body;
    std::string head = recvHead(serverFd, body, deadline);

    if (headRequest) {
        // Content-Length describes the GET body that was not sent
        std::istringstream iss(head);
        Response res;
        parseStatusAndHeaders(iss, res);
        return res;
    }

    auto headers = headerFieldsOf(head);
    if (toLower(headerValue(headers, "Transfer-Encoding")) == "chunked") {
        // simplified framing: up to the terminating zero-size chunk
        recvUntilMarker(serverFd, body, "0\r\n\r\n", deadline);
        return parseResponse(head + body);
    }

    long long len = contentLength(headers);
    if (len >= 0) {
        recvAtLeast(serverFd, body, (size_t)len, deadline);
        body.resize((size_t)len);
    } else {
        recvUntilClosed(serverFd, body, deadline);
    }
    return parseResponse(head + body);
}
