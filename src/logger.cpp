#include "logger.hpp"
#include <iostream>
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>

static const char* DEFAULT_LOG_PATH = "offline-agent.log";

Logger::Logger() : path(DEFAULT_LOG_PATH) {
    ofs.open(path, std::ios::app);
    if (!ofs.is_open()) {
        std::cerr << "Cannot open log file: " << path << std::endl;
    }
}

Logger::~Logger() {
    if (ofs.is_open()) {
        ofs.close();
    }
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

bool Logger::open(const std::string &logPath) {
    std::lock_guard<std::mutex> lock(mtx);
    if (logPath == path && ofs.is_open()) return true;

    std::ofstream next(logPath, std::ios::app);
    if (!next.is_open()) {
        std::cerr << "Cannot open log file: " << logPath << std::endl;
        return false;
    }
    if (ofs.is_open()) ofs.close();
    ofs = std::move(next);
    path = logPath;
    return true;
}

//get UTC time
std::string Logger::getTimeUTC() {
    auto now = std::chrono::system_clock::now();
    std::time_t now_time = std::chrono::system_clock::to_time_t(now);

    std::tm tm = {};
    gmtime_r(&now_time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S UTC");
    return oss.str();
}

//general log method
void Logger::logMessage(int requestID, const std::string &msg) {
    std::lock_guard<std::mutex> lock(mtx);
    if (ofs.is_open()) {
        if (requestID < 0) ofs << "-";
        else ofs << requestID;
        ofs << ": " << msg << std::endl;
    }
}

static std::string quoted(const std::string &line) {
    return "\"" + line + "\"";
}

//"GET /index.html HTTP/1.1" from 192.168.1.10 @ 2025-02-27 15:45:30 UTC
void Logger::logNewRequest(int requestID, const std::string &requestLine, const std::string &clientIP) {
    logMessage(requestID, quoted(requestLine) + " from " + clientIP + " @ " + getTimeUTC());
}

//12: classified API, strategy NetworkFirstWithFallback
void Logger::logClassified(int requestID, const std::string &category, const std::string &strategy) {
    logMessage(requestID, "classified " + category + ", strategy " + strategy);
}

//12: not in cache
//13: in cache (app-shell-1.1.0)
void Logger::logCacheStatus(int requestID, const std::string &msg) {
    logMessage(requestID, msg);
}

//14: Requesting "GET /index.html HTTP/1.1" from localhost:8080
void Logger::logRequesting(int requestID, const std::string &reqLine, const std::string &serverName) {
    logMessage(requestID, "Requesting " + quoted(reqLine) + " from " + serverName);
}

//14: Received "HTTP/1.1 200 OK" from localhost:8080
void Logger::logReceived(int requestID, const std::string &respLine, const std::string &serverName) {
    logMessage(requestID, "Received " + quoted(respLine) + " from " + serverName);
}

void Logger::logRespond(int requestID, const std::string &respLine) {
    logMessage(requestID, "Responding " + quoted(respLine));
}

void Logger::logTunnelClosed(int requestID) {
    logMessage(requestID, "Tunnel closed");
}

//15: not cacheable because method POST
void Logger::logNotCacheable(int requestID, const std::string &reason) {
    logMessage(requestID, "not cacheable because " + reason);
}

//16: cached in runtime-1.1.0, retrieved at 2026-10-19T08:49:37.120Z
void Logger::logCached(int requestID, const std::string &ns, const std::string &retrievedAt) {
    logMessage(requestID, "cached in " + ns + ", retrieved at " + retrievedAt);
}

//-: lifecycle 1.1.0 Waiting -> Activating
void Logger::logLifecycle(const std::string &version, const std::string &transition) {
    logMessage(-1, "lifecycle " + version + " " + transition);
}

//-: eviction runtime-1.1.0 had 120 entries, removed 24
void Logger::logEviction(const std::string &ns, size_t before, size_t removed) {
    std::ostringstream oss;
    oss << "eviction " << ns << " had " << before << " entries, removed " << removed;
    logMessage(-1, oss.str());
}

const char *Logger::levelName(Level level) {
    switch (level) {
        case Level::Note: return "NOTE";
        case Level::Warning: return "WARNING";
        case Level::Error: return "ERROR";
    }
    return "?";
}

void Logger::logLevel(int requestID, Level level, const std::string &msg) {
    logMessage(requestID, std::string(levelName(level)) + " " + msg);
}

void Logger::logNote(int requestID, const std::string &msg) {
    logLevel(requestID, Level::Note, msg);
}

void Logger::logWarning(int requestID, const std::string &msg) {
    logLevel(requestID, Level::Warning, msg);
}

void Logger::logError(int requestID, const std::string &msg) {
    logLevel(requestID, Level::Error, msg);
}
