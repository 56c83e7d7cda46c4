#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <mutex>
#include <fstream>

class Logger {
private:
    std::mutex mtx;
    std::ofstream ofs;
    std::string path;
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string getTimeUTC();

public:
    enum class Level { Note, Warning, Error };

private:
    static const char *levelName(Level level);

public:
    static Logger& getInstance();

    // Reopen on a different file; returns false (and keeps the old file) on failure
    bool open(const std::string &logPath);

    void logMessage(int requestID, const std::string &msg);
    void logLevel(int requestID, Level level, const std::string &msg);
    void logNewRequest(int requestID, const std::string &requestLine, const std::string &clientIP);

    void logClassified(int requestID, const std::string &category, const std::string &strategy);
    void logCacheStatus(int requestID, const std::string &msg);

    void logRequesting(int requestID, const std::string &reqLine, const std::string &serverName);
    void logReceived(int requestID, const std::string &respLine, const std::string &serverName);
    void logRespond(int requestID, const std::string &respLine);
    void logTunnelClosed(int requestID);

    void logNotCacheable(int requestID, const std::string &reason);
    void logCached(int requestID, const std::string &ns, const std::string &retrievedAt);

    void logLifecycle(const std::string &version, const std::string &transition);
    void logEviction(const std::string &ns, size_t before, size_t removed);

    void logNote(int requestID, const std::string &msg);
    void logWarning(int requestID, const std::string &msg);
    void logError(int requestID, const std::string &msg);
};

#endif // LOGGER_HPP
