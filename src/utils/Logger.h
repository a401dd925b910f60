#pragma once
#include <string>
#include <functional>
#include <mutex>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @brief Process-wide logger.
 *
 * Writes to stderr (stdout carries protocol lines) and optionally to a log file.
 * Records below the configured level are dropped before reaching any sink.
 */
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx);
        minLevel = level;
    }

    LogLevel getLevel() {
        std::lock_guard<std::mutex> lock(mtx);
        return minLevel;
    }

    // Empty path disables file output.
    void setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx);
        logFilePath = path;
    }

    void setConsoleEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        consoleEnabled = enabled;
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (level < minLevel) return;
        writeRecord(level, message);

        if (callback) {
            callback(level, message);
        }
    }

    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }

    /**
     * @brief Parse a level name ("DEBUG", "INFO", "WARN"/"WARNING", "ERROR"), case-insensitive.
     * @return fallback when the name is not recognised
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);
    static std::string levelName(LogLevel level);

private:
    Logger() = default;
    LogCallback callback;
    std::mutex mtx;
    LogLevel minLevel = LogLevel::INFO;
    std::string logFilePath;
    bool consoleEnabled = true;

    void writeRecord(LogLevel level, const std::string& message);
};
