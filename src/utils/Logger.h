#pragma once
#include <string>
#include <functional>
#include <mutex>
#include <vector>

enum class LogLevel {
    INFO,
    SUCCESS,
    WARNING,
    ERROR,
    DEBUG
};

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

    // Empty path disables the log file.
    void setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx);
        logFilePath = path;
    }

    void setDebugEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        debugEnabled = enabled;
    }

    void setConsoleEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        consoleEnabled = enabled;
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (level == LogLevel::DEBUG && !debugEnabled) return;

        writeToFile(level, message);
        if (consoleEnabled) {
            printToConsole(level, message);
        }

        if (callback) {
            callback(level, message);
        }
    }

    // Convenience methods
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void success(const std::string& m) { log(LogLevel::SUCCESS, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }

private:
    Logger() = default;
    LogCallback callback;
    std::mutex mtx;
    std::string logFilePath = "prism.log";
    bool debugEnabled = false;
    bool consoleEnabled = true;

    void writeToFile(LogLevel level, const std::string& message);
    void printToConsole(LogLevel level, const std::string& message);
};
