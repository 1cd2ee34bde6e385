#pragma once
#include <string>
#include <functional>
#include <mutex>

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

    /**
     * @brief 设置日志文件路径 (空字符串表示不写文件)
     */
    void setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx);
        logFilePath = path;
    }

    void setDebugEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        debugEnabled = enabled;
    }

    // stdout 留给协议输出,控制台回显默认走 stderr
    void setConsoleEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        consoleEnabled = enabled;
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (level == LogLevel::DEBUG && !debugEnabled) return;

        writeRecord(level, message);

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
    std::string logFilePath = "tether.log";
    bool debugEnabled = false;
    bool consoleEnabled = true;

    void writeRecord(LogLevel level, const std::string& message);
};
