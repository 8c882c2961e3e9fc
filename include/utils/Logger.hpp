#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace dynsys {

/**
 * @enum LogLevel
 * @brief Defines severity levels for log messages.
 */
enum class LogLevel {
    DEBUG,    ///< Solver selection, step and save bookkeeping.
    INFO,     ///< General informational messages.
    WARNING,  ///< Ignored configuration entries and similar issues.
    ERROR,    ///< Failed integrations.
    FATAL     ///< Critical errors halting the program.
};

/**
 * @brief Parses a level name ("debug", "info", "warning", "error", "fatal").
 * @param name [in] Case-insensitive level name.
 * @param fallback [in] Level returned when the name is not recognised.
 */
inline LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    return fallback;
}

/**
 * @class Logger
 * @brief A thread-safe singleton logger shared by the solver strategies,
 * the integration driver and the demo program.
 *
 * Messages are timestamped and tagged with a level and a source. Output goes
 * to the console and, when enabled, to a log file.
 */
class Logger {
public:
    /**
     * @brief Retrieves the singleton instance of the Logger.
     * @return Logger& Reference to the unique logger instance.
     */
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Sets the minimum severity level for messages to be processed.
     * @param level [in] The minimum LogLevel to output.
     */
    void setLogLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    /**
     * @brief True when a message of the given level would be written.
     *
     * Lets callers skip building expensive debug strings inside integration loops.
     */
    bool isEnabled(LogLevel level) const { return level >= logLevel_; }

    /**
     * @brief Configures file logging.
     *
     * Enables or disables logging to a file opened in append mode. An already
     * open file is closed first.
     *
     * @param enable   [in] True to enable file logging, false to disable.
     * @param filename [in] The path to the log file (used only if enable is true).
     * @return bool False if the file could not be opened.
     */
    bool enableFileLogging(bool enable, const std::string& filename = "dynsys.log") {
        std::unique_lock<std::mutex> lock(mutex_);
        if (enable) {
            if (logFile_.is_open()) {
                logFile_.close();
            }
            logFile_.open(filename, std::ios::app);
            if (!logFile_.is_open()) {
                std::cerr << formatLogMessage(LogLevel::ERROR, "Logger", "Failed to open log file: " + filename) << std::endl;
                return false;
            }
            lock.unlock();
            log(LogLevel::INFO, "Logger", "File logging enabled to: " + filename);
            return true;
        }
        if (logFile_.is_open()) {
            logFile_ << formatLogMessage(LogLevel::INFO, "Logger", "File logging disabled.") << std::endl;
            logFile_.close();
        }
        return true;
    }

    /**
     * @brief Logs a message if its level meets the minimum threshold.
     *
     * @param level   [in] The severity level of the message.
     * @param source  [in] Identifier for the source of the message (e.g. "SolverFactory::create").
     * @param message [in] The content of the log message.
     */
    void log(LogLevel level, const std::string& source, const std::string& message) {
        if (level < logLevel_) return;

        std::string formattedMessage = formatLogMessage(level, source, message);

        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream& console = (level >= LogLevel::ERROR) ? std::cerr : std::cout;
        console << formattedMessage << std::endl;
        if (logFile_.is_open()) {
            logFile_ << formattedMessage << std::endl;
        }
    }

    void debug(const std::string& source, const std::string& message)   { log(LogLevel::DEBUG, source, message); }
    void info(const std::string& source, const std::string& message)    { log(LogLevel::INFO, source, message); }
    void warning(const std::string& source, const std::string& message) { log(LogLevel::WARNING, source, message); }
    void error(const std::string& source, const std::string& message)   { log(LogLevel::ERROR, source, message); }
    void fatal(const std::string& source, const std::string& message)   { log(LogLevel::FATAL, source, message); }

private:
    Logger() : logLevel_(LogLevel::INFO) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string formatLogMessage(LogLevel level, const std::string& source, const std::string& message) {
        std::ostringstream oss;
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        oss << std::put_time(std::localtime(&time_t_now), "%Y-%m-%d %H:%M:%S") << " ";

        switch (level) {
            case LogLevel::DEBUG:   oss << "[DEBUG]  "; break;
            case LogLevel::INFO:    oss << "[INFO]   "; break;
            case LogLevel::WARNING: oss << "[WARNING]"; break;
            case LogLevel::ERROR:   oss << "[ERROR]  "; break;
            case LogLevel::FATAL:   oss << "[FATAL]  "; break;
        }

        oss << " [" << source << "] " << message;
        return oss.str();
    }

    LogLevel logLevel_;         ///< Minimum level for messages to be processed.
    std::ofstream logFile_;     ///< Output file stream (if file logging is enabled).
    std::mutex mutex_;          ///< Serializes console and file output.
};

} // namespace dynsys

#endif // LOGGER_H
