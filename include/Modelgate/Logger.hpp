// =================================================================
// include/Modelgate/Logger.hpp
// =================================================================
// Header for gateway logging and audit trails.

#pragma once

#include "Modelgate/GatewayTypes.hpp"
#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Modelgate {

struct HealthReport;

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger for dispatch decisions and audit trails
 *
 * Writes structured entries to the console and to size-rotated log files.
 * Safe to call from concurrent dispatches.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".modelgate/logs",
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     * @param level Minimum level to write to files
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    /**
     * @brief Enable or disable file logging
     * @param enabled True to write log files
     */
    void setFileLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log one recorded dispatch attempt
     * @param record The call record that was just written
     */
    void logCallAttempt(const CallRecord& record);

    /**
     * @brief Log the final outcome of a logical request
     * @param target Pool or endpoint the request was addressed to
     * @param result Outcome returned to the caller
     */
    void logDispatchOutcome(const std::string& target, const DispatchResult& result);

    /**
     * @brief Log a health classification
     * @param report Health report for one endpoint
     */
    void logHealthReport(const HealthReport& report);

    /**
     * @brief Log session start
     * @param command Command being executed
     * @param detail Target or prompt summary
     */
    void logSessionStart(const std::string& command, const std::string& detail);

    /**
     * @brief Log session end
     * @param command Command that was executed
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);

    /**
     * @brief Parse a level name ("debug", "info", "warning", ...)
     * @throws std::invalid_argument for unknown names
     */
    static LogLevel parseLevel(const std::string& name);

    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir = ".modelgate/logs";
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_file_enabled = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    std::mutex m_mutex;

    void initializeLocked(const std::string& log_dir, size_t max_log_size, size_t max_log_files);
    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);
    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    Modelgate::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Modelgate::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Modelgate::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Modelgate::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Modelgate::Logger::getInstance().critical(component, message)

} // namespace Modelgate
