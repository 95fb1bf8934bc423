// =================================================================
// src/Modelgate/Logger.cpp
// =================================================================
// Implementation for the gateway logging system.

#include "Modelgate/Logger.hpp"
#include "Modelgate/HealthClassifier.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Modelgate {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        initializeLocked(log_dir, max_log_size, max_log_files);
    }
    info("Logger", "Logging system initialized", m_log_dir);
}

void Logger::initializeLocked(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_current_log_size = 0;
    m_initialized = true;

    m_current_log_file.reset();
    if (!m_file_enabled) {
        return;
    }

    ensureLogDirectory();

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_enabled = enabled;
}

void Logger::setFileLogging(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_file_enabled = enabled;
    if (!enabled) {
        m_current_log_file.reset();
    }
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logCallAttempt(const CallRecord& record) {
    std::ostringstream context;
    context << "Request: " << record.request_id << ", ";
    if (!record.pool_id.empty()) {
        context << "Pool: " << record.pool_id << ", ";
    }
    context << "Tokens: " << record.input_tokens << "/" << record.output_tokens << ", ";
    context << "Cost: " << std::fixed << std::setprecision(6) << record.cost << ", ";
    context << "Latency: " << record.latency.count() << "ms";

    std::string message = "Attempt on " + record.endpoint_id + " " +
                          GatewayTypeUtils::callStatusToString(record.status);

    switch (record.status) {
        case CallStatus::SUCCESS:
            info("CallExecutor", message, context.str());
            break;
        case CallStatus::QUOTA_EXCEEDED:
        case CallStatus::RATE_LIMITED:
            warning("QuotaGate", message + ": " + record.error_message, context.str());
            break;
        default:
            error("CallExecutor", message + ": " + record.error_message, context.str());
            break;
    }

    // Slow but successful calls are worth flagging
    if (record.status == CallStatus::SUCCESS && record.latency.count() > 30000) {
        warning("CallExecutor", "Slow response detected",
                record.endpoint_id + " took " + std::to_string(record.latency.count()) + "ms");
    }
}

void Logger::logDispatchOutcome(const std::string& target, const DispatchResult& result) {
    std::ostringstream context;
    context << "Request: " << result.request_id << ", ";
    context << "Attempts: " << result.attempts;
    if (!result.attempted_endpoints.empty()) {
        context << " [";
        for (size_t i = 0; i < result.attempted_endpoints.size(); ++i) {
            if (i > 0) context << " -> ";
            context << result.attempted_endpoints[i];
        }
        context << "]";
    }

    if (result.success) {
        info("Dispatcher", "Request to " + target + " served by " + result.endpoint_id, context.str());
    } else {
        error("Dispatcher", "Request to " + target + " failed (" +
              GatewayTypeUtils::errorKindToString(result.error_kind) + "): " + result.error_message,
              context.str());
    }
}

void Logger::logHealthReport(const HealthReport& report) {
    std::ostringstream context;
    context << "Calls: " << report.total_calls << ", ";
    context << "Success rate: " << std::fixed << std::setprecision(1) << report.success_rate << "%, ";
    context << "Avg latency: " << std::setprecision(0) << report.avg_latency_ms << "ms";

    std::string message = report.endpoint_id + " is " + HealthClassifier::gradeToString(report.grade);

    switch (report.grade) {
        case HealthGrade::UNHEALTHY:
            warning("HealthClassifier", message, context.str());
            break;
        case HealthGrade::DEGRADED:
            info("HealthClassifier", message, context.str());
            break;
        default:
            debug("HealthClassifier", message, context.str());
            break;
    }
}

void Logger::logSessionStart(const std::string& command, const std::string& detail) {
    std::ostringstream context;
    context << "Command: " << command << ", ";
    context << "Detail length: " << detail.length() << " chars";

    info("Session", "Session started", context.str());
    debug("Session", "Detail: " + detail);
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Command: " << command << ", ";
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (exit_code == 0) {
        info("Session", "Session completed successfully", context.str());
    } else {
        error("Session", "Session completed with errors", context.str());
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warning" || lowered == "warn") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical" || lowered == "crit") return LogLevel::CRITICAL;

    throw std::invalid_argument("Unknown log level: " + name);
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_initialized) {
        initializeLocked(m_log_dir, m_max_log_size, m_max_log_files);
    }

    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    // Keep stdout clean for command results
    std::cerr << formatEntry(entry, true) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_file_enabled || !m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << std::endl;
    m_current_log_size += formatted.length() + 1; // +1 for newline

    // Flush critical and error messages immediately
    if (entry.level >= LogLevel::ERROR) {
        m_current_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m";
    }
    formatted << " ";

    formatted << entry.component << ": ";
    formatted << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }

    m_current_log_file.reset();

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename);
    m_current_log_size = 0;

    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        // Newest first
        std::sort(log_files.begin(), log_files.end(),
                 [](const std::filesystem::path& a, const std::filesystem::path& b) {
                     return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                 });

        for (size_t i = m_max_log_files; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }

    } catch (const std::exception& e) {
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

void Logger::ensureLogDirectory() {
    try {
        std::filesystem::create_directories(m_log_dir);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Cannot create log directory: " << e.what() << std::endl;
        m_log_dir = ".";
    }
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::ostringstream filename;
    filename << m_log_dir << "/modelgate_";
    filename << std::put_time(std::localtime(&time_t), "%Y%m%d_%H%M%S");
    filename << ".log";

    return filename.str();
}

} // namespace Modelgate
