#include "core/LogManager.h"
#include "locations/PlatformLocations.h"

#include <iostream>
#include <sstream>
#include <ctime>
#include <chrono>
#include <algorithm>
#include <cstdio>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace FileCommander {

// ==================== LogEntry ====================

std::string LogEntry::toString() const {
    std::stringstream ss;
    ss << LogManager::formatTimestamp(timestamp) << " ";
    ss << "[" << LogManager::levelToString(level) << "] ";
    ss << "[" << LogManager::categoryToString(category) << "] ";
    ss << action << ": " << message;
    if (!filePath.empty()) ss << " (path: " << filePath << ")";
    if (!details.empty()) ss << " - " << details;
    return ss.str();
}

// ==================== LogManager Singleton ====================

LogManager& LogManager::instance() {
    static LogManager instance;
    return instance;
}

LogManager::LogManager() {
    std::string home = PlatformLocations::homeDirectory();
    if (!home.empty()) {
        m_logDir = (fs::path(home) / ".filecommander" / "logs").string();
    } else {
        m_logDir = "./logs";
    }

    m_lastFlushTime = std::chrono::steady_clock::now();
}

LogManager::~LogManager() {
    flush();
    closeLogFiles();
}

// ==================== Configuration ====================

void LogManager::setLogDirectory(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    flushWriteBuffer();
    closeLogFiles();
    m_logDir = path;
    m_currentLogDate.clear();
}

void LogManager::ensureLogDirectory() {
    std::error_code ec;
    fs::create_directories(m_logDir, ec);
    if (ec) {
        std::cerr << "LogManager: Failed to create log directory '" << m_logDir
                  << "': " << ec.message() << std::endl;
    }
}

std::string LogManager::getCurrentDateString() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    struct tm tm_now;
#ifdef _WIN32
    localtime_s(&tm_now, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_now);
#endif

    char buffer[16];
    snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d",
             tm_now.tm_year + 1900, tm_now.tm_mon + 1, tm_now.tm_mday);
    return buffer;
}

std::string LogManager::getActivityLogPath() const {
    return m_logDir + "/activity_" + getCurrentDateString() + ".log";
}

std::string LogManager::getErrorLogPath() const {
    return m_logDir + "/errors.log";
}

void LogManager::openLogFiles() {
    std::string currentDate = getCurrentDateString();

    // New day: rotate the activity log
    if (m_currentLogDate != currentDate) {
        if (m_activityLog.is_open()) m_activityLog.close();
        m_currentLogDate = currentDate;
    }

    if (!m_activityLog.is_open()) {
        std::string activityPath = getActivityLogPath();
        m_activityLog.open(activityPath, std::ios::app);
        if (!m_activityLog.is_open()) {
            std::cerr << "LogManager: Failed to open activity log file: " << activityPath << std::endl;
        }
    }

    if (!m_errorLog.is_open()) {
        std::string errorPath = getErrorLogPath();
        m_errorLog.open(errorPath, std::ios::app);
        if (!m_errorLog.is_open()) {
            std::cerr << "LogManager: Failed to open error log file: " << errorPath << std::endl;
        }
    }
}

void LogManager::closeLogFiles() {
    if (m_activityLog.is_open()) m_activityLog.close();
    if (m_errorLog.is_open()) m_errorLog.close();
}

// ==================== Static Utilities ====================

int64_t LogManager::currentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string LogManager::formatTimestamp(int64_t timestamp) {
    time_t seconds = static_cast<time_t>(timestamp / 1000);
    int millis = static_cast<int>(timestamp % 1000);
    struct tm tm_info;
#ifdef _WIN32
    localtime_s(&tm_info, &seconds);
#else
    localtime_r(&seconds, &tm_info);
#endif

    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
             tm_info.tm_year + 1900, tm_info.tm_mon + 1, tm_info.tm_mday,
             tm_info.tm_hour, tm_info.tm_min, tm_info.tm_sec, millis);
    return buffer;
}

std::string LogManager::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "UNKNOWN";
    }
}

LogLevel LogManager::stringToLevel(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warning;
    if (upper == "ERROR") return LogLevel::Error;
    return LogLevel::Info;
}

std::string LogManager::categoryToString(LogCategory cat) {
    switch (cat) {
        case LogCategory::General: return "GENERAL";
        case LogCategory::Location: return "LOCATION";
        case LogCategory::Folder: return "FOLDER";
        case LogCategory::File: return "FILE";
        case LogCategory::Move: return "MOVE";
        case LogCategory::Search: return "SEARCH";
        case LogCategory::Media: return "MEDIA";
        case LogCategory::Plan: return "PLAN";
        case LogCategory::Interpreter: return "INTERPRETER";
        case LogCategory::Launcher: return "LAUNCHER";
        case LogCategory::System: return "SYSTEM";
        default: return "UNKNOWN";
    }
}

// ==================== Logging Methods ====================

void LogManager::log(LogLevel level, LogCategory category,
                     const std::string& action, const std::string& message,
                     const std::string& details) {
    logWithPath(level, category, action, message, "", details);
}

void LogManager::logWithPath(LogLevel level, LogCategory category,
                             const std::string& action, const std::string& message,
                             const std::string& filePath,
                             const std::string& details) {
    if (level < m_minLevel) return;

    LogEntry entry;
    entry.timestamp = currentTimeMs();
    entry.level = level;
    entry.category = category;
    entry.action = action;
    entry.message = message;
    entry.details = details;
    entry.filePath = filePath;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_recentEntries.push_back(entry);
        if (m_recentEntries.size() > MAX_CACHED_ENTRIES) {
            m_recentEntries.pop_front();
        }

        writeToFile(entry);

        // stdout belongs to command results
        if (m_consoleOutput) {
            std::cerr << entry.toString() << std::endl;
        }
    }
}

void LogManager::writeToFile(const LogEntry& entry) {
    std::string currentDate = getCurrentDateString();
    // First entry or a new day
    if (m_currentLogDate != currentDate) {
        flushWriteBuffer();
        ensureLogDirectory();
        openLogFiles();
    }

    std::string logLine = entry.toString();
    m_writeBuffer.push_back(logLine);

    // Errors always go to error log immediately
    if (entry.level == LogLevel::Error && m_errorLog.is_open()) {
        m_errorLog << logLine << "\n";
        m_errorLog.flush();
    }

    auto now = std::chrono::steady_clock::now();
    bool shouldFlush = (m_writeBuffer.size() >= WRITE_BUFFER_SIZE) ||
                       ((now - m_lastFlushTime) >= FLUSH_INTERVAL) ||
                       (entry.level == LogLevel::Error);

    if (shouldFlush) {
        flushWriteBuffer();
    }
}

void LogManager::flushWriteBuffer() {
    if (m_writeBuffer.empty()) return;

    if (m_activityLog.is_open()) {
        for (const auto& line : m_writeBuffer) {
            m_activityLog << line << "\n";
        }
        m_activityLog.flush();
    }

    m_writeBuffer.clear();
    m_lastFlushTime = std::chrono::steady_clock::now();
}

void LogManager::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    flushWriteBuffer();
}

// Convenience methods
void LogManager::debug(LogCategory cat, const std::string& action, const std::string& msg) {
    log(LogLevel::Debug, cat, action, msg);
}

void LogManager::info(LogCategory cat, const std::string& action, const std::string& msg) {
    log(LogLevel::Info, cat, action, msg);
}

void LogManager::warning(LogCategory cat, const std::string& action, const std::string& msg) {
    log(LogLevel::Warning, cat, action, msg);
}

void LogManager::error(LogCategory cat, const std::string& action, const std::string& msg) {
    log(LogLevel::Error, cat, action, msg);
}

// ==================== Query Methods ====================

std::vector<LogEntry> LogManager::getRecentEntries(int count) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<LogEntry> result;
    int start = std::max(0, static_cast<int>(m_recentEntries.size()) - count);
    for (size_t i = static_cast<size_t>(start); i < m_recentEntries.size(); ++i) {
        result.push_back(m_recentEntries[i]);
    }
    return result;
}

void LogManager::clearRecent() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_recentEntries.clear();
}

} // namespace FileCommander
