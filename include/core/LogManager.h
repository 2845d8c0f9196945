#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <fstream>
#include <cstdint>
#include <chrono>

namespace FileCommander {

/**
 * Log levels
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * Log categories for filtering
 */
enum class LogCategory {
    General,
    Location,
    Folder,
    File,
    Move,
    Search,
    Media,
    Plan,
    Interpreter,
    Launcher,
    System
};

/**
 * Single log entry
 */
struct LogEntry {
    int64_t timestamp = 0;        // Unix timestamp in milliseconds
    LogLevel level = LogLevel::Info;
    LogCategory category = LogCategory::General;
    std::string action;           // e.g., "create_folder", "move_all"
    std::string message;          // Human-readable message
    std::string details;          // Additional details (system error text)
    std::string filePath;         // Associated path (if any)

    std::string toString() const;
};

/**
 * LogManager - Centralized logging for all FileCommander operations
 *
 * Features:
 * - Multiple log levels (Debug, Info, Warning, Error)
 * - Daily activity log plus a dedicated error log
 * - Log files opened on first write
 * - Buffered writes, flushed on errors and on a timer
 * - In-memory cache of recent entries
 */
class LogManager {
public:
    /**
     * Get singleton instance
     */
    static LogManager& instance();

    // Prevent copying
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    // ==================== Configuration ====================

    /**
     * Set log directory
     * Default: ~/.filecommander/logs/
     * Nothing is created on disk until the first entry is written.
     */
    void setLogDirectory(const std::string& path);
    std::string getLogDirectory() const { return m_logDir; }

    void setMinLevel(LogLevel level) { m_minLevel = level; }
    LogLevel getMinLevel() const { return m_minLevel; }

    /**
     * Echo entries to stderr as they are logged
     */
    void setConsoleOutput(bool enabled) { m_consoleOutput = enabled; }

    // ==================== Logging Methods ====================

    void log(LogLevel level, LogCategory category,
             const std::string& action, const std::string& message,
             const std::string& details = "");

    /**
     * Log with the path the entry is about
     */
    void logWithPath(LogLevel level, LogCategory category,
                     const std::string& action, const std::string& message,
                     const std::string& filePath,
                     const std::string& details = "");

    // Convenience methods
    void debug(LogCategory cat, const std::string& action, const std::string& msg);
    void info(LogCategory cat, const std::string& action, const std::string& msg);
    void warning(LogCategory cat, const std::string& action, const std::string& msg);
    void error(LogCategory cat, const std::string& action, const std::string& msg);

    // ==================== Query Methods ====================

    std::vector<LogEntry> getRecentEntries(int count = 50);

    /**
     * Flush pending writes to disk
     */
    void flush();

    /**
     * Drop cached entries (log files are kept)
     */
    void clearRecent();

    // ==================== Utilities ====================

    static std::string levelToString(LogLevel level);
    static LogLevel stringToLevel(const std::string& str);
    static std::string categoryToString(LogCategory cat);

    static int64_t currentTimeMs();
    static std::string formatTimestamp(int64_t timestamp);

private:
    LogManager();
    ~LogManager();

    // Configuration
    std::string m_logDir;
    LogLevel m_minLevel = LogLevel::Info;
    bool m_consoleOutput = false;

    // File handles
    std::ofstream m_activityLog;
    std::ofstream m_errorLog;
    std::string m_currentLogDate;

    // Thread safety
    std::mutex m_mutex;

    std::deque<LogEntry> m_recentEntries;
    static const size_t MAX_CACHED_ENTRIES = 1000;

    // Write buffer for batched disk writes
    std::vector<std::string> m_writeBuffer;
    std::chrono::steady_clock::time_point m_lastFlushTime;
    static const size_t WRITE_BUFFER_SIZE = 100;
    static constexpr std::chrono::seconds FLUSH_INTERVAL{5};

    // Internal methods
    void ensureLogDirectory();
    void openLogFiles();
    void closeLogFiles();
    void writeToFile(const LogEntry& entry);
    void flushWriteBuffer();
    std::string getActivityLogPath() const;
    std::string getErrorLogPath() const;
    std::string getCurrentDateString() const;
};

// ==================== Macros for convenient logging ====================

#define LOG_DEBUG(cat, action, msg) \
    FileCommander::LogManager::instance().debug(cat, action, msg)

#define LOG_INFO(cat, action, msg) \
    FileCommander::LogManager::instance().info(cat, action, msg)

#define LOG_WARNING(cat, action, msg) \
    FileCommander::LogManager::instance().warning(cat, action, msg)

#define LOG_ERROR(cat, action, msg) \
    FileCommander::LogManager::instance().error(cat, action, msg)

} // namespace FileCommander

#endif // LOG_MANAGER_H
