/**
 * @file Logger.hpp
 * @brief Centralized logging with per-component verbosity control
 *
 * All diagnostics go through Logger::outputMessage(), which holds the single
 * verbosity check and writes to stderr so that an SVG document streamed to
 * stdout is never interleaved with log lines.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace kmd {

/**
 * @brief Log levels
 *
 * 1: Errors (rendering cannot continue)
 * 2: Warnings (output degraded, e.g. glyph fallback to text)
 * 3: Information (high-level progress)
 * 4: Detailed information (per layer / per combo progress)
 * 5: Basic debugging (objects, methods)
 * 6: Detailed debugging (computed coordinates)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Component-scoped logger
 *
 * Each component owns a Logger named after itself ("KeymapSVGRenderer",
 * "KeymapLoader", ...). The effective level is the facility level for that
 * name if one was registered, else the instance level, else the global
 * default. Consecutive identical messages are collapsed into a single
 * "occurred N times" summary.
 */
class Logger {
public:
    Logger();

    /**
     * @brief Constructor with component name (uses default WARNING level)
     * @param component_name Facility name used for level lookup
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Constructor with explicit level and optional log file
     * @param level Instance level threshold
     * @param log_file Optional log file path (appends if it exists)
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * THIS IS THE SINGLE POINT OF LOGGING CONTROL
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    LogLevel getLogLevel() const { return current_level_; }

    /**
     * @brief Set or change the log file
     * @param log_file Path to log file, or nullopt to disable file logging
     */
    void setLogFile(const std::optional<std::string>& log_file);

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Emit any pending repeat summary and flush console and file output
     */
    void flush() const;

    // ========================================================================
    // Facility-based level control
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply a log configuration string
     *
     * - "5" sets the default level to DEBUG
     * - "KeymapSVGRenderer=6,default=3" sets one facility and the default
     * - "4,KeymapLoader=6" mixes both forms
     *
     * Invalid entries are reported on stderr and skipped.
     */
    static void parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Log file shared by every logger without a file of its own
     * @param log_file Path to append to, or nullopt to stop file logging
     */
    static void setSharedLogFile(const std::optional<std::string>& log_file);

    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    std::string component_name_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    // Duplicate suppression state
    mutable std::string last_message_;
    mutable LogLevel last_level_ = LogLevel::INFO;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;
    static std::shared_ptr<std::ofstream> shared_file_stream_;

    static std::shared_ptr<std::ofstream> openLogFile(const std::string& path);

    void initializeFileStream();
    void doOutput(LogLevel level, const std::string& message) const;
    void flushPendingRepeats() const;
};

} // namespace kmd
