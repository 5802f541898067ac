/**
 * @file Logger.hpp
 * @brief Centralized logging with verbosity control and an append-only log sink
 *
 * Every component owns a Logger named after itself. All output funnels
 * through outputMessage(), which holds the one verbosity check. Lines also go
 * to the run's log file when one is attached.
 */

#pragma once

#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <optional>
#include <mutex>
#include <unordered_map>

namespace dsearch {

/**
 * @brief Log levels
 *
 * Level 1: Errors (run aborted or returned a failure sentinel)
 * Level 2: Warnings (request degraded, cleanup failed)
 * Level 3: Information (stage completion)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (objects, methods)
 * Level 6: Detailed debugging (variable values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,     // default
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

class Logger {
public:
    /**
     * @brief Constructor with component (facility) name
     * @param component_name Name used for facility level lookup
     */
    Logger(const std::string& component_name);

    ~Logger();

    /**
     * @brief Output a message if it meets the current verbosity level
     *
     * Single point of logging control. Consecutive duplicates are collapsed
     * into one "occurred N times" line.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void error(const std::string& message) const {
        outputMessage(LogLevel::ERROR, message);
    }

    void warning(const std::string& message) const {
        outputMessage(LogLevel::WARNING, message);
    }

    void info(const std::string& message) const {
        outputMessage(LogLevel::INFO, message);
    }

    void detailed(const std::string& message) const {
        outputMessage(LogLevel::DETAILED, message);
    }

    void debug(const std::string& message) const {
        outputMessage(LogLevel::DEBUG, message);
    }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush pending duplicate summary and all output buffers
     */
    void flush() const;

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply log configuration from string
     *
     * Supports:
     * - Simple level: "5" sets default to DEBUG
     * - Facility-specific: "CsvSerializer=6,AggregationEngine=3"
     * - Mixed: "4,CsvSerializer=6"
     */
    static void parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    // ========================================================================
    // Run-wide log sink
    // ========================================================================

    /**
     * @brief Attach an append-only log file shared by every Logger instance
     *
     * Each line written there is prefixed with "dd/mm/yyyy HH:MM:SS :: ".
     * Pass nullopt to detach.
     *
     * @return false if the file could not be opened
     */
    static bool setGlobalLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Enable or disable console output for all instances
     */
    static void setConsoleEnabled(bool enabled);

private:
    std::string component_name_;
    mutable std::mutex output_mutex_;

    // Message deduplication state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    // Static facility-based logging registry
    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;

    // Static sink state
    static std::shared_ptr<std::ofstream> global_stream_;
    static bool console_enabled_;
    static std::mutex sink_mutex_;

    LogLevel getEffectiveLevel() const;

    void doOutput(LogLevel level, const std::string& message) const;

    static std::string fileTimestamp();
};

} // namespace dsearch
