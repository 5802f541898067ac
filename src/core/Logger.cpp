/**
 * @file Logger.cpp
 * @brief Implementation of centralized logging system
 */

#include "Logger.hpp"
#include <iostream>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <sstream>
#include <algorithm>

namespace dsearch {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::mutex Logger::registry_mutex_;

std::shared_ptr<std::ofstream> Logger::global_stream_;
bool Logger::console_enabled_ = true;
std::mutex Logger::sink_mutex_;

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:   return "ERROR: ";
        case LogLevel::WARNING: return "WARNING: ";
        default:                return "";
    }
}

std::shared_ptr<std::ofstream> open_append(const std::string& path) {
    std::filesystem::path log_path(path);
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
    }
    auto stream = std::make_shared<std::ofstream>(path, std::ios::app);
    if (!stream->is_open()) {
        return nullptr;
    }
    return stream;
}

} // anonymous namespace

Logger::Logger(const std::string& component_name)
    : component_name_(component_name),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }

    std::cout.flush();
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (static_cast<int>(level) <= static_cast<int>(getEffectiveLevel())) {

        if (has_last_message_ && message == last_message_ && level == last_level_) {
            repeat_count_++;
            return;
        }

        if (has_last_message_ && repeat_count_ > 0) {
            doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        }

        doOutput(level, message);

        last_message_ = message;
        last_level_ = level;
        repeat_count_ = 0;
        has_last_message_ = true;
    }
}

std::string Logger::fileTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm* tm = std::localtime(&time_t);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d/%02d/%04d %02d:%02d:%02d",
                  tm->tm_mday, tm->tm_mon + 1, tm->tm_year + 1900,
                  tm->tm_hour, tm->tm_min, tm->tm_sec);
    return timestamp;
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm* tm = std::localtime(&time_t);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm->tm_hour, tm->tm_min, tm->tm_sec, static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> sink_lock(sink_mutex_);

    if (console_enabled_) {
        std::cout << "[" << timestamp << "] " << level_tag(level) << message << std::endl;
    }

    const std::string file_line = fileTimestamp() + " :: " + level_tag(level) + message;

    if (global_stream_ && global_stream_->is_open()) {
        *global_stream_ << file_line << std::endl;
        global_stream_->flush();
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }

    std::cout.flush();
}

// ============================================================================
// Facility-based logging implementation
// ============================================================================

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = facility_levels_.find(facility);
    if (it != facility_levels_.end()) {
        return it->second;
    }

    return default_level_;
}

void Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return;

    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token.erase(0, token.find_first_not_of(" \t\n\r"));
        token.erase(token.find_last_not_of(" \t\n\r") + 1);

        if (token.empty()) continue;

        size_t equals_pos = token.find('=');
        if (equals_pos != std::string::npos) {
            std::string facility = token.substr(0, equals_pos);
            std::string level_str = token.substr(equals_pos + 1);

            facility.erase(0, facility.find_first_not_of(" \t\n\r"));
            facility.erase(facility.find_last_not_of(" \t\n\r") + 1);
            level_str.erase(0, level_str.find_first_not_of(" \t\n\r"));
            level_str.erase(level_str.find_last_not_of(" \t\n\r") + 1);

            try {
                int level_int = std::stoi(level_str);
                LogLevel level = static_cast<LogLevel>(std::clamp(level_int, 1, 6));

                if (facility == "default") {
                    default_level_ = level;
                } else {
                    facility_levels_[facility] = level;
                }
            } catch (const std::exception&) {
                std::cerr << "Warning: Invalid log level '" << level_str << "' for facility '" << facility << "'" << std::endl;
            }
        } else {
            try {
                int level_int = std::stoi(token);
                default_level_ = static_cast<LogLevel>(std::clamp(level_int, 1, 6));
            } catch (const std::exception&) {
                std::cerr << "Warning: Invalid default log level '" << token << "'" << std::endl;
            }
        }
    }
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

bool Logger::setGlobalLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(sink_mutex_);

    if (global_stream_) {
        global_stream_->close();
        global_stream_.reset();
    }

    if (!log_file.has_value() || log_file->empty()) {
        return true;
    }

    try {
        global_stream_ = open_append(log_file.value());
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Warning: Exception opening log file: " << e.what() << std::endl;
        global_stream_.reset();
    }

    if (!global_stream_) {
        std::cerr << "Warning: Failed to open log file: " << log_file.value() << std::endl;
        return false;
    }
    return true;
}

void Logger::setConsoleEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    console_enabled_ = enabled;
}

LogLevel Logger::getEffectiveLevel() const {
    if (!component_name_.empty()) {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    return default_level_;
}

} // namespace dsearch
