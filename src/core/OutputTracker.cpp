/**
 * @file OutputTracker.cpp
 * @brief Implementation of the run summary
 */

#include "OutputTracker.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace dsearch {

OutputTracker::OutputTracker()
    : tracking_start_time_(std::chrono::steady_clock::now()), logger_("OutputTracker") {
}

void OutputTracker::trackOutputFile(const std::string& filename, const std::string& format,
                                    const std::string& type, const std::string& layer_name, long rows) {
    OutputFileInfo info(filename, format, type);
    info.layer_name = layer_name;
    info.rows = rows;

    std::error_code ec;
    info.exists = std::filesystem::exists(filename, ec);
    if (info.exists) {
        const auto size = std::filesystem::file_size(filename, ec);
        info.file_size_bytes = ec ? 0 : static_cast<size_t>(size);
    }

    logger_.detailed("Wrote " + filename + " (" + type + ", " + std::to_string(rows) + " rows)");
    tracked_files_.push_back(info);
}

void OutputTracker::startStage(const std::string& stage_name) {
    stages_.emplace_back(stage_name);
    logger_.debug("[STAGE START] " + stage_name);
}

void OutputTracker::completeStage(const std::string& stage_name, bool successful, const std::string& error) {
    SearchStage* stage = findMutableStage(stage_name);
    if (!stage) {
        logger_.debug("Completing unknown stage " + stage_name);
        return;
    }
    stage->complete(successful, error);

    std::string message = "[STAGE COMPLETE] " + stage_name + " (" + formatDuration(stage->duration()) + ")";
    if (!successful) {
        message += " [FAILED: " + error + "]";
    }
    logger_.debug(message);
}

void OutputTracker::addStageData(const std::string& stage_name, const std::string& key, const std::string& value) {
    if (SearchStage* stage = findMutableStage(stage_name)) {
        stage->stage_data[key] = value;
    }
}

std::string OutputTracker::getFileTrackingSummary() const {
    size_t present = 0;
    long rows = 0;
    for (const auto& file : tracked_files_) {
        if (file.exists) {
            present++;
        }
        rows += file.rows;
    }

    std::ostringstream oss;
    oss << "Files: " << present << "/" << tracked_files_.size() << " written, "
        << rows << " rows, " << formatFileSize(getTotalFileSize()) << " total";
    return oss.str();
}

std::string OutputTracker::getPipelineStatus() const {
    std::ostringstream oss;
    oss << "Stages: " << getCompletedStageCount() << "/" << stages_.size() << " completed";
    const size_t failed = getFailedStageCount();
    if (failed > 0) {
        oss << ", " << failed << " failed";
    }
    return oss.str();
}

std::string OutputTracker::getTimingReport() const {
    auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - tracking_start_time_);
    return "Total time: " + formatDuration(total_time);
}

void OutputTracker::printSummary() const {
    std::ostringstream summary;
    summary << "\n=== Search Summary ===\n";
    summary << getFileTrackingSummary() << "\n";
    summary << getPipelineStatus() << "\n";
    summary << getTimingReport() << "\n";
    summary << "======================";
    logger_.info(summary.str());
}

void OutputTracker::printDetailedReport() const {
    std::ostringstream report;
    report << "\n=== Search Report ===\n";

    report << "\nStages:\n";
    for (const auto& stage : stages_) {
        report << "  " << stage.stage_name;
        if (stage.completed) {
            report << " [" << formatDuration(stage.duration()) << "]";
            if (!stage.successful) {
                report << " FAILED: " << stage.error_message;
            }
        } else {
            report << " [NOT COMPLETED]";
        }
        report << "\n";
        for (const auto& [key, value] : stage.stage_data) {
            report << "    " << key << ": " << value << "\n";
        }
    }

    report << "\nOutputs:\n";
    for (const auto& file : tracked_files_) {
        report << "  " << file.filename << " (" << file.format << ", " << file.type;
        if (!file.layer_name.empty()) {
            report << ", " << file.layer_name;
        }
        report << ") " << file.rows << " rows";
        if (file.exists) {
            report << " [" << formatFileSize(file.file_size_bytes) << "]";
        }
        report << "\n";
    }

    report << "=====================";
    logger_.info(report.str());
}

size_t OutputTracker::getCompletedStageCount() const {
    return std::count_if(stages_.begin(), stages_.end(),
                         [](const SearchStage& stage) { return stage.completed; });
}

size_t OutputTracker::getFailedStageCount() const {
    return std::count_if(stages_.begin(), stages_.end(),
                         [](const SearchStage& stage) { return stage.completed && !stage.successful; });
}

size_t OutputTracker::getTotalFileSize() const {
    size_t total = 0;
    for (const auto& file : tracked_files_) {
        total += file.file_size_bytes;
    }
    return total;
}

std::vector<std::string> OutputTracker::getOutputFiles() const {
    std::vector<std::string> files;
    for (const auto& file : tracked_files_) {
        if (std::find(files.begin(), files.end(), file.filename) == files.end()) {
            files.push_back(file.filename);
        }
    }
    return files;
}

void OutputTracker::clear() {
    tracked_files_.clear();
    stages_.clear();
    tracking_start_time_ = std::chrono::steady_clock::now();
}

std::string OutputTracker::formatDuration(std::chrono::milliseconds duration) const {
    auto ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << (ms / 1000.0) << "s";
        return oss.str();
    }
    auto minutes = ms / 60000;
    auto seconds = (ms % 60000) / 1000;
    return std::to_string(minutes) + "m" + std::to_string(seconds) + "s";
}

std::string OutputTracker::formatFileSize(size_t bytes) const {
    const char* units[] = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(bytes);
    int unit = 0;

    while (size >= 1024 && unit < 3) {
        size /= 1024;
        unit++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit];
    return oss.str();
}

SearchStage* OutputTracker::findMutableStage(const std::string& stage_name) {
    auto it = std::find_if(stages_.rbegin(), stages_.rend(),
                           [&stage_name](const SearchStage& stage) {
                               return stage.stage_name == stage_name;
                           });
    return (it != stages_.rend()) ? &(*it) : nullptr;
}

const SearchStage* OutputTracker::findStage(const std::string& stage_name) const {
    auto it = std::find_if(stages_.rbegin(), stages_.rend(),
                           [&stage_name](const SearchStage& stage) {
                               return stage.stage_name == stage_name;
                           });
    return (it != stages_.rend()) ? &(*it) : nullptr;
}

} // namespace dsearch
