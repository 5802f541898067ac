/**
 * @file OutputTracker.hpp
 * @brief Run summary: files written and per-stage timings of a search
 *
 * Each search stage (search area, one entry per layer, combined table) is
 * started and completed by name. Output files are tracked with the layer that
 * produced them and the number of rows or features written.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Logger.hpp"
#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

namespace dsearch {

/**
 * @brief A file or dataset written by the run
 */
struct OutputFileInfo {
    std::string filename;
    std::string format;      // "csv", "txt", "shp"
    std::string type;        // "table", "layer", "combined"
    std::string layer_name;  // empty for combined outputs
    long rows = 0;
    size_t file_size_bytes = 0;
    bool exists = false;

    OutputFileInfo(const std::string& fname, const std::string& fmt, const std::string& t)
        : filename(fname), format(fmt), type(t) {}
};

/**
 * @brief One timed stage of a search run
 */
struct SearchStage {
    std::string stage_name;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    bool completed = false;
    bool successful = false;
    std::string error_message;
    std::unordered_map<std::string, std::string> stage_data;

    explicit SearchStage(const std::string& name)
        : stage_name(name), start_time(std::chrono::steady_clock::now()) {}

    void complete(bool success, const std::string& error) {
        end_time = std::chrono::steady_clock::now();
        completed = true;
        successful = success;
        error_message = error;
    }

    std::chrono::milliseconds duration() const {
        if (!completed) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    }
};

class OutputTracker {
public:
    OutputTracker();

    void trackOutputFile(const std::string& filename, const std::string& format,
                         const std::string& type, const std::string& layer_name, long rows);

    void startStage(const std::string& stage_name);
    void completeStage(const std::string& stage_name, bool successful = true, const std::string& error = "");
    void addStageData(const std::string& stage_name, const std::string& key, const std::string& value);

    std::string getFileTrackingSummary() const;
    std::string getPipelineStatus() const;
    std::string getTimingReport() const;

    void printSummary() const;
    void printDetailedReport() const;

    size_t getTrackedFileCount() const { return tracked_files_.size(); }
    size_t getCompletedStageCount() const;
    size_t getFailedStageCount() const;
    size_t getTotalFileSize() const;

    std::vector<std::string> getOutputFiles() const;
    const std::vector<OutputFileInfo>& getTrackedFiles() const { return tracked_files_; }
    const SearchStage* findStage(const std::string& stage_name) const;

    void clear();

private:
    std::vector<OutputFileInfo> tracked_files_;
    std::vector<SearchStage> stages_;
    std::chrono::steady_clock::time_point tracking_start_time_;
    Logger logger_;

    std::string formatDuration(std::chrono::milliseconds duration) const;
    std::string formatFileSize(size_t bytes) const;

    SearchStage* findMutableStage(const std::string& stage_name);
};

} // namespace dsearch
