#pragma once

/**
 * @file Geoprocessor.hpp
 * @brief Named geoprocessing operations with polled completion
 *
 * Operations are started with execute() and run off the calling thread.
 * Callers block in wait_for_completion(), which polls the job status on a
 * fixed interval until it is terminal. There is no timeout.
 */

#include "../../include/data_search.hpp"
#include "FeatureStore.hpp"
#include "Logger.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dsearch {

enum class JobStatus {
    EXECUTING,
    SUCCEEDED,
    FAILED,
    CANCELLED
};

const char* job_status_name(JobStatus status);

/// Named tool parameters, e.g. {"in_features", "Sites"}
using ToolArguments = std::map<std::string, std::string>;

inline constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{1000};

/**
 * @brief State of one running or finished operation
 */
class GeoprocessingJob {
public:
    explicit GeoprocessingJob(std::string tool);

    const std::string& tool() const { return tool_; }

    JobStatus status() const { return status_.load(); }
    void set_status(JobStatus status) { status_.store(status); }

    void add_message(const std::string& message);
    std::vector<std::string> messages() const;

    void request_cancel() { cancel_requested_.store(true); }
    bool cancel_requested() const { return cancel_requested_.load(); }

    void attach(std::future<void> completion) { completion_ = std::move(completion); }

private:
    std::string tool_;
    std::atomic<JobStatus> status_;
    std::atomic<bool> cancel_requested_;
    mutable std::mutex messages_mutex_;
    std::vector<std::string> messages_;
    std::future<void> completion_;
};

using JobHandle = std::shared_ptr<GeoprocessingJob>;

/**
 * @brief Engine executing named operations against a feature store
 */
class GeoprocessingEngine {
public:
    virtual ~GeoprocessingEngine() = default;

    /**
     * @brief Start an operation; never blocks until completion
     *
     * Unknown tools yield a job that is already FAILED.
     */
    virtual JobHandle execute(const std::string& tool, const ToolArguments& arguments) = 0;
};

struct JobResult {
    JobStatus status = JobStatus::EXECUTING;
    std::vector<std::string> messages;
};

/**
 * @brief Block until the job reaches a terminal status
 */
JobResult wait_for_completion(const JobHandle& job,
                              std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL);

/**
 * @brief Execute, wait, and raise EngineOperationError unless the job succeeded
 */
JobResult run_tool(GeoprocessingEngine& engine, const std::string& tool,
                   const ToolArguments& arguments,
                   std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL);

/**
 * @brief GDAL/OGR implementation of the operations the pipeline needs
 *
 * Tools: CopyFeatures, CopyRows, Buffer, Clip, Intersect,
 * SelectLayerByLocation, SelectLayerByAttribute, Statistics, Dissolve,
 * SpatialJoin, AddField, DeleteField, CalculateField, Delete.
 *
 * Any output argument may be paired with "add_to_session" to register the
 * result in the store's session under that name.
 */
class OgrGeoprocessor : public GeoprocessingEngine {
public:
    explicit OgrGeoprocessor(FeatureStore& store);

    JobHandle execute(const std::string& tool, const ToolArguments& arguments) override;

    static std::vector<std::string> tool_names();

private:
    FeatureStore& store_;
    Logger logger_;
};

} // namespace dsearch
