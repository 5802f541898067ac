#pragma once

/**
 * @file TemporaryResources.hpp
 * @brief Scoped ownership of the ephemeral datasets of one pipeline run
 *
 * Tracked datasets are removed when the scope is released or destroyed:
 * every session entry under the name is unregistered (one at a time,
 * re-querying after each removal), then the backing dataset is deleted if it
 * still exists. Fields added to a caller's dataset for the run are deleted
 * before that. Failures are logged as warnings and never thrown.
 */

#include "../../include/data_search.hpp"
#include "FeatureStore.hpp"
#include "Geoprocessor.hpp"
#include "Logger.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace dsearch {

class TemporaryResourceScope {
public:
    TemporaryResourceScope(FeatureStore& store, GeoprocessingEngine& engine,
                           std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL);
    ~TemporaryResourceScope();

    TemporaryResourceScope(const TemporaryResourceScope&) = delete;
    TemporaryResourceScope& operator=(const TemporaryResourceScope&) = delete;

    /**
     * @brief Track a temporary dataset, clearing leftovers of a previous run first
     *
     * @param session_name Name the dataset is registered under in the session
     * @param ref Backing dataset
     * @return The dataset path to hand to the engine
     */
    std::string track(const std::string& session_name, const DatasetRef& ref);

    /**
     * @brief Track a field the run added to a dataset it does not own
     */
    void track_field(const std::string& dataset, const std::string& field);

    /**
     * @brief Remove every tracked field and dataset; safe to call repeatedly
     * @return Cleanup failures, already logged
     */
    std::vector<std::string> release();

    size_t tracked_count() const { return resources_.size() + fields_.size(); }

private:
    struct Resource {
        std::string session_name;
        DatasetRef ref;
    };

    struct AddedField {
        std::string dataset;
        std::string field;
    };

    FeatureStore& store_;
    GeoprocessingEngine& engine_;
    std::chrono::milliseconds poll_interval_;
    std::vector<Resource> resources_;
    std::vector<AddedField> fields_;
    Logger logger_;

    void remove(const Resource& resource, std::vector<std::string>& failures);
    void remove(const AddedField& added, std::vector<std::string>& failures);
};

} // namespace dsearch
