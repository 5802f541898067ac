/**
 * @file SearchOrchestrator.hpp
 * @brief Runs a search job: search area, then one export pass per layer
 *
 * For each configured layer the orchestrator selects the features inside the
 * search area, refines the selection with the layer's criteria, builds the
 * layer output (copy, clip, overlay or intersect), exports its table, keeps
 * the layer if requested, adds its summary to the combined sites table and
 * runs the layer's post-export script. A failing layer is logged and counted;
 * the remaining layers still run.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "ConfigurationManager.hpp"
#include "../core/FeatureStore.hpp"
#include "../core/Geoprocessor.hpp"
#include "../core/Logger.hpp"
#include "../core/OutputTracker.hpp"
#include "../core/TemporaryResources.hpp"
#include <chrono>
#include <string>

namespace dsearch {

inline constexpr const char* SITE_LAYER = "Site";
inline constexpr const char* SEARCH_AREA_LAYER = "SearchArea";
inline constexpr const char* MASTER_LAYER = "SearchMaster";

class SearchOrchestrator {
public:
    SearchOrchestrator(const SearchConfig& config, FeatureStore& store, GeoprocessingEngine& engine,
                       OutputTracker& tracker);

    /**
     * @brief Run the whole job
     * @return true if the search area was built and every layer succeeded
     */
    bool run();

    /**
     * @brief Register or build the search area (and the site layer)
     */
    bool prepare_search_area();

    /**
     * @brief Create or check the combined sites table for this run
     */
    bool start_combined_table();

    /**
     * @brief Search and export one layer
     * @return false if any step of the layer failed
     */
    bool run_layer(const LayerConfig& layer);

    /**
     * @brief Apply the job's search strings to an output name pattern
     */
    std::string resolve_name(const std::string& pattern, const std::string& layer_name = "") const;

    std::string output_folder() const;
    std::string combined_table_path() const;

    size_t failed_layer_count() const { return failed_layers_; }
    size_t searched_layer_count() const { return searched_layers_; }

private:
    const SearchConfig& config_;
    FeatureStore& store_;
    GeoprocessingEngine& engine_;
    OutputTracker& tracker_;
    SearchStrings strings_;
    std::chrono::milliseconds poll_interval_;
    TemporaryResourceScope search_resources_;
    std::string distance_target_;
    size_t failed_layers_ = 0;
    size_t searched_layers_ = 0;
    Logger logger_;

    bool create_site_layer();

    /**
     * @brief Build the dataset the layer's exports read from
     *
     * Falls back to a copy of the selection when the output type does not
     * apply to the layer's geometry.
     */
    void create_master_output(const LayerConfig& layer, const std::string& master_path);

    bool export_layer_table(const LayerConfig& layer, const std::string& table_path);
    bool add_to_combined_table(const LayerConfig& layer);
    ExportRequest base_request(const LayerConfig& layer) const;

    SearchOrchestrator(const SearchOrchestrator&) = delete;
    SearchOrchestrator& operator=(const SearchOrchestrator&) = delete;
};

} // namespace dsearch
