/**
 * @file SelectionExporter.hpp
 * @brief Export of a layer selection to a delimited table or a feature dataset
 *
 * Entry points of the export pipeline. Each run:
 *   1. pre-flight checks (input loaded, selection, append/overwrite target)
 *   2. derived fields (area on the input, nearest distance, radius tag)
 *   3. grouping and statistics, with generated names reconciled
 *   4. serialization or the permanent copy
 *   5. removal of every temporary dataset, on success and on failure
 *
 * Engine failures abort the run and come back as the -1 / false sentinel.
 */

#pragma once

#include "../../include/data_search.hpp"
#include "../core/FeatureStore.hpp"
#include "../core/Geoprocessor.hpp"
#include "../core/Logger.hpp"

#include <chrono>
#include <string>

namespace dsearch {

class SelectionExporter {
public:
    SelectionExporter(FeatureStore& store, GeoprocessingEngine& engine,
                      std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL);

    /**
     * @brief Export the input's selection to a .csv/.txt file
     * @return Rows written (0 = nothing to export), or -1 on failure
     */
    long export_selection_to_csv(const ExportRequest& request);

    /**
     * @brief Same as export_selection_to_csv, keeping warnings and the failure category
     */
    ExportOutcome run_csv_export(const ExportRequest& request);

    /**
     * @brief Export the input's selection to a feature dataset (e.g. a shapefile)
     * @return false on failure
     */
    bool export_selection_to_shapefile(const ExportRequest& request);

    ExportOutcome run_feature_export(const ExportRequest& request);

    /**
     * @brief Copy the input's selection to a permanent dataset
     */
    bool keep_layer(const std::string& input, const std::string& output_path);

private:
    FeatureStore& store_;
    GeoprocessingEngine& engine_;
    std::chrono::milliseconds poll_interval_;
    Logger logger_;

    bool preflight(const ExportRequest& request, bool feature_output, ExportOutcome& outcome);
    void fail(ExportOutcome& outcome, ErrorCategory category, const std::string& message,
              bool notify) const;
};

} // namespace dsearch
