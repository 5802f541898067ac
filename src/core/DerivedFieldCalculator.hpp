#pragma once

/**
 * @file DerivedFieldCalculator.hpp
 * @brief Area, nearest-distance and radius tag fields
 *
 * Every step runs through the geoprocessing engine and throws
 * EngineOperationError on failure; there is no partial result.
 */

#include "../../include/data_search.hpp"
#include "FeatureStore.hpp"
#include "Geoprocessor.hpp"
#include "Logger.hpp"

#include <chrono>
#include <string>

namespace dsearch {

class DerivedFieldCalculator {
public:
    DerivedFieldCalculator(FeatureStore& store, GeoprocessingEngine& engine,
                           std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL);

    /**
     * @brief Add (if missing) and calculate the "Area" field
     *
     * Only polygon datasets are processed; the geometry kind is sampled
     * from the dataset.
     *
     * @return false when the dataset is not a polygon dataset and was left untouched
     */
    bool add_area(const std::string& dataset, AreaUnit unit);

    /**
     * @brief Nearest-neighbour join of input against target into output
     *
     * The output keeps every input row and gains a "Distance" field to the
     * closest target feature (null when the target is empty).
     *
     * @param session_name Name to register the output under, or empty
     */
    void add_distance(const std::string& input, const std::string& target,
                      const std::string& output, const std::string& session_name);

    /**
     * @brief Add (if missing) a "Radius" text field holding the literal radius
     */
    void add_radius(const std::string& dataset, const std::string& radius);

    static std::string area_expression(AreaUnit unit);

private:
    FeatureStore& store_;
    GeoprocessingEngine& engine_;
    std::chrono::milliseconds poll_interval_;
    Logger logger_;
};

} // namespace dsearch
