#pragma once

/**
 * @file AggregationEngine.hpp
 * @brief Group-by planning and execution
 *
 * A run goes Validate -> Placeholder injection -> Execute. Unknown group and
 * statistic fields are dropped without logging. When group fields survive
 * but no statistic does, "<first group field> FIRST" is injected because the
 * grouping tools need at least one aggregate.
 */

#include "../../include/data_search.hpp"
#include "FeatureStore.hpp"
#include "Geoprocessor.hpp"
#include "Logger.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace dsearch {

enum class AggregationMode {
    STATISTICS_TABLE,   // Statistics tool, attribute table output
    DISSOLVE            // Dissolve tool, feature output
};

struct AggregationPlan {
    std::vector<std::string> group_columns;
    std::vector<StatisticSpec> statistics;
    std::vector<std::string> dropped;       // unknown or malformed entries
    bool placeholder_injected = false;
    bool radius_appended = false;

    /// Aggregation runs only when at least one statistic remains
    bool has_statistics() const { return !statistics.empty(); }
};

class AggregationEngine {
public:
    AggregationEngine(FeatureStore& store, GeoprocessingEngine& engine,
                      std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL);

    /**
     * @brief Validate group and statistic specifications against a dataset
     *
     * @param group_spec ';'-separated group field names
     * @param statistics_spec ';'-separated "Field STAT" entries
     * @param carry_radius Append "Radius FIRST" unless a Radius statistic is present
     */
    AggregationPlan plan(const std::string& dataset,
                         const std::string& group_spec,
                         const std::string& statistics_spec,
                         bool carry_radius);

    /**
     * @brief Add "(first group field, FIRST)" when groups exist without statistics
     * @return true if the placeholder was added
     */
    static bool inject_placeholder(AggregationPlan& plan);

    /**
     * @brief Run the grouping operation, blocking until it completes
     *
     * Output layout: two system fields, the group fields, then one generated
     * field per statistic in plan order.
     *
     * @param session_name Name to register the output under, or empty
     * @throws EngineOperationError when the operation fails or is cancelled
     */
    void execute(const AggregationPlan& plan, const std::string& input, const std::string& output,
                 AggregationMode mode, const std::string& session_name = "");

private:
    FeatureStore& store_;
    GeoprocessingEngine& engine_;
    std::chrono::milliseconds poll_interval_;
    Logger logger_;
};

} // namespace dsearch
