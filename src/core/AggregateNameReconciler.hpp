#pragma once

/**
 * @file AggregateNameReconciler.hpp
 * @brief Restores source field names on grouping output
 *
 * The grouping tools name their aggregate fields themselves ("SUM_Area").
 * The reconciler finds each statistic's generated field by position, adds a
 * field named after the source field with the source field's type and
 * length, copies the values across and deletes the generated field.
 *
 * Position of statistic i: LEADING_SYSTEM_FIELD_COUNT + group count + i.
 * This depends on the output layout of the Statistics and Dissolve tools
 * (identity + FREQUENCY, or identity + geometry). Changing that layout
 * breaks every caller that renames.
 */

#include "../../include/data_search.hpp"
#include "FeatureStore.hpp"
#include "Geoprocessor.hpp"
#include "Logger.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace dsearch {

/// System-managed fields ahead of the group fields in grouping output
inline constexpr size_t LEADING_SYSTEM_FIELD_COUNT = 2;

class AggregateNameReconciler {
public:
    AggregateNameReconciler(FeatureStore& store, GeoprocessingEngine& engine,
                            std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL);

    static size_t expected_field_index(size_t group_count, size_t statistic_position) {
        return LEADING_SYSTEM_FIELD_COUNT + group_count + statistic_position;
    }

    /**
     * @brief Whether a generated field's values can be stored in the source field's type
     */
    static bool types_compatible(FieldType source, FieldType generated);

    /**
     * @brief Rename generated aggregate fields back to their source names
     *
     * @param input Dataset the statistics were computed from (source types)
     * @param output Grouping output to modify in place
     * @param rename_all Rename every statistic; otherwise only Radius
     * @return Warnings for statistics that were left under their generated name
     * @throws EngineOperationError when a field operation fails
     */
    std::vector<std::string> reconcile(const std::vector<std::string>& group_columns,
                                       const std::vector<StatisticSpec>& statistics,
                                       const std::string& input,
                                       const std::string& output,
                                       bool rename_all);

private:
    FeatureStore& store_;
    GeoprocessingEngine& engine_;
    std::chrono::milliseconds poll_interval_;
    Logger logger_;
};

const char* field_type_keyword(FieldType type);

} // namespace dsearch
