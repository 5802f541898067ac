#pragma once

/**
 * @file GeoprocessingTools.hpp
 * @brief Tool implementations behind OgrGeoprocessor (internal)
 */

#include "FeatureStore.hpp"
#include "FieldValues.hpp"
#include "Geoprocessor.hpp"

#include <ogr_geometry.h>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace dsearch {

/**
 * @brief Failure reported by a tool; becomes a FAILED job status
 */
class ToolError : public std::runtime_error {
public:
    explicit ToolError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Raised when a cancel request is observed; becomes CANCELLED
 */
class ToolCancelled : public std::runtime_error {
public:
    ToolCancelled() : std::runtime_error("Operation cancelled") {}
};

struct ToolContext {
    FeatureStore& store;
    GeoprocessingJob& job;
    const ToolArguments& args;

    const std::string& required(const std::string& key) const;
    std::string optional(const std::string& key, const std::string& fallback = "") const;

    OGRLayer* input_layer(const std::string& key) const;
    OGRLayer* output_layer(const std::string& key, OGRwkbGeometryType geometry_type,
                           const OGRSpatialReference* srs) const;

    /// Register the output in the session when "add_to_session" is given
    void finish_output(const std::string& key, OGRLayer* layer) const;

    void message(const std::string& text) const { job.add_message(text); }

    void check_cancelled() const {
        if (job.cancel_requested()) throw ToolCancelled();
    }
};

using ToolFunction = void (*)(ToolContext&);

// Schema helpers ------------------------------------------------------------

/**
 * @brief Create fields of a source definition on an output layer
 *
 * Names already present on the output get a "_1" suffix.
 *
 * @return For each source field, its index on the output layer
 */
std::vector<int> copy_fields(OGRFeatureDefn* source, OGRLayer* output);

double parse_number(const std::string& text, const std::string& parameter);

void write_feature(OGRLayer* layer, OGRFeature& feature);

/**
 * @brief Union of geometries, or nullptr for an empty input
 */
OGRGeometryUniquePtr union_geometries(const std::vector<const OGRGeometry*>& geometries);

OGRGeometryUniquePtr force_to_multi(OGRGeometryUniquePtr geometry);

OGRwkbGeometryType multi_geometry_type(OGRwkbGeometryType type);

// Grouping ------------------------------------------------------------------

class StatisticAccumulator {
public:
    explicit StatisticAccumulator(StatisticType type);

    void add(const FieldValue& value);
    FieldValue result() const;

private:
    StatisticType type_;
    long count_ = 0;
    double sum_ = 0.0;
    double sum_squares_ = 0.0;
    FieldValue min_;
    FieldValue max_;
    FieldValue first_;
    FieldValue last_;
    bool has_first_ = false;
};

/**
 * @brief Groups features by case fields and accumulates statistics
 *
 * Groups are kept in ascending key order.
 */
class GroupAggregator {
public:
    struct Group {
        std::vector<FieldValue> key;
        GIntBig frequency = 0;
        std::vector<StatisticAccumulator> statistics;
        std::vector<OGRGeometryUniquePtr> geometries;
    };

    GroupAggregator(OGRFeatureDefn* source,
                    const std::vector<std::string>& case_fields,
                    const std::vector<StatisticSpec>& statistics,
                    bool collect_geometry);

    void add(const OGRFeature& feature);

    /**
     * @brief Create case fields then "<STAT>_<field>" fields on the output
     */
    void create_output_fields(OGRLayer* output) const;

    /**
     * @brief Write a group's key and statistic values starting at first_field
     */
    void write_group(OGRFeature& output, const Group& group, int first_field) const;

    const std::map<std::vector<FieldValue>, Group, FieldValueKeyLess>& groups() const { return groups_; }

private:
    OGRFeatureDefn* source_;
    std::vector<int> case_indices_;
    std::vector<StatisticSpec> statistics_;
    std::vector<int> statistic_indices_;
    bool collect_geometry_;
    std::map<std::vector<FieldValue>, Group, FieldValueKeyLess> groups_;
};

// Tools ---------------------------------------------------------------------

void copy_features_tool(ToolContext& ctx);
void copy_rows_tool(ToolContext& ctx);
void add_field_tool(ToolContext& ctx);
void delete_field_tool(ToolContext& ctx);
void calculate_field_tool(ToolContext& ctx);
void delete_tool(ToolContext& ctx);
void select_by_attribute_tool(ToolContext& ctx);
void select_by_location_tool(ToolContext& ctx);

void buffer_tool(ToolContext& ctx);
void clip_tool(ToolContext& ctx);
void intersect_tool(ToolContext& ctx);
void spatial_join_tool(ToolContext& ctx);
void dissolve_tool(ToolContext& ctx);

void statistics_tool(ToolContext& ctx);

} // namespace dsearch
