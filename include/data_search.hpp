#pragma once

/**
 * @file data_search.hpp
 * @brief Main header for DataSearch
 *
 * Shared vocabulary of the selection export and aggregation pipeline:
 * field descriptions, dataset references, statistic specifications, the
 * per-export run context and the error categories the pipeline reports.
 */

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace dsearch {

// ============================================================================
// Fields and values
// ============================================================================

enum class FieldType {
    STRING,
    INTEGER,
    DOUBLE,
    DATE,
    GEOMETRY,
    OTHER
};

/**
 * @brief Description of one field of a dataset
 *
 * Required fields are system-managed (identity, geometry) and are never
 * deleted by the pipeline.
 */
struct FieldInfo {
    std::string name;
    std::string alias;
    FieldType type = FieldType::OTHER;
    int length = 0;
    bool required = false;

    FieldInfo() = default;
    FieldInfo(std::string n, FieldType t, int len = 0, bool req = false)
        : name(std::move(n)), type(t), length(len), required(req) {}
};

using FieldList = std::vector<FieldInfo>;

/**
 * @brief A single cell value; monostate is a null
 */
using FieldValue = std::variant<std::monostate, std::string, std::int64_t, double>;

inline bool is_null(const FieldValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

/**
 * @brief Simplified geometry type sampled from a dataset's first feature
 */
enum class GeometryKind {
    POINT,
    LINE,
    POLYGON,
    OTHER
};

std::string geometry_kind_name(GeometryKind kind);

// ============================================================================
// Derived fields
// ============================================================================

enum class AreaUnit {
    HECTARES,
    SQUARE_METERS,
    SQUARE_KILOMETERS
};

inline constexpr const char* AREA_FIELD = "Area";
inline constexpr const char* DISTANCE_FIELD = "Distance";
inline constexpr const char* RADIUS_FIELD = "Radius";
inline constexpr int AREA_FIELD_LENGTH = 20;
inline constexpr int RADIUS_FIELD_LENGTH = 25;

/// Radius value meaning "no radius tag requested"
inline constexpr const char* RADIUS_NONE = "none";

// ============================================================================
// Statistics
// ============================================================================

enum class StatisticType {
    SUM,
    MEAN,
    MIN,
    MAX,
    RANGE,
    STD,
    COUNT,
    FIRST,
    LAST
};

std::string statistic_keyword(StatisticType type);
std::optional<StatisticType> parse_statistic_keyword(const std::string& keyword);

/**
 * @brief One (field, aggregate function) pair of a statistics request
 */
struct StatisticSpec {
    std::string field;
    StatisticType type = StatisticType::FIRST;

    StatisticSpec() = default;
    StatisticSpec(std::string f, StatisticType t) : field(std::move(f)), type(t) {}

    bool operator==(const StatisticSpec& other) const {
        return field == other.field && type == other.type;
    }
};

// ============================================================================
// Dataset references
// ============================================================================

/**
 * @brief Location + name of a table or feature dataset
 *
 * Paths are split at the last '/'. A single-file dataset keeps its
 * extension ("sites.shp" in directory "out"); "mem:<name>" workspaces are
 * in-memory and live as long as the FeatureStore that created them.
 */
struct DatasetRef {
    std::string workspace;
    std::string name;
    std::string extension;  // ".shp", ".dbf" or empty

    static DatasetRef parse(const std::string& path);

    std::string path() const;

    bool empty() const { return name.empty(); }
    bool is_single_file() const { return !extension.empty(); }
    bool is_memory() const;
    bool is_remote() const;
};

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Error taxonomy of the pipeline
 *
 * SCHEMA_MISMATCH degrades the request with a warning. INPUT_MISSING and
 * ENGINE_FAILURE end the run with a sentinel return. CLEANUP_FAILURE is
 * logged and never escalated.
 */
enum class ErrorCategory {
    INPUT_MISSING,
    SCHEMA_MISMATCH,
    ENGINE_FAILURE,
    CLEANUP_FAILURE
};

const char* error_category_name(ErrorCategory category);

class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    ErrorCategory category() const { return category_; }

private:
    ErrorCategory category_;
};

/**
 * @brief A named geoprocessing operation reported failure or cancellation
 *
 * Carries the engine's diagnostic messages verbatim.
 */
class EngineOperationError : public PipelineError {
public:
    EngineOperationError(const std::string& tool, const std::string& message,
                         std::vector<std::string> diagnostics = {})
        : PipelineError(ErrorCategory::ENGINE_FAILURE, tool + ": " + message),
          tool_(tool), diagnostics_(std::move(diagnostics)) {}

    const std::string& tool() const { return tool_; }
    const std::vector<std::string>& diagnostics() const { return diagnostics_; }

private:
    std::string tool_;
    std::vector<std::string> diagnostics_;
};

// ============================================================================
// Export requests
// ============================================================================

/**
 * @brief Context of one export invocation
 *
 * Created per call and discarded after cleanup. Column specifications use
 * ',' between output columns and ';' between group and statistic entries
 * ("Field STAT;Field STAT").
 */
struct ExportRequest {
    std::string input;            // session name of the input layer or table
    std::string target;           // session name or path of the nearest-join target
    std::string output;           // output file (.csv/.txt) or dataset path

    std::string columns;
    std::string group_columns;
    std::string statistics_columns;
    std::string order_columns;

    bool include_area = false;
    AreaUnit area_unit = AreaUnit::HECTARES;
    bool include_distance = false;
    std::string radius = RADIUS_NONE;

    bool overwrite = true;        // false appends to an existing table
    bool include_headers = true;
    bool rename_columns = false;
    bool check_for_selection = false;
    bool notify = false;          // echo failures to stderr as an interactive notice

    std::string temp_workspace = "mem:temp";
    std::string temp_feature_name = "TempOutput";
    std::string temp_table_name = "TempTable";

    bool radius_requested() const { return radius != RADIUS_NONE && !radius.empty(); }
};

/**
 * @brief What one export run did, besides its sentinel return value
 */
struct ExportOutcome {
    long rows = 0;
    std::vector<std::string> warnings;            // schema mismatches and cleanup failures
    std::optional<ErrorCategory> failure;
    std::string failure_message;
};

} // namespace dsearch
