/**
 * @file AggregationEngine.cpp
 * @brief Implementation of grouped statistics planning and execution
 */

#include "AggregationEngine.hpp"
#include "ColumnSpec.hpp"
#include "SchemaValidator.hpp"

#include <algorithm>

namespace dsearch {

AggregationEngine::AggregationEngine(FeatureStore& store, GeoprocessingEngine& engine,
                                     std::chrono::milliseconds poll_interval)
    : store_(store), engine_(engine), poll_interval_(poll_interval), logger_("AggregationEngine") {
}

AggregationPlan AggregationEngine::plan(const std::string& dataset,
                                        const std::string& group_spec,
                                        const std::string& statistics_spec,
                                        bool carry_radius) {
    AggregationPlan result;
    const FieldList fields = store_.list_fields(dataset);

    for (const auto& name : split_list(group_spec, ';')) {
        if (SchemaValidator::find_field(fields, name)) {
            result.group_columns.push_back(name);
        } else {
            result.dropped.push_back(name);
        }
    }

    std::vector<std::string> malformed;
    for (const auto& statistic : parse_statistics(statistics_spec, &malformed)) {
        if (SchemaValidator::find_field(fields, statistic.field)) {
            result.statistics.push_back(statistic);
        } else {
            result.dropped.push_back(statistic.field);
        }
    }
    result.dropped.insert(result.dropped.end(), malformed.begin(), malformed.end());

    result.placeholder_injected = inject_placeholder(result);

    if (carry_radius && result.has_statistics()) {
        const bool present = std::any_of(result.statistics.begin(), result.statistics.end(),
                                         [](const StatisticSpec& s) { return iequals(s.field, RADIUS_FIELD); });
        if (!present) {
            result.statistics.emplace_back(RADIUS_FIELD, StatisticType::FIRST);
            result.radius_appended = true;
        }
    }

    logger_.trace("Aggregation plan for " + dataset + ": groups [" + join_list(result.group_columns, ";") +
                  "] statistics [" + format_statistics(result.statistics) + "]");
    return result;
}

bool AggregationEngine::inject_placeholder(AggregationPlan& plan) {
    if (plan.group_columns.empty() || !plan.statistics.empty()) {
        return false;
    }
    plan.statistics.emplace_back(plan.group_columns.front(), StatisticType::FIRST);
    return true;
}

void AggregationEngine::execute(const AggregationPlan& plan, const std::string& input,
                                const std::string& output, AggregationMode mode,
                                const std::string& session_name) {
    if (!plan.has_statistics()) {
        throw PipelineError(ErrorCategory::SCHEMA_MISMATCH, "No statistics to compute for " + input);
    }

    ToolArguments arguments;
    std::string tool;
    if (mode == AggregationMode::STATISTICS_TABLE) {
        tool = "Statistics";
        arguments = {
            {"in_table", input},
            {"out_table", output},
            {"statistics_fields", format_statistics(plan.statistics)},
            {"case_field", join_list(plan.group_columns, ";")},
        };
    } else {
        tool = "Dissolve";
        arguments = {
            {"in_features", input},
            {"out_feature_class", output},
            {"dissolve_field", join_list(plan.group_columns, ";")},
            {"statistics_fields", format_statistics(plan.statistics)},
        };
    }
    if (!session_name.empty()) {
        arguments["add_to_session"] = session_name;
    }

    run_tool(engine_, tool, arguments, poll_interval_);
    logger_.detailed(tool + " of " + input + " completed into " + output);
}

} // namespace dsearch
