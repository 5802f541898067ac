/**
 * @file AggregateNameReconciler.cpp
 * @brief Implementation of renaming generated statistic fields to their sources
 */

#include "AggregateNameReconciler.hpp"
#include "ColumnSpec.hpp"
#include "SchemaValidator.hpp"

#include <algorithm>

namespace dsearch {

namespace {

bool is_numeric(FieldType type) {
    return type == FieldType::INTEGER || type == FieldType::DOUBLE;
}

struct PendingRename {
    std::string generated;
    FieldInfo source;
};

} // anonymous namespace

const char* field_type_keyword(FieldType type) {
    switch (type) {
        case FieldType::INTEGER: return "LONG";
        case FieldType::DOUBLE:  return "DOUBLE";
        case FieldType::DATE:    return "DATE";
        default:                 return "TEXT";
    }
}

AggregateNameReconciler::AggregateNameReconciler(FeatureStore& store, GeoprocessingEngine& engine,
                                                 std::chrono::milliseconds poll_interval)
    : store_(store), engine_(engine), poll_interval_(poll_interval), logger_("Reconciler") {
}

bool AggregateNameReconciler::types_compatible(FieldType source, FieldType generated) {
    if (source == generated || source == FieldType::STRING) {
        return true;
    }
    return is_numeric(source) && is_numeric(generated);
}

std::vector<std::string> AggregateNameReconciler::reconcile(const std::vector<std::string>& group_columns,
                                                            const std::vector<StatisticSpec>& statistics,
                                                            const std::string& input,
                                                            const std::string& output,
                                                            bool rename_all) {
    std::vector<std::string> warnings;
    auto warn = [&](const std::string& message) {
        logger_.warning(message);
        warnings.push_back(message);
    };

    const FieldList input_fields = store_.list_fields(input);
    const FieldList output_fields = store_.list_fields(output);

    // Resolve every generated name before the schema starts changing
    std::vector<PendingRename> pending;
    for (size_t i = 0; i < statistics.size(); ++i) {
        const StatisticSpec& statistic = statistics[i];
        if (!rename_all && !iequals(statistic.field, RADIUS_FIELD)) {
            continue;
        }

        const size_t index = expected_field_index(group_columns.size(), i);
        if (index >= output_fields.size()) {
            warn("No generated field at position " + std::to_string(index) + " of " + output +
                 " for " + statistic.field);
            continue;
        }

        auto source_index = SchemaValidator::find_field(input_fields, statistic.field);
        if (!source_index) {
            warn("Field " + statistic.field + " not found in " + input + "; keeping " +
                 output_fields[index].name);
            continue;
        }

        const FieldInfo& generated = output_fields[index];
        const FieldInfo& source = input_fields[*source_index];
        if (generated.required || !types_compatible(source.type, generated.type)) {
            warn("Generated field " + generated.name + " at position " + std::to_string(index) +
                 " does not match " + source.name + "; keeping it unchanged");
            continue;
        }
        pending.push_back(PendingRename{generated.name, source});
    }

    for (const auto& rename : pending) {
        const FieldList current = store_.list_fields(output);
        const bool collides = SchemaValidator::find_field(current, rename.source.name).has_value();

        if (collides) {
            const bool group_field = std::any_of(group_columns.begin(), group_columns.end(),
                [&](const std::string& column) { return iequals(column, rename.source.name); });
            const std::string message = rename.source.name + " already exists in " + output +
                                        "; dropping " + rename.generated;
            // A statistic on a group field repeats the group value
            if (group_field) {
                logger_.detailed(message);
            } else {
                warn(message);
            }
        } else {
            ToolArguments add_arguments = {
                {"in_table", output},
                {"field_name", rename.source.name},
                {"field_type", field_type_keyword(rename.source.type)},
            };
            if (rename.source.length > 0) {
                add_arguments["field_length"] = std::to_string(rename.source.length);
            }
            run_tool(engine_, "AddField", add_arguments, poll_interval_);
            run_tool(engine_, "CalculateField", {
                {"in_table", output},
                {"field", rename.source.name},
                {"expression", "[" + rename.generated + "]"},
            }, poll_interval_);
        }

        run_tool(engine_, "DeleteField", {
            {"in_table", output},
            {"drop_field", rename.generated},
        }, poll_interval_);

        logger_.trace("Reconciled " + rename.generated + " -> " + rename.source.name);
    }

    return warnings;
}

} // namespace dsearch
