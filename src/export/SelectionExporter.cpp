/**
 * @file SelectionExporter.cpp
 * @brief Implementation of the selection export pipeline
 */

#include "SelectionExporter.hpp"
#include "CsvSerializer.hpp"
#include "../core/AggregateNameReconciler.hpp"
#include "../core/AggregationEngine.hpp"
#include "../core/ColumnSpec.hpp"
#include "../core/DerivedFieldCalculator.hpp"
#include "../core/FieldProjector.hpp"
#include "../core/SchemaValidator.hpp"
#include "../core/TemporaryResources.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

namespace dsearch {

namespace {

DatasetRef temporary_ref(const std::string& workspace, const std::string& name) {
    DatasetRef ref;
    ref.workspace = workspace;
    ref.name = name;
    return ref;
}

void append(std::vector<std::string>& target, const std::vector<std::string>& items) {
    target.insert(target.end(), items.begin(), items.end());
}

} // anonymous namespace

SelectionExporter::SelectionExporter(FeatureStore& store, GeoprocessingEngine& engine,
                                     std::chrono::milliseconds poll_interval)
    : store_(store), engine_(engine), poll_interval_(poll_interval), logger_("SelectionExporter") {
}

void SelectionExporter::fail(ExportOutcome& outcome, ErrorCategory category,
                             const std::string& message, bool notify) const {
    logger_.error(message);
    outcome.failure = category;
    outcome.failure_message = message;
    if (notify) {
        std::cerr << "Export failed (" << error_category_name(category) << "): " << message << std::endl;
    }
}

bool SelectionExporter::preflight(const ExportRequest& request, bool feature_output,
                                  ExportOutcome& outcome) {
    if (!store_.is_loaded(request.input)) {
        fail(outcome, ErrorCategory::INPUT_MISSING, "Input layer " + request.input + " is not loaded", request.notify);
        return false;
    }

    if (request.check_for_selection) {
        const Selection* selection = store_.selection(request.input);
        if (!selection || selection->empty()) {
            fail(outcome, ErrorCategory::INPUT_MISSING, "No features selected in " + request.input, request.notify);
            return false;
        }
    }

    if (request.output.empty()) {
        fail(outcome, ErrorCategory::INPUT_MISSING, "No output specified for " + request.input, request.notify);
        return false;
    }

    if (!request.overwrite) {
        if (feature_output) {
            if (store_.layer_exists(store_.resolve(request.output))) {
                fail(outcome, ErrorCategory::INPUT_MISSING,
                     "Output " + request.output + " already exists and overwrite is off", request.notify);
                return false;
            }
        } else {
            std::error_code ec;
            if (!std::filesystem::exists(request.output, ec)) {
                fail(outcome, ErrorCategory::INPUT_MISSING,
                     "Cannot append to " + request.output + ": file does not exist", request.notify);
                return false;
            }
        }
    }

    if (request.include_distance) {
        SchemaValidator validator(store_);
        if (request.target.empty() || !validator.dataset_exists(request.target)) {
            fail(outcome, ErrorCategory::INPUT_MISSING,
                 "Distance target " + request.target + " does not exist", request.notify);
            return false;
        }
    }
    return true;
}

// ============================================================================
// Delimited table export
// ============================================================================

long SelectionExporter::export_selection_to_csv(const ExportRequest& request) {
    const ExportOutcome outcome = run_csv_export(request);
    return outcome.failure ? -1 : outcome.rows;
}

ExportOutcome SelectionExporter::run_csv_export(const ExportRequest& request) {
    ExportOutcome outcome;
    if (!preflight(request, false, outcome)) {
        return outcome;
    }
    logger_.info("Exporting " + request.input + " to " + request.output);

    TemporaryResourceScope temporaries(store_, engine_, poll_interval_);
    const std::string feature_path = temporaries.track(
        request.temp_feature_name, temporary_ref(request.temp_workspace, request.temp_feature_name));
    const std::string table_path = temporaries.track(
        request.temp_table_name, temporary_ref(request.temp_workspace, request.temp_table_name));

    try {
        DerivedFieldCalculator derived(store_, engine_, poll_interval_);
        if (request.include_area) {
            derived.add_area(request.input, request.area_unit);
        }

        if (request.include_distance) {
            derived.add_distance(request.input, request.target, feature_path, request.temp_feature_name);
        } else {
            run_tool(engine_, "CopyFeatures", {
                {"in_features", request.input},
                {"out_feature_class", feature_path},
                {"add_to_session", request.temp_feature_name},
            }, poll_interval_);
        }

        if (request.radius_requested()) {
            derived.add_radius(request.temp_feature_name, request.radius);
        }

        AggregationEngine aggregation(store_, engine_, poll_interval_);
        const AggregationPlan plan = aggregation.plan(request.temp_feature_name, request.group_columns,
                                                      request.statistics_columns, request.radius_requested());
        append(outcome.warnings, plan.dropped);

        std::string source = request.temp_feature_name;
        if (plan.has_statistics()) {
            aggregation.execute(plan, request.temp_feature_name, table_path,
                                AggregationMode::STATISTICS_TABLE, request.temp_table_name);
            if (request.rename_columns || request.radius_requested()) {
                AggregateNameReconciler reconciler(store_, engine_, poll_interval_);
                append(outcome.warnings, reconciler.reconcile(plan.group_columns, plan.statistics,
                                                              request.temp_feature_name,
                                                              request.temp_table_name,
                                                              request.rename_columns));
            }
            source = request.temp_table_name;
        }

        append(outcome.warnings, FieldProjector::project(request.columns, store_.list_fields(source)).missing);

        CsvSerializer::Options options;
        options.append = !request.overwrite;
        options.exclude_header = !request.include_headers;
        options.order_columns = request.order_columns;

        CsvSerializer serializer(store_);
        const long rows = serializer.write_csv(source, request.output, request.columns, options);
        if (rows < 0) {
            fail(outcome, ErrorCategory::INPUT_MISSING, "Cannot write " + request.output, request.notify);
        } else {
            outcome.rows = rows;
        }
    } catch (const EngineOperationError& e) {
        fail(outcome, ErrorCategory::ENGINE_FAILURE, e.what(), request.notify);
        for (const auto& diagnostic : e.diagnostics()) {
            logger_.error("  " + diagnostic);
        }
    } catch (const PipelineError& e) {
        fail(outcome, e.category(), e.what(), request.notify);
    }

    append(outcome.warnings, temporaries.release());

    if (!outcome.failure) {
        logger_.info("Exported " + std::to_string(outcome.rows) + " rows from " + request.input);
    }
    return outcome;
}

// ============================================================================
// Feature export
// ============================================================================

bool SelectionExporter::export_selection_to_shapefile(const ExportRequest& request) {
    return !run_feature_export(request).failure.has_value();
}

ExportOutcome SelectionExporter::run_feature_export(const ExportRequest& request) {
    ExportOutcome outcome;
    if (!preflight(request, true, outcome)) {
        return outcome;
    }
    logger_.info("Exporting features of " + request.input + " to " + request.output);

    TemporaryResourceScope temporaries(store_, engine_, poll_interval_);
    const std::string feature_path = temporaries.track(
        request.temp_feature_name, temporary_ref(request.temp_workspace, request.temp_feature_name));

    try {
        DerivedFieldCalculator derived(store_, engine_, poll_interval_);
        if (request.include_area) {
            // Area only lives on the input for the duration of the export
            if (!SchemaValidator(store_).field_exists(request.input, AREA_FIELD)) {
                temporaries.track_field(request.input, AREA_FIELD);
            }
            derived.add_area(request.input, request.area_unit);
        }

        AggregationEngine aggregation(store_, engine_, poll_interval_);
        const AggregationPlan plan = aggregation.plan(request.input, request.group_columns,
                                                      request.statistics_columns, false);
        append(outcome.warnings, plan.dropped);

        std::string current = request.input;
        if (plan.has_statistics()) {
            aggregation.execute(plan, request.input, feature_path, AggregationMode::DISSOLVE,
                                request.temp_feature_name);
            if (request.rename_columns) {
                AggregateNameReconciler reconciler(store_, engine_, poll_interval_);
                append(outcome.warnings, reconciler.reconcile(plan.group_columns, plan.statistics,
                                                              request.input, request.temp_feature_name, true));
            }
            current = request.temp_feature_name;
        }

        if (request.include_distance) {
            derived.add_distance(current, request.target, request.output, "");
        } else {
            run_tool(engine_, "CopyFeatures", {
                {"in_features", current},
                {"out_feature_class", request.output},
            }, poll_interval_);
        }

        if (request.radius_requested()) {
            derived.add_radius(request.output, request.radius);
        }

        if (!trim(request.columns).empty()) {
            const FieldList fields = store_.list_fields(request.output);
            const Projection keep = FieldProjector::project(request.columns, fields);
            append(outcome.warnings, keep.missing);

            auto requested = [&](const std::string& name) {
                for (const auto& token : keep.tokens) {
                    if (iequals(token, name)) return true;
                }
                return false;
            };

            std::vector<std::string> drop;
            for (const auto& field : fields) {
                if (!field.required && !requested(field.name)) {
                    drop.push_back(field.name);
                }
            }
            if (!drop.empty()) {
                run_tool(engine_, "DeleteField", {
                    {"in_table", request.output},
                    {"drop_field", join_list(drop, ";")},
                }, poll_interval_);
            }
        }

        outcome.rows = store_.feature_count(request.output);
    } catch (const EngineOperationError& e) {
        fail(outcome, ErrorCategory::ENGINE_FAILURE, e.what(), request.notify);
        for (const auto& diagnostic : e.diagnostics()) {
            logger_.error("  " + diagnostic);
        }
    } catch (const PipelineError& e) {
        fail(outcome, e.category(), e.what(), request.notify);
    }

    append(outcome.warnings, temporaries.release());

    if (!outcome.failure) {
        logger_.info("Exported " + std::to_string(outcome.rows) + " features to " + request.output);
    }
    return outcome;
}

bool SelectionExporter::keep_layer(const std::string& input, const std::string& output_path) {
    try {
        run_tool(engine_, "CopyFeatures", {
            {"in_features", input},
            {"out_feature_class", output_path},
        }, poll_interval_);
    } catch (const EngineOperationError& e) {
        logger_.error("Cannot keep layer " + input + ": " + e.what());
        return false;
    }
    logger_.info("Kept layer " + input + " as " + output_path);
    return true;
}

} // namespace dsearch
