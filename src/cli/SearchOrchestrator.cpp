/**
 * @file SearchOrchestrator.cpp
 * @brief Implementation of search job orchestration
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "SearchOrchestrator.hpp"
#include "UnitParser.hpp"
#include "../core/ScriptHook.hpp"
#include "../export/CsvSerializer.hpp"
#include "../export/SelectionExporter.hpp"
#include <ogr_geometry.h>
#include <filesystem>
#include <system_error>

namespace dsearch {

namespace {

const char* SEARCH_WORKSPACE = "mem:search";

// Clears a layer's selection when the layer pass ends, however it ends
class SelectionGuard {
public:
    SelectionGuard(FeatureStore& store, const std::string& layer) : store_(store), layer_(layer) {}
    ~SelectionGuard() { store_.clear_selection(layer_); }

    SelectionGuard(const SelectionGuard&) = delete;
    SelectionGuard& operator=(const SelectionGuard&) = delete;

private:
    FeatureStore& store_;
    std::string layer_;
};

} // anonymous namespace

SearchOrchestrator::SearchOrchestrator(const SearchConfig& config, FeatureStore& store,
                                       GeoprocessingEngine& engine, OutputTracker& tracker)
    : config_(config)
    , store_(store)
    , engine_(engine)
    , tracker_(tracker)
    , strings_(SearchStrings::from_site(config.site, config.replacement_char))
    , poll_interval_(config.poll_interval_ms)
    , search_resources_(store, engine, std::chrono::milliseconds(config.poll_interval_ms))
    , logger_("SearchOrchestrator")
{
}

std::string SearchOrchestrator::resolve_name(const std::string& pattern, const std::string& layer_name) const {
    return substitute_search_strings(pattern, strings_, layer_name);
}

std::string SearchOrchestrator::output_folder() const {
    return resolve_name(config_.output_folder);
}

std::string SearchOrchestrator::combined_table_path() const {
    const std::string name = strip_illegal_characters(resolve_name(config_.combined_sites.table_name),
                                                      config_.replacement_char);
    return (std::filesystem::path(output_folder()) / (name + "." + config_.combined_sites.format)).string();
}

bool SearchOrchestrator::run() {
    logger_.info("Starting search for " + config_.site.reference +
                 (config_.site.name.empty() ? "" : " (" + config_.site.name + ")"));

    std::error_code ec;
    std::filesystem::create_directories(output_folder(), ec);
    if (ec) {
        logger_.error("Cannot create output folder " + output_folder() + ": " + ec.message());
        return false;
    }

    tracker_.startStage("Search area");
    if (!prepare_search_area()) {
        tracker_.completeStage("Search area", false, "search area not available");
        return false;
    }
    tracker_.completeStage("Search area");

    if (!start_combined_table()) {
        return false;
    }

    for (const auto& layer : config_.layers) {
        const std::string stage = "Layer " + layer.name;
        tracker_.startStage(stage);
        searched_layers_++;

        const bool ok = run_layer(layer);
        if (!ok) {
            failed_layers_++;
            logger_.error("Search of layer " + layer.name + " failed");
        }
        tracker_.completeStage(stage, ok, ok ? "" : "see log");
    }

    search_resources_.release();

    if (failed_layers_ > 0) {
        logger_.warning(std::to_string(failed_layers_) + " of " + std::to_string(searched_layers_) +
                        " layers failed");
    } else {
        logger_.info("Search complete: " + std::to_string(searched_layers_) + " layers");
    }
    return failed_layers_ == 0;
}

// ============================================================================
// Search area
// ============================================================================

bool SearchOrchestrator::prepare_search_area() {
    if (!config_.site.location.empty()) {
        if (!create_site_layer()) {
            return false;
        }
        distance_target_ = SITE_LAYER;
    }

    if (!config_.site.search_area.empty()) {
        const DatasetRef ref = DatasetRef::parse(config_.site.search_area);
        if (!store_.open_layer(ref)) {
            logger_.error("Search area not found: " + config_.site.search_area);
            return false;
        }
        if (!store_.is_loaded(SEARCH_AREA_LAYER)) {
            store_.register_dataset(SEARCH_AREA_LAYER, ref);
        }
        if (distance_target_.empty()) {
            distance_target_ = SEARCH_AREA_LAYER;
        }
        logger_.info("Using search area " + config_.site.search_area);
        return true;
    }

    double radius_meters = 0.0;
    try {
        radius_meters = UnitParser().parse_distance(config_.site.radius).value;
    } catch (const UnitParseError& e) {
        logger_.error(e.what());
        return false;
    }

    const std::string area_path = search_resources_.track(
        SEARCH_AREA_LAYER, DatasetRef{SEARCH_WORKSPACE, SEARCH_AREA_LAYER, ""});
    try {
        run_tool(engine_, "Buffer", {
            {"in_features", SITE_LAYER},
            {"out_feature_class", area_path},
            {"buffer_distance", std::to_string(radius_meters)},
            {"dissolve_option", "ALL"},
            {"add_to_session", SEARCH_AREA_LAYER},
        }, poll_interval_);
    } catch (const EngineOperationError& e) {
        logger_.error("Cannot buffer the site: " + std::string(e.what()));
        for (const auto& message : e.diagnostics()) {
            logger_.error("  " + message);
        }
        return false;
    }

    logger_.info("Search area: " + config_.site.radius + " around " + config_.site.reference);
    return true;
}

bool SearchOrchestrator::create_site_layer() {
    OGRGeometry* parsed = nullptr;
    if (OGRGeometryFactory::createFromWkt(config_.site.location.c_str(), nullptr, &parsed) != OGRERR_NONE ||
        !parsed) {
        logger_.error("Invalid site location: " + config_.site.location);
        return false;
    }
    OGRGeometryUniquePtr geometry(parsed);

    const DatasetRef ref{SEARCH_WORKSPACE, SITE_LAYER, ""};
    search_resources_.track(SITE_LAYER, ref);

    OGRLayer* layer = store_.create_layer(ref, wkbFlatten(geometry->getGeometryType()));
    if (!layer) {
        logger_.error("Cannot create the site layer");
        return false;
    }

    OGRFieldDefn reference_field("Reference", OFTString);
    reference_field.SetWidth(50);
    if (layer->CreateField(&reference_field) != OGRERR_NONE) {
        logger_.error("Cannot create the site layer");
        return false;
    }

    OGRFeatureUniquePtr feature(OGRFeature::CreateFeature(layer->GetLayerDefn()));
    feature->SetField("Reference", config_.site.reference.c_str());
    feature->SetGeometryDirectly(geometry.release());
    if (layer->CreateFeature(feature.get()) != OGRERR_NONE) {
        logger_.error("Cannot write the site geometry");
        return false;
    }

    store_.register_dataset(SITE_LAYER, ref);
    return true;
}

bool SearchOrchestrator::start_combined_table() {
    const auto& combined = config_.combined_sites;
    if (combined.mode == CombinedSitesMode::NONE) {
        return true;
    }

    const std::string path = combined_table_path();
    const bool exists = std::filesystem::exists(path);
    if (combined.mode == CombinedSitesMode::APPEND && exists) {
        logger_.info("Appending to combined sites table " + path);
        return true;
    }

    CsvSerializer serializer(store_);
    if (!serializer.write_empty_csv(path, combined.columns)) {
        logger_.error("Cannot create combined sites table " + path);
        return false;
    }
    logger_.info("Created combined sites table " + path);
    return true;
}

// ============================================================================
// Layers
// ============================================================================

ExportRequest SearchOrchestrator::base_request(const LayerConfig& layer) const {
    ExportRequest request;
    request.input = MASTER_LAYER;
    request.include_area = layer.include_area;
    request.area_unit = config_.area_unit;
    request.include_distance = layer.include_distance && !distance_target_.empty();
    request.target = distance_target_;
    request.radius = layer.include_radius ? config_.site.radius : RADIUS_NONE;
    request.rename_columns = layer.rename_columns;
    request.notify = config_.notify;
    request.temp_workspace = config_.temp_workspace;
    return request;
}

bool SearchOrchestrator::run_layer(const LayerConfig& layer) {
    logger_.info("Starting analysis for " + layer.name);

    if (!store_.is_loaded(layer.name)) {
        const DatasetRef ref = DatasetRef::parse(layer.dataset);
        if (!store_.open_layer(ref)) {
            logger_.error("Dataset of layer " + layer.name + " not found: " + layer.dataset);
            return false;
        }
        store_.register_dataset(layer.name, ref);
    }

    SelectionGuard clear_on_exit(store_, layer.name);
    TemporaryResourceScope temporaries(store_, engine_, poll_interval_);

    try {
        run_tool(engine_, "SelectLayerByLocation", {
            {"in_layer", layer.name},
            {"select_features", SEARCH_AREA_LAYER},
            {"overlap_type", "INTERSECT"},
            {"selection_type", "NEW_SELECTION"},
        }, poll_interval_);

        if (store_.feature_count(layer.name) > 0 && !layer.criteria.empty()) {
            logger_.detailed("Refining selection with criteria " + layer.criteria);
            run_tool(engine_, "SelectLayerByAttribute", {
                {"in_layer", layer.name},
                {"where_clause", layer.criteria},
                {"selection_type", "SUBSET_SELECTION"},
            }, poll_interval_);
        }

        const long feature_count = store_.feature_count(layer.name);
        tracker_.addStageData("Layer " + layer.name, "features", std::to_string(feature_count));

        bool ok = true;
        if (feature_count > 0) {
            logger_.info(std::to_string(feature_count) + " feature(s) found");

            const std::string master_path = temporaries.track(
                MASTER_LAYER, DatasetRef{config_.temp_workspace, MASTER_LAYER, ""});
            create_master_output(layer, master_path);

            const std::string table_name = strip_illegal_characters(
                resolve_name(layer.table_output_name, layer.name), config_.replacement_char);
            const std::string table_path =
                (std::filesystem::path(output_folder()) / (table_name + "." + layer.format)).string();

            if (!layer.format.empty() && !layer.columns.empty()) {
                ok = export_layer_table(layer, table_path) && ok;
            }

            if (layer.keep_layer) {
                const std::string gis_name = strip_illegal_characters(
                    resolve_name(layer.gis_output_name, layer.name), config_.replacement_char);
                const std::string gis_path =
                    (std::filesystem::path(output_folder()) / (gis_name + ".shp")).string();

                SelectionExporter exporter(store_, engine_, poll_interval_);
                if (exporter.keep_layer(MASTER_LAYER, gis_path)) {
                    tracker_.trackOutputFile(gis_path, "shp", "layer", layer.name,
                                             store_.feature_count(gis_path));
                } else {
                    ok = false;
                }
            }

            if (!layer.combined_sites_columns.empty() &&
                config_.combined_sites.mode != CombinedSitesMode::NONE) {
                ok = add_to_combined_table(layer) && ok;
            }

            logger_.info("Analysis complete");
        } else {
            logger_.info("No features found");
        }

        if (!layer.macro.empty()) {
            const std::string table_file = strip_illegal_characters(
                resolve_name(layer.table_output_name, layer.name), config_.replacement_char) + "." + layer.format;
            logger_.detailed("Executing post-export script " + layer.macro);
            if (ScriptHook(layer.macro).run(output_folder(), table_file) < 0) {
                logger_.error("Error executing post-export script " + layer.macro);
                ok = false;
            }
        }

        return ok;

    } catch (const EngineOperationError& e) {
        logger_.error("Error searching layer " + layer.name + ": " + e.what());
        for (const auto& message : e.diagnostics()) {
            logger_.error("  " + message);
        }
        return false;
    }
}

void SearchOrchestrator::create_master_output(const LayerConfig& layer, const std::string& master_path) {
    const std::optional<GeometryKind> kind = store_.sample_geometry_kind(store_.resolve(layer.name));
    const bool polygon = kind == GeometryKind::POLYGON;
    const bool line = kind == GeometryKind::LINE;

    ToolArguments copy = {
        {"in_features", layer.name},
        {"out_feature_class", master_path},
        {"add_to_session", MASTER_LAYER},
    };

    switch (layer.output_type) {
        case OutputType::CLIP:
            if (polygon || line) {
                logger_.detailed("Clipping selected features");
                run_tool(engine_, "Clip", {
                    {"in_features", layer.name},
                    {"clip_features", SEARCH_AREA_LAYER},
                    {"out_feature_class", master_path},
                    {"add_to_session", MASTER_LAYER},
                }, poll_interval_);
                return;
            }
            break;

        case OutputType::OVERLAY:
            if (polygon) {
                logger_.detailed("Overlaying selected features");
                run_tool(engine_, "Clip", {
                    {"in_features", SEARCH_AREA_LAYER},
                    {"clip_features", layer.name},
                    {"out_feature_class", master_path},
                    {"add_to_session", MASTER_LAYER},
                }, poll_interval_);
                return;
            }
            break;

        case OutputType::INTERSECT:
            if (polygon) {
                logger_.detailed("Intersecting selected features");
                run_tool(engine_, "Intersect", {
                    {"in_features", layer.name},
                    {"intersect_features", SEARCH_AREA_LAYER},
                    {"out_feature_class", master_path},
                    {"add_to_session", MASTER_LAYER},
                }, poll_interval_);
                return;
            }
            break;

        case OutputType::COPY:
            break;
    }

    if (layer.output_type != OutputType::COPY) {
        logger_.detailed(output_type_name(layer.output_type) + " does not apply to " +
                         (kind ? geometry_kind_name(*kind) : std::string("unknown")) +
                         " features of " + layer.name + ", copying");
    }
    logger_.detailed("Copying selected features");
    run_tool(engine_, "CopyFeatures", copy, poll_interval_);
}

bool SearchOrchestrator::export_layer_table(const LayerConfig& layer, const std::string& table_path) {
    ExportRequest request = base_request(layer);
    request.output = table_path;
    request.columns = layer.columns;
    request.group_columns = layer.group_columns;
    request.statistics_columns = layer.statistics_columns;
    request.order_columns = layer.order_columns;

    SelectionExporter exporter(store_, engine_, poll_interval_);
    logger_.detailed("Extracting summary information");

    if (layer.format == "shp") {
        request.overwrite = config_.overwrite;
        const ExportOutcome outcome = exporter.run_feature_export(request);
        if (outcome.failure) {
            logger_.error("Error exporting " + layer.name + " to " + table_path);
            return false;
        }
        tracker_.trackOutputFile(table_path, "shp", "table", layer.name, outcome.rows);
        return true;
    }

    // Table files are always rewritten; only csv carries a header row
    request.overwrite = true;
    request.include_headers = layer.format == "csv";
    const ExportOutcome outcome = exporter.run_csv_export(request);
    if (outcome.failure) {
        logger_.error("Error extracting summary from " + layer.name);
        return false;
    }
    logger_.info(std::to_string(outcome.rows) + " record(s) exported");
    tracker_.trackOutputFile(table_path, layer.format, "table", layer.name, outcome.rows);
    return true;
}

bool SearchOrchestrator::add_to_combined_table(const LayerConfig& layer) {
    ExportRequest request = base_request(layer);
    request.output = combined_table_path();
    request.columns = layer.combined_sites_columns;
    request.group_columns = layer.combined_sites_group_columns;
    request.statistics_columns = layer.combined_sites_statistics_columns;
    request.order_columns = layer.combined_sites_order_columns;
    request.overwrite = false;
    request.include_headers = false;

    logger_.detailed("Extracting summary output for combined sites table");
    SelectionExporter exporter(store_, engine_, poll_interval_);
    const ExportOutcome outcome = exporter.run_csv_export(request);
    if (outcome.failure) {
        logger_.error("Error extracting summary for combined sites table from " + layer.name);
        return false;
    }
    logger_.info(std::to_string(outcome.rows) + " row(s) added to combined sites table");
    tracker_.trackOutputFile(request.output, config_.combined_sites.format, "combined", layer.name,
                             outcome.rows);
    return true;
}

} // namespace dsearch
