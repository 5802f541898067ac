/**
 * @file Geoprocessor.cpp
 * @brief Job lifecycle, polling and the OGR tool dispatcher
 */

#include "Geoprocessor.hpp"
#include "ColumnSpec.hpp"
#include "GeoprocessingTools.hpp"

#include <cpl_error.h>

#include <thread>

namespace dsearch {

namespace {

const std::map<std::string, ToolFunction>& tool_registry() {
    static const std::map<std::string, ToolFunction> registry = {
        {"AddField",               &add_field_tool},
        {"Buffer",                 &buffer_tool},
        {"CalculateField",         &calculate_field_tool},
        {"Clip",                   &clip_tool},
        {"CopyFeatures",           &copy_features_tool},
        {"CopyRows",               &copy_rows_tool},
        {"Delete",                 &delete_tool},
        {"DeleteField",            &delete_field_tool},
        {"Dissolve",               &dissolve_tool},
        {"Intersect",              &intersect_tool},
        {"SelectLayerByAttribute", &select_by_attribute_tool},
        {"SelectLayerByLocation",  &select_by_location_tool},
        {"SpatialJoin",            &spatial_join_tool},
        {"Statistics",             &statistics_tool},
    };
    return registry;
}

} // anonymous namespace

const char* job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::EXECUTING: return "executing";
        case JobStatus::SUCCEEDED: return "succeeded";
        case JobStatus::FAILED:    return "failed";
        case JobStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

// ============================================================================
// GeoprocessingJob
// ============================================================================

GeoprocessingJob::GeoprocessingJob(std::string tool)
    : tool_(std::move(tool)), status_(JobStatus::EXECUTING), cancel_requested_(false) {
}

void GeoprocessingJob::add_message(const std::string& message) {
    std::lock_guard<std::mutex> lock(messages_mutex_);
    messages_.push_back(message);
}

std::vector<std::string> GeoprocessingJob::messages() const {
    std::lock_guard<std::mutex> lock(messages_mutex_);
    return messages_;
}

JobResult wait_for_completion(const JobHandle& job, std::chrono::milliseconds poll_interval) {
    while (job->status() == JobStatus::EXECUTING) {
        std::this_thread::sleep_for(poll_interval);
    }
    return JobResult{job->status(), job->messages()};
}

JobResult run_tool(GeoprocessingEngine& engine, const std::string& tool,
                   const ToolArguments& arguments, std::chrono::milliseconds poll_interval) {
    Logger logger("Geoprocessor");
    logger.detailed("Running " + tool);

    JobHandle job = engine.execute(tool, arguments);
    JobResult result = wait_for_completion(job, poll_interval);

    for (const auto& message : result.messages) {
        logger.trace(tool + ": " + message);
    }

    if (result.status != JobStatus::SUCCEEDED) {
        std::string message = std::string("operation ") + job_status_name(result.status);
        if (!result.messages.empty()) {
            message += ": " + result.messages.back();
        }
        throw EngineOperationError(tool, message, result.messages);
    }
    return result;
}

// ============================================================================
// OgrGeoprocessor
// ============================================================================

OgrGeoprocessor::OgrGeoprocessor(FeatureStore& store)
    : store_(store), logger_("Geoprocessor") {
}

std::vector<std::string> OgrGeoprocessor::tool_names() {
    std::vector<std::string> names;
    for (const auto& entry : tool_registry()) {
        names.push_back(entry.first);
    }
    return names;
}

JobHandle OgrGeoprocessor::execute(const std::string& tool, const ToolArguments& arguments) {
    auto job = std::make_shared<GeoprocessingJob>(tool);

    const auto& registry = tool_registry();
    auto it = registry.find(tool);
    if (it == registry.end()) {
        logger_.error("Unknown geoprocessing tool: " + tool);
        job->add_message("ERROR: Unknown tool " + tool);
        job->set_status(JobStatus::FAILED);
        return job;
    }

    ToolFunction function = it->second;
    FeatureStore* store = &store_;
    GeoprocessingJob* state = job.get();

    job->attach(std::async(std::launch::async, [function, store, state, arguments]() {
        ToolContext ctx{*store, *state, arguments};
        try {
            function(ctx);
            state->add_message("Succeeded");
            state->set_status(JobStatus::SUCCEEDED);
        } catch (const ToolCancelled& e) {
            state->add_message(e.what());
            state->set_status(JobStatus::CANCELLED);
        } catch (const std::exception& e) {
            state->add_message(std::string("ERROR: ") + e.what());
            state->set_status(JobStatus::FAILED);
        }
    }));
    return job;
}

// ============================================================================
// ToolContext and schema helpers
// ============================================================================

const std::string& ToolContext::required(const std::string& key) const {
    auto it = args.find(key);
    if (it == args.end() || it->second.empty()) {
        throw ToolError("Missing required parameter " + key);
    }
    return it->second;
}

std::string ToolContext::optional(const std::string& key, const std::string& fallback) const {
    auto it = args.find(key);
    if (it == args.end() || it->second.empty()) {
        return fallback;
    }
    return it->second;
}

OGRLayer* ToolContext::input_layer(const std::string& key) const {
    const std::string& name = required(key);
    OGRLayer* layer = store.open_layer(name);
    if (!layer) {
        throw ToolError("Dataset does not exist: " + name);
    }
    return layer;
}

OGRLayer* ToolContext::output_layer(const std::string& key, OGRwkbGeometryType geometry_type,
                                    const OGRSpatialReference* srs) const {
    const DatasetRef ref = store.resolve(required(key));
    OGRLayer* layer = store.create_layer(ref, geometry_type, srs);
    if (!layer) {
        throw ToolError("Cannot create output " + ref.path() + ": " + CPLGetLastErrorMsg());
    }
    return layer;
}

void ToolContext::finish_output(const std::string& key, OGRLayer* layer) const {
    layer->SyncToDisk();
    const std::string session_name = optional("add_to_session");
    if (!session_name.empty()) {
        store.register_dataset(session_name, store.resolve(required(key)));
    }
}

std::vector<int> copy_fields(OGRFeatureDefn* source, OGRLayer* output) {
    std::vector<int> mapping(source->GetFieldCount(), -1);
    for (int i = 0; i < source->GetFieldCount(); ++i) {
        OGRFieldDefn field(source->GetFieldDefn(i));
        if (output->GetLayerDefn()->GetFieldIndex(field.GetNameRef()) >= 0) {
            field.SetName((std::string(field.GetNameRef()) + "_1").c_str());
        }
        if (output->CreateField(&field) != OGRERR_NONE) {
            throw ToolError(std::string("Cannot create field ") + field.GetNameRef() + ": " + CPLGetLastErrorMsg());
        }
        mapping[i] = output->GetLayerDefn()->GetFieldCount() - 1;
    }
    return mapping;
}

double parse_number(const std::string& text, const std::string& parameter) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            throw ToolError("Invalid numeric value for " + parameter + ": " + text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw ToolError("Invalid numeric value for " + parameter + ": " + text);
    }
}

void write_feature(OGRLayer* layer, OGRFeature& feature) {
    feature.SetFID(OGRNullFID);
    if (layer->CreateFeature(&feature) != OGRERR_NONE) {
        throw ToolError(std::string("Failed to write feature to ") + layer->GetName() + ": " + CPLGetLastErrorMsg());
    }
}

OGRGeometryUniquePtr union_geometries(const std::vector<const OGRGeometry*>& geometries) {
    OGRGeometryUniquePtr result;
    for (const OGRGeometry* geometry : geometries) {
        if (!geometry) {
            continue;
        }
        if (!result) {
            result.reset(geometry->clone());
            continue;
        }
        OGRGeometry* merged = result->Union(geometry);
        if (!merged) {
            throw ToolError(std::string("Geometry union failed: ") + CPLGetLastErrorMsg());
        }
        result.reset(merged);
    }
    return result;
}

OGRwkbGeometryType multi_geometry_type(OGRwkbGeometryType type) {
    switch (wkbFlatten(type)) {
        case wkbPoint:
        case wkbMultiPoint:
            return wkbMultiPoint;
        case wkbLineString:
        case wkbMultiLineString:
            return wkbMultiLineString;
        case wkbPolygon:
        case wkbMultiPolygon:
            return wkbMultiPolygon;
        default:
            return wkbFlatten(type);
    }
}

OGRGeometryUniquePtr force_to_multi(OGRGeometryUniquePtr geometry) {
    if (!geometry) {
        return geometry;
    }
    const OGRwkbGeometryType target = multi_geometry_type(geometry->getGeometryType());
    return OGRGeometryUniquePtr(OGRGeometryFactory::forceTo(geometry.release(), target));
}

} // namespace dsearch
