#pragma once

/**
 * @file test_fixtures.hpp
 * @brief Layer builders, scratch directories and engine doubles for the unit tests
 */

#include "test_config.hpp"

#include "core/FeatureStore.hpp"
#include "core/FieldValues.hpp"
#include "core/Geoprocessor.hpp"

#include <ogr_geometry.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace dsearch::test {

inline constexpr std::chrono::milliseconds TEST_POLL{1};

struct Row {
    std::string wkt;                  // empty for tables and null geometries
    std::vector<FieldValue> values;   // one per field, in field order
};

/**
 * @brief Create a dataset, fill it and register it in the session
 *
 * @param path "<workspace>/<name>", e.g. "mem:data/Sites"
 * @param session_name Name to register under; empty to leave it unregistered
 */
inline DatasetRef make_layer(FeatureStore& store, const std::string& path, OGRwkbGeometryType type,
                             const std::vector<FieldInfo>& fields, const std::vector<Row>& rows,
                             const std::string& session_name = "") {
    const DatasetRef ref = DatasetRef::parse(path);
    OGRLayer* layer = store.create_layer(ref, type);
    if (!layer) {
        throw std::runtime_error("Cannot create test layer " + path);
    }
    for (const auto& field : fields) {
        if (!store.add_field(ref, field)) {
            throw std::runtime_error("Cannot add test field " + field.name);
        }
    }

    for (const auto& row : rows) {
        OGRFeatureUniquePtr feature(OGRFeature::CreateFeature(layer->GetLayerDefn()));
        for (size_t i = 0; i < row.values.size(); ++i) {
            write_field_value(*feature, static_cast<int>(i), row.values[i]);
        }
        if (!row.wkt.empty()) {
            OGRGeometry* geometry = nullptr;
            if (OGRGeometryFactory::createFromWkt(row.wkt.c_str(), nullptr, &geometry) != OGRERR_NONE) {
                throw std::runtime_error("Bad test WKT " + row.wkt);
            }
            feature->SetGeometryDirectly(geometry);
        }
        if (layer->CreateFeature(feature.get()) != OGRERR_NONE) {
            throw std::runtime_error("Cannot write test feature to " + path);
        }
    }
    layer->SyncToDisk();

    if (!session_name.empty()) {
        store.register_dataset(session_name, ref);
    }
    return ref;
}

inline std::string square(double x, double y, double size) {
    const std::string x0 = std::to_string(x), y0 = std::to_string(y);
    const std::string x1 = std::to_string(x + size), y1 = std::to_string(y + size);
    return "POLYGON ((" + x0 + " " + y0 + "," + x1 + " " + y0 + "," + x1 + " " + y1 + "," +
           x0 + " " + y1 + "," + x0 + " " + y0 + "))";
}

inline std::string rectangle(double x0, double y0, double x1, double y1) {
    const std::string a = std::to_string(x0), b = std::to_string(y0);
    const std::string c = std::to_string(x1), d = std::to_string(y1);
    return "POLYGON ((" + a + " " + b + "," + c + " " + b + "," + c + " " + d + "," +
           a + " " + d + "," + a + " " + b + "))";
}

/**
 * @brief Fresh, empty directory under the test workspace
 */
inline std::filesystem::path scratch_directory(const std::string& name) {
    const std::filesystem::path path = std::filesystem::path(g_test_settings.test_workspace) / name;
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
    return path;
}

inline std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

inline void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::trunc);
    file << text;
}

inline std::vector<std::string> field_names(FeatureStore& store, const std::string& dataset) {
    std::vector<std::string> names;
    for (const auto& field : store.list_fields(dataset)) {
        names.push_back(field.name);
    }
    return names;
}

/**
 * @brief Values of one attribute over every (selected) row, in store order
 */
inline std::vector<FieldValue> column_values(FeatureStore& store, const std::string& dataset,
                                             const std::string& field) {
    std::vector<FieldValue> values;
    store.visit_features(dataset, [&](OGRFeature& feature) {
        values.push_back(read_field_value(feature, find_field_index(feature.GetDefnRef(), field)));
    });
    return values;
}

inline Selection all_features(FeatureStore& store, const std::string& dataset) {
    Selection ids;
    store.visit_features(dataset, [&](OGRFeature& feature) { ids.insert(feature.GetFID()); });
    return ids;
}

inline JobHandle finished_job(const std::string& tool, JobStatus status, const std::string& message) {
    auto job = std::make_shared<GeoprocessingJob>(tool);
    job->add_message(message);
    job->set_status(status);
    return job;
}

/**
 * @brief Engine double: every operation fails
 */
class FailingEngine : public GeoprocessingEngine {
public:
    JobHandle execute(const std::string& tool, const ToolArguments&) override {
        calls.push_back(tool);
        return finished_job(tool, JobStatus::FAILED, "ERROR: " + tool + " is unavailable");
    }

    std::vector<std::string> calls;
};

/**
 * @brief Engine double: forwards to a real engine, failing the named tools
 */
class SelectiveEngine : public GeoprocessingEngine {
public:
    SelectiveEngine(GeoprocessingEngine& inner, std::set<std::string> failing,
                    JobStatus failure = JobStatus::FAILED)
        : inner_(inner), failing_(std::move(failing)), failure_(failure) {}

    JobHandle execute(const std::string& tool, const ToolArguments& arguments) override {
        calls.push_back(tool);
        if (failing_.count(tool)) {
            return finished_job(tool, failure_, "ERROR 999999: " + tool + " failed");
        }
        return inner_.execute(tool, arguments);
    }

    std::vector<std::string> calls;

private:
    GeoprocessingEngine& inner_;
    std::set<std::string> failing_;
    JobStatus failure_;
};

} // namespace dsearch::test
