/**
 * @file FeatureStore.cpp
 * @brief Implementation of the GDAL/OGR backed workspace and session handle
 */

#include "FeatureStore.hpp"
#include "ColumnSpec.hpp"

#include <ogr_api.h>

#include <filesystem>
#include <system_error>

namespace dsearch {

namespace {

constexpr const char* DEFAULT_FID_NAME = "FID";
constexpr const char* DEFAULT_GEOMETRY_NAME = "Shape";
constexpr int DOUBLE_FIELD_PRECISION = 8;

bool has_suffix(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           iequals(text.substr(text.size() - suffix.size()), suffix);
}

GDALDriver* memory_vector_driver() {
    // GDAL 3.11 folded the "Memory" vector driver into "MEM"; older
    // releases only have vector support under "Memory".
    for (const char* name : {"Memory", "MEM"}) {
        GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(name);
        if (driver && driver->GetMetadataItem(GDAL_DCAP_VECTOR)) {
            return driver;
        }
    }
    return nullptr;
}

int find_layer_index(GDALDataset* workspace, const std::string& name) {
    for (int i = 0; i < workspace->GetLayerCount(); ++i) {
        OGRLayer* layer = workspace->GetLayer(i);
        if (layer && iequals(layer->GetName(), name)) {
            return i;
        }
    }
    return -1;
}

} // anonymous namespace

FieldType field_type_from_ogr(OGRFieldType type) {
    switch (type) {
        case OFTString:    return FieldType::STRING;
        case OFTInteger:
        case OFTInteger64: return FieldType::INTEGER;
        case OFTReal:      return FieldType::DOUBLE;
        case OFTDate:
        case OFTDateTime:
        case OFTTime:      return FieldType::DATE;
        default:           return FieldType::OTHER;
    }
}

OGRFieldType field_type_to_ogr(FieldType type) {
    switch (type) {
        case FieldType::STRING:  return OFTString;
        case FieldType::INTEGER: return OFTInteger64;
        case FieldType::DOUBLE:  return OFTReal;
        case FieldType::DATE:    return OFTDateTime;
        default:                 return OFTString;
    }
}

GeometryKind geometry_kind_from_ogr(OGRwkbGeometryType type) {
    switch (wkbFlatten(type)) {
        case wkbPoint:
        case wkbMultiPoint:
            return GeometryKind::POINT;
        case wkbLineString:
        case wkbMultiLineString:
        case wkbCircularString:
        case wkbCompoundCurve:
        case wkbMultiCurve:
            return GeometryKind::LINE;
        case wkbPolygon:
        case wkbMultiPolygon:
        case wkbCurvePolygon:
        case wkbMultiSurface:
            return GeometryKind::POLYGON;
        default:
            return GeometryKind::OTHER;
    }
}

FeatureStore::FeatureStore() : logger_("FeatureStore") {
    GDALAllRegister();
}

FeatureStore::~FeatureStore() {
    session_.clear();
    workspaces_.clear();
}

// ============================================================================
// Workspaces
// ============================================================================

GDALDataset* FeatureStore::create_workspace(const std::string& workspace) {
    GDALDriver* driver = nullptr;
    std::string target = workspace;

    if (workspace.rfind("mem:", 0) == 0) {
        driver = memory_vector_driver();
        target = workspace.substr(4);
    } else if (has_suffix(workspace, ".gpkg")) {
        driver = GetGDALDriverManager()->GetDriverByName("GPKG");
        std::filesystem::path parent = std::filesystem::path(workspace).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    } else {
        // A directory of shapefiles; the driver accepts an existing directory
        driver = GetGDALDriverManager()->GetDriverByName("ESRI Shapefile");
        std::filesystem::create_directories(workspace);
    }

    if (!driver) {
        logger_.error("No vector driver available for workspace: " + workspace);
        return nullptr;
    }

    GDALDataset* dataset = driver->Create(target.c_str(), 0, 0, 0, GDT_Unknown, nullptr);
    if (!dataset) {
        logger_.error("Failed to create workspace " + workspace + ": " + CPLGetLastErrorMsg());
        return nullptr;
    }
    logger_.debug("Created workspace " + workspace + " (" + driver->GetDescription() + ")");
    return dataset;
}

GDALDataset* FeatureStore::open_workspace(const std::string& workspace, bool create_if_missing) {
    if (workspace.empty()) {
        return nullptr;
    }

    auto it = workspaces_.find(workspace);
    if (it != workspaces_.end()) {
        return it->second.get();
    }

    GDALDataset* dataset = nullptr;
    const bool memory = workspace.rfind("mem:", 0) == 0;
    const bool remote = DatasetRef{workspace, "", ""}.is_remote();

    std::error_code ec;
    if (!memory && (remote || std::filesystem::exists(workspace, ec))) {
        dataset = GDALDataset::Open(workspace.c_str(), GDAL_OF_VECTOR | GDAL_OF_UPDATE,
                                    nullptr, nullptr, nullptr);
    }

    if (!dataset && create_if_missing && !remote) {
        dataset = create_workspace(workspace);
    }

    if (!dataset) {
        logger_.debug("Workspace not available: " + workspace);
        return nullptr;
    }

    workspaces_.emplace(workspace, GDALDatasetPtr(dataset));
    return dataset;
}

void FeatureStore::release_workspace(const std::string& workspace) {
    if (workspace.rfind("mem:", 0) == 0) {
        return;
    }
    auto it = workspaces_.find(workspace);
    if (it != workspaces_.end()) {
        workspaces_.erase(it);
        logger_.trace("Released workspace " + workspace);
    }
}

// ============================================================================
// Datasets
// ============================================================================

OGRLayer* FeatureStore::open_layer(const DatasetRef& ref) {
    if (ref.empty()) {
        return nullptr;
    }
    GDALDataset* workspace = open_workspace(ref.workspace);
    if (!workspace) {
        return nullptr;
    }
    return workspace->GetLayerByName(ref.name.c_str());
}

OGRLayer* FeatureStore::create_layer(const DatasetRef& ref, OGRwkbGeometryType geometry_type,
                                     const OGRSpatialReference* srs) {
    GDALDataset* workspace = open_workspace(ref.workspace, true);
    if (!workspace) {
        logger_.error("Cannot open output workspace " + ref.workspace);
        return nullptr;
    }

    int existing = find_layer_index(workspace, ref.name);
    if (existing >= 0 && workspace->DeleteLayer(existing) != OGRERR_NONE) {
        logger_.error("Cannot replace existing dataset " + ref.path());
        return nullptr;
    }

    OGRLayer* layer = workspace->CreateLayer(ref.name.c_str(),
                                             const_cast<OGRSpatialReference*>(srs),
                                             geometry_type, nullptr);
    if (!layer) {
        logger_.error("Failed to create dataset " + ref.path() + ": " + CPLGetLastErrorMsg());
    }
    return layer;
}

bool FeatureStore::delete_dataset(const DatasetRef& ref) {
    GDALDataset* workspace = open_workspace(ref.workspace);
    if (!workspace) {
        return false;
    }
    int index = find_layer_index(workspace, ref.name);
    if (index < 0) {
        return false;
    }
    if (workspace->DeleteLayer(index) != OGRERR_NONE) {
        logger_.warning("Failed to delete dataset " + ref.path() + ": " + CPLGetLastErrorMsg());
        return false;
    }
    logger_.trace("Deleted dataset " + ref.path());
    return true;
}

bool FeatureStore::layer_exists(const DatasetRef& ref) {
    return open_layer(ref) != nullptr;
}

// ============================================================================
// Schema
// ============================================================================

FieldList FeatureStore::list_fields(const DatasetRef& ref) {
    FieldList fields;
    OGRLayer* layer = open_layer(ref);
    if (!layer) {
        return fields;
    }

    const char* fid_column = layer->GetFIDColumn();
    fields.emplace_back((fid_column && *fid_column) ? fid_column : DEFAULT_FID_NAME,
                        FieldType::INTEGER, 0, true);

    if (layer->GetGeomType() != wkbNone) {
        const char* geometry_column = layer->GetGeometryColumn();
        fields.emplace_back((geometry_column && *geometry_column) ? geometry_column : DEFAULT_GEOMETRY_NAME,
                            FieldType::GEOMETRY, 0, true);
    }

    OGRFeatureDefn* definition = layer->GetLayerDefn();
    for (int i = 0; i < definition->GetFieldCount(); ++i) {
        OGRFieldDefn* field_definition = definition->GetFieldDefn(i);
        FieldInfo info(field_definition->GetNameRef(),
                       field_type_from_ogr(field_definition->GetType()),
                       field_definition->GetWidth(), false);
        const char* alias = field_definition->GetAlternativeNameRef();
        if (alias) {
            info.alias = alias;
        }
        fields.push_back(info);
    }
    return fields;
}

bool FeatureStore::add_field(const DatasetRef& ref, const FieldInfo& field) {
    OGRLayer* layer = open_layer(ref);
    if (!layer) {
        logger_.error("Cannot add field " + field.name + ": " + ref.path() + " does not exist");
        return false;
    }

    OGRFieldDefn definition(field.name.c_str(), field_type_to_ogr(field.type));
    if (field.length > 0) {
        definition.SetWidth(field.length);
        if (field.type == FieldType::DOUBLE) {
            definition.SetPrecision(DOUBLE_FIELD_PRECISION);
        }
    }
    if (!field.alias.empty()) {
        definition.SetAlternativeName(field.alias.c_str());
    }

    if (layer->CreateField(&definition) != OGRERR_NONE) {
        logger_.error("Failed to add field " + field.name + " to " + ref.path() + ": " + CPLGetLastErrorMsg());
        return false;
    }
    return true;
}

bool FeatureStore::delete_field(const DatasetRef& ref, const std::string& name) {
    for (const auto& field : list_fields(ref)) {
        if (field.required && iequals(field.name, name)) {
            logger_.error("Cannot delete required field " + field.name + " from " + ref.path());
            return false;
        }
    }

    OGRLayer* layer = open_layer(ref);
    if (!layer) {
        logger_.error("Cannot delete field " + name + ": " + ref.path() + " does not exist");
        return false;
    }

    int index = layer->GetLayerDefn()->GetFieldIndex(name.c_str());
    if (index < 0) {
        logger_.error("Field " + name + " not found in " + ref.path());
        return false;
    }
    if (layer->DeleteField(index) != OGRERR_NONE) {
        logger_.error("Failed to delete field " + name + " from " + ref.path() + ": " + CPLGetLastErrorMsg());
        return false;
    }
    return true;
}

std::optional<GeometryKind> FeatureStore::sample_geometry_kind(const DatasetRef& ref) {
    OGRLayer* layer = open_layer(ref);
    if (!layer) {
        return std::nullopt;
    }

    OGRwkbGeometryType declared = layer->GetGeomType();
    if (declared == wkbNone) {
        return GeometryKind::OTHER;
    }
    if (wkbFlatten(declared) != wkbUnknown && wkbFlatten(declared) != wkbGeometryCollection) {
        return geometry_kind_from_ogr(declared);
    }

    layer->ResetReading();
    OGRFeatureUniquePtr feature(layer->GetNextFeature());
    layer->ResetReading();
    if (!feature || !feature->GetGeometryRef()) {
        return GeometryKind::OTHER;
    }
    return geometry_kind_from_ogr(feature->GetGeometryRef()->getGeometryType());
}

long FeatureStore::feature_count(const std::string& name_or_path) {
    if (const Selection* selected = selection(name_or_path)) {
        return static_cast<long>(selected->size());
    }
    OGRLayer* layer = open_layer(name_or_path);
    if (!layer) {
        return -1;
    }
    return static_cast<long>(layer->GetFeatureCount(TRUE));
}

bool FeatureStore::visit_features(const std::string& name_or_path,
                                  const std::function<void(OGRFeature&)>& visitor) {
    OGRLayer* layer = open_layer(name_or_path);
    if (!layer) {
        return false;
    }

    if (const Selection* selected = selection(name_or_path)) {
        for (GIntBig fid : *selected) {
            OGRFeatureUniquePtr feature(layer->GetFeature(fid));
            if (feature) {
                visitor(*feature);
            }
        }
        return true;
    }

    layer->ResetReading();
    while (OGRFeatureUniquePtr feature{layer->GetNextFeature()}) {
        visitor(*feature);
    }
    layer->ResetReading();
    return true;
}

// ============================================================================
// Session registry
// ============================================================================

void FeatureStore::register_dataset(const std::string& session_name, const DatasetRef& ref) {
    session_.push_back(SessionEntry{session_name, ref, std::nullopt});
    logger_.trace("Registered " + session_name + " -> " + ref.path());
}

bool FeatureStore::is_loaded(const std::string& session_name) const {
    return find_entry(session_name) != nullptr;
}

size_t FeatureStore::loaded_count(const std::string& session_name) const {
    size_t count = 0;
    for (const auto& entry : session_) {
        if (entry.name == session_name) ++count;
    }
    return count;
}

bool FeatureStore::remove_first(const std::string& session_name) {
    for (auto it = session_.begin(); it != session_.end(); ++it) {
        if (it->name == session_name) {
            session_.erase(it);
            return true;
        }
    }
    return false;
}

DatasetRef FeatureStore::resolve(const std::string& name_or_path) const {
    if (const SessionEntry* entry = find_entry(name_or_path)) {
        return entry->ref;
    }
    return DatasetRef::parse(name_or_path);
}

bool FeatureStore::set_selection(const std::string& session_name, Selection selection) {
    SessionEntry* entry = find_entry(session_name);
    if (!entry) {
        logger_.warning("Cannot select from " + session_name + ": not loaded");
        return false;
    }
    entry->selection = std::move(selection);
    return true;
}

void FeatureStore::clear_selection(const std::string& session_name) {
    if (SessionEntry* entry = find_entry(session_name)) {
        entry->selection.reset();
    }
}

const Selection* FeatureStore::selection(const std::string& session_name) const {
    const SessionEntry* entry = find_entry(session_name);
    if (!entry || !entry->selection) {
        return nullptr;
    }
    return &*entry->selection;
}

FeatureStore::SessionEntry* FeatureStore::find_entry(const std::string& session_name) {
    for (auto& entry : session_) {
        if (entry.name == session_name) return &entry;
    }
    return nullptr;
}

const FeatureStore::SessionEntry* FeatureStore::find_entry(const std::string& session_name) const {
    for (const auto& entry : session_) {
        if (entry.name == session_name) return &entry;
    }
    return nullptr;
}

} // namespace dsearch
