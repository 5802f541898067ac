#pragma once

/**
 * @file FeatureStore.hpp
 * @brief Workspace and session handle over GDAL/OGR datasources
 *
 * The store owns every open workspace (a shapefile directory, a GeoPackage
 * or an in-memory "mem:" datasource) and the session registry of loaded
 * layers and tables, with their current selections. It is threaded
 * explicitly through every pipeline stage.
 */

#include "../../include/data_search.hpp"
#include "Logger.hpp"

#include <gdal_priv.h>
#include <ogrsf_frmts.h>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dsearch {

// RAII wrapper for GDAL dataset
struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

/// Feature ids selected in a session entry
using Selection = std::set<GIntBig>;

class FeatureStore {
public:
    FeatureStore();
    ~FeatureStore();

    FeatureStore(const FeatureStore&) = delete;
    FeatureStore& operator=(const FeatureStore&) = delete;

    // ========================================================================
    // Workspaces and datasets
    // ========================================================================

    /**
     * @brief Open (and cache) a workspace datasource
     *
     * @param workspace Directory, .gpkg path or "mem:<name>"
     * @param create_if_missing Create the workspace when it does not exist
     * @return Datasource, or nullptr if it cannot be opened
     */
    GDALDataset* open_workspace(const std::string& workspace, bool create_if_missing = false);

    /**
     * @brief Close a cached workspace, flushing its layers to disk
     *
     * In-memory workspaces are kept; closing them would discard their data.
     */
    void release_workspace(const std::string& workspace);

    OGRLayer* open_layer(const DatasetRef& ref);
    OGRLayer* open_layer(const std::string& name_or_path) { return open_layer(resolve(name_or_path)); }

    /**
     * @brief Create an empty dataset, replacing one of the same name
     */
    OGRLayer* create_layer(const DatasetRef& ref, OGRwkbGeometryType geometry_type,
                           const OGRSpatialReference* srs = nullptr);

    bool delete_dataset(const DatasetRef& ref);

    /**
     * @brief Name-existence query against the dataset's workspace
     *
     * Returns false when the workspace cannot be opened.
     */
    bool layer_exists(const DatasetRef& ref);

    // ========================================================================
    // Schema
    // ========================================================================

    /**
     * @brief Field list with system fields first
     *
     * Identity field, then the geometry field for spatial datasets, then
     * attribute fields in schema order.
     */
    FieldList list_fields(const DatasetRef& ref);
    FieldList list_fields(const std::string& name_or_path) { return list_fields(resolve(name_or_path)); }

    bool add_field(const DatasetRef& ref, const FieldInfo& field);

    /**
     * @brief Delete an attribute field; required fields are refused
     */
    bool delete_field(const DatasetRef& ref, const std::string& name);

    /**
     * @brief Simplified geometry type of a dataset
     *
     * Uses the declared geometry type, falling back to the first feature's
     * geometry when the declared type is generic. nullopt if the dataset
     * cannot be opened.
     */
    std::optional<GeometryKind> sample_geometry_kind(const DatasetRef& ref);

    /**
     * @brief Number of features, or of selected features when a selection exists
     */
    long feature_count(const std::string& name_or_path);

    /**
     * @brief Visit each feature, or each selected feature
     * @return false if the dataset cannot be opened
     */
    bool visit_features(const std::string& name_or_path,
                        const std::function<void(OGRFeature&)>& visitor);

    // ========================================================================
    // Session registry
    // ========================================================================

    /**
     * @brief Add a session entry; the same name may be registered repeatedly
     */
    void register_dataset(const std::string& session_name, const DatasetRef& ref);

    bool is_loaded(const std::string& session_name) const;
    size_t loaded_count(const std::string& session_name) const;

    /**
     * @brief Remove the first session entry with this name
     * @return false if no entry matched
     */
    bool remove_first(const std::string& session_name);

    /**
     * @brief Session name to dataset, or a parsed path for unregistered names
     */
    DatasetRef resolve(const std::string& name_or_path) const;

    bool set_selection(const std::string& session_name, Selection selection);
    void clear_selection(const std::string& session_name);

    /**
     * @brief Current selection of a session entry, nullptr when none is set
     */
    const Selection* selection(const std::string& session_name) const;

private:
    struct SessionEntry {
        std::string name;
        DatasetRef ref;
        std::optional<Selection> selection;
    };

    std::map<std::string, GDALDatasetPtr> workspaces_;
    std::vector<SessionEntry> session_;
    Logger logger_;

    GDALDataset* create_workspace(const std::string& workspace);
    SessionEntry* find_entry(const std::string& session_name);
    const SessionEntry* find_entry(const std::string& session_name) const;
};

FieldType field_type_from_ogr(OGRFieldType type);
OGRFieldType field_type_to_ogr(FieldType type);
GeometryKind geometry_kind_from_ogr(OGRwkbGeometryType type);

} // namespace dsearch
