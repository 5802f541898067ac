/**
 * @file ConfigurationManager.hpp
 * @brief Search job configuration: site, output options and the layers to search
 *
 * Jobs are JSON documents. A job names one site (reference, name, radius and
 * either its location as WKT or an existing search-area dataset), where the
 * outputs go, and for each searched layer what to export and how to summarise
 * it. The optional combined sites table collects one summary per layer.
 */

#pragma once

#include "../../include/data_search.hpp"
#include <string>
#include <vector>
#include <map>

namespace dsearch {

enum class CombinedSitesMode {
    NONE,
    OVERWRITE,
    APPEND
};

/**
 * @brief How a layer's selection becomes the dataset that gets exported
 *
 * COPY: selected features as they are
 * CLIP: selected features clipped to the search area
 * OVERLAY: the search area clipped to the selected features
 * INTERSECT: intersection of the selected features and the search area,
 *            with attributes from both
 */
enum class OutputType {
    COPY,
    CLIP,
    OVERLAY,
    INTERSECT
};

std::string output_type_name(OutputType type);
OutputType parse_output_type(const std::string& text);

struct SiteConfig {
    std::string reference;
    std::string name;
    std::string radius = "0m";      // literal text, also the value of the radius tag
    std::string location;           // WKT of the site geometry
    std::string search_area;        // existing polygon dataset, used instead of buffering
};

struct CombinedSitesConfig {
    std::string table_name = "%{shortref}_combined_sites";
    std::string format = "csv";
    std::string columns;
    std::string group_columns;
    std::string statistics_columns;
    std::string order_columns;
    CombinedSitesMode mode = CombinedSitesMode::NONE;
};

struct LayerConfig {
    std::string name;
    std::string dataset;

    std::string columns;
    std::string group_columns;
    std::string statistics_columns;
    std::string order_columns;
    std::string criteria;

    bool include_area = false;
    bool include_distance = false;
    bool include_radius = false;
    std::string format = "csv";       // csv, txt or shp
    OutputType output_type = OutputType::COPY;
    bool keep_layer = false;
    bool rename_columns = false;

    std::string gis_output_name = "%{layer}_%{shortref}";
    std::string table_output_name = "%{layer}_%{shortref}";
    std::string macro;

    std::string combined_sites_columns;
    std::string combined_sites_group_columns;
    std::string combined_sites_statistics_columns;
    std::string combined_sites_order_columns;
};

struct SearchConfig {
    SiteConfig site;

    std::string output_folder = "output";
    std::string temp_workspace = "mem:temp";
    std::string log_file;
    AreaUnit area_unit = AreaUnit::HECTARES;
    bool overwrite = true;
    bool notify = false;
    char replacement_char = '_';

    CombinedSitesConfig combined_sites;
    std::vector<LayerConfig> layers;

    // Runtime settings, not read from the job file
    int log_level = 3;
    std::string config_file;
    long poll_interval_ms = 1000;
};

/**
 * @brief Loads and saves search jobs
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;

    /**
     * @brief Load a job from a JSON file
     *
     * Keys that are absent keep their defaults. A syntax error, a value of the
     * wrong JSON type or an unknown enumeration value fails the load.
     *
     * @return true if successful, false otherwise (see last_error())
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Load a job from JSON text
     */
    bool load_from_string(const std::string& text);

    /**
     * @brief Save the current job as JSON
     */
    bool save_to_file(const std::string& filename) const;

    std::string to_json_string() const;

    /**
     * @brief Write a documented sample job
     */
    static bool create_sample_file(const std::string& filename);

    const SearchConfig& config() const { return config_; }
    SearchConfig& config() { return config_; }

    const std::string& last_error() const { return last_error_; }

private:
    SearchConfig config_;
    std::string last_error_;
};

// ============================================================================
// Output names
// ============================================================================

/**
 * @brief Values substituted into output names
 *
 * ref: the site reference with '/' replaced
 * shortref: ref keeping only digits, spaces and the replacement character
 * subref: the part of shortref after its last replacement character
 */
struct SearchStrings {
    std::string ref;
    std::string shortref;
    std::string subref;
    std::string site;
    std::string radius;

    static SearchStrings from_site(const SiteConfig& site, char replacement = '_');
};

/**
 * @brief Replace %{ref}, %{shortref}, %{subref}, %{site}, %{radius} and %{layer}
 */
std::string substitute_search_strings(const std::string& pattern, const SearchStrings& strings,
                                      const std::string& layer_name = "");

/**
 * @brief Replace characters that cannot appear in a file name
 */
std::string strip_illegal_characters(const std::string& name, char replacement = '_');

} // namespace dsearch
