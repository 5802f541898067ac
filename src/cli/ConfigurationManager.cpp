/**
 * @file ConfigurationManager.cpp
 * @brief JSON search job loading and saving
 */

#include "ConfigurationManager.hpp"
#include "UnitParser.hpp"
#include "../core/ColumnSpec.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace dsearch {

std::string output_type_name(OutputType type) {
    switch (type) {
        case OutputType::COPY:      return "COPY";
        case OutputType::CLIP:      return "CLIP";
        case OutputType::OVERLAY:   return "OVERLAY";
        case OutputType::INTERSECT: return "INTERSECT";
    }
    return "COPY";
}

OutputType parse_output_type(const std::string& text) {
    const std::string upper = [&] {
        std::string result = trim(text);
        for (auto& c : result) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return result;
    }();

    if (upper.empty() || upper == "COPY") return OutputType::COPY;
    if (upper == "CLIP") return OutputType::CLIP;
    if (upper == "OVERLAY") return OutputType::OVERLAY;
    if (upper == "INTERSECT") return OutputType::INTERSECT;
    throw std::invalid_argument("Invalid output type: '" + text + "'. Use: COPY, CLIP, OVERLAY or INTERSECT");
}

namespace {

CombinedSitesMode parse_combined_mode(const std::string& text) {
    const std::string lower = to_lower(trim(text));
    if (lower.empty() || lower == "none") return CombinedSitesMode::NONE;
    if (lower == "overwrite") return CombinedSitesMode::OVERWRITE;
    if (lower == "append") return CombinedSitesMode::APPEND;
    throw std::invalid_argument("Invalid combined sites mode: '" + text + "'. Use: none, overwrite or append");
}

std::string combined_mode_name(CombinedSitesMode mode) {
    switch (mode) {
        case CombinedSitesMode::NONE:      return "none";
        case CombinedSitesMode::OVERWRITE: return "overwrite";
        case CombinedSitesMode::APPEND:    return "append";
    }
    return "none";
}

std::string validated_format(const std::string& text) {
    const std::string lower = to_lower(trim(text));
    if (lower != "csv" && lower != "txt" && lower != "shp") {
        throw std::invalid_argument("Invalid format: '" + text + "'. Use: csv, txt or shp");
    }
    return lower;
}

// Absent or null keys keep the current value; a wrong JSON type throws json::type_error
void read(const json& j, const char* key, std::string& target) {
    if (j.contains(key) && !j[key].is_null()) target = j[key].get<std::string>();
}

void read(const json& j, const char* key, bool& target) {
    if (j.contains(key) && !j[key].is_null()) target = j[key].get<bool>();
}

LayerConfig parse_layer(const json& j) {
    LayerConfig layer;
    read(j, "name", layer.name);
    read(j, "dataset", layer.dataset);
    if (layer.name.empty()) {
        throw std::invalid_argument("Layer entry without a name");
    }

    read(j, "columns", layer.columns);
    read(j, "group_columns", layer.group_columns);
    read(j, "statistics_columns", layer.statistics_columns);
    read(j, "order_columns", layer.order_columns);
    read(j, "criteria", layer.criteria);

    read(j, "include_area", layer.include_area);
    read(j, "include_distance", layer.include_distance);
    read(j, "include_radius", layer.include_radius);
    read(j, "keep_layer", layer.keep_layer);
    read(j, "rename_columns", layer.rename_columns);

    std::string format = layer.format;
    read(j, "format", format);
    layer.format = validated_format(format);

    std::string output_type;
    read(j, "output_type", output_type);
    layer.output_type = parse_output_type(output_type);

    read(j, "gis_output_name", layer.gis_output_name);
    read(j, "table_output_name", layer.table_output_name);
    read(j, "macro", layer.macro);

    read(j, "combined_sites_columns", layer.combined_sites_columns);
    read(j, "combined_sites_group_columns", layer.combined_sites_group_columns);
    read(j, "combined_sites_statistics_columns", layer.combined_sites_statistics_columns);
    read(j, "combined_sites_order_columns", layer.combined_sites_order_columns);
    return layer;
}

json layer_to_json(const LayerConfig& layer) {
    return json{
        {"name", layer.name},
        {"dataset", layer.dataset},
        {"columns", layer.columns},
        {"group_columns", layer.group_columns},
        {"statistics_columns", layer.statistics_columns},
        {"order_columns", layer.order_columns},
        {"criteria", layer.criteria},
        {"include_area", layer.include_area},
        {"include_distance", layer.include_distance},
        {"include_radius", layer.include_radius},
        {"format", layer.format},
        {"output_type", output_type_name(layer.output_type)},
        {"keep_layer", layer.keep_layer},
        {"rename_columns", layer.rename_columns},
        {"gis_output_name", layer.gis_output_name},
        {"table_output_name", layer.table_output_name},
        {"macro", layer.macro},
        {"combined_sites_columns", layer.combined_sites_columns},
        {"combined_sites_group_columns", layer.combined_sites_group_columns},
        {"combined_sites_statistics_columns", layer.combined_sites_statistics_columns},
        {"combined_sites_order_columns", layer.combined_sites_order_columns}
    };
}

json config_to_json(const SearchConfig& config) {
    json layers = json::array();
    for (const auto& layer : config.layers) {
        layers.push_back(layer_to_json(layer));
    }

    return json{
        {"site", {
            {"reference", config.site.reference},
            {"name", config.site.name},
            {"radius", config.site.radius},
            {"location", config.site.location},
            {"search_area", config.site.search_area}
        }},
        {"output_folder", config.output_folder},
        {"temp_workspace", config.temp_workspace},
        {"log_file", config.log_file},
        {"area_unit", UnitParser::area_unit_to_string(config.area_unit)},
        {"overwrite", config.overwrite},
        {"notify", config.notify},
        {"combined_sites", {
            {"table_name", config.combined_sites.table_name},
            {"format", config.combined_sites.format},
            {"columns", config.combined_sites.columns},
            {"group_columns", config.combined_sites.group_columns},
            {"statistics_columns", config.combined_sites.statistics_columns},
            {"order_columns", config.combined_sites.order_columns},
            {"mode", combined_mode_name(config.combined_sites.mode)}
        }},
        {"layers", layers}
    };
}

} // anonymous namespace

bool ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        last_error_ = "Could not open config file: " + filename;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!load_from_string(buffer.str())) {
        return false;
    }
    config_.config_file = filename;
    return true;
}

bool ConfigurationManager::load_from_string(const std::string& text) {
    last_error_.clear();
    SearchConfig loaded = config_;

    try {
        const json config = json::parse(text);

        if (config.contains("site")) {
            const json& site = config["site"];
            read(site, "reference", loaded.site.reference);
            read(site, "name", loaded.site.name);
            read(site, "radius", loaded.site.radius);
            read(site, "location", loaded.site.location);
            read(site, "search_area", loaded.site.search_area);
        }

        read(config, "output_folder", loaded.output_folder);
        read(config, "temp_workspace", loaded.temp_workspace);
        read(config, "log_file", loaded.log_file);
        read(config, "overwrite", loaded.overwrite);
        read(config, "notify", loaded.notify);

        if (config.contains("area_unit")) {
            loaded.area_unit = UnitParser::parse_area_unit(config["area_unit"].get<std::string>());
        }

        if (config.contains("combined_sites")) {
            const json& combined = config["combined_sites"];
            read(combined, "table_name", loaded.combined_sites.table_name);
            read(combined, "columns", loaded.combined_sites.columns);
            read(combined, "group_columns", loaded.combined_sites.group_columns);
            read(combined, "statistics_columns", loaded.combined_sites.statistics_columns);
            read(combined, "order_columns", loaded.combined_sites.order_columns);

            std::string format = loaded.combined_sites.format;
            read(combined, "format", format);
            loaded.combined_sites.format = validated_format(format);
            if (loaded.combined_sites.format == "shp") {
                throw std::invalid_argument("The combined sites table must be csv or txt");
            }

            std::string mode;
            read(combined, "mode", mode);
            loaded.combined_sites.mode = parse_combined_mode(mode);
        }

        if (config.contains("layers")) {
            loaded.layers.clear();
            for (const auto& entry : config["layers"]) {
                loaded.layers.push_back(parse_layer(entry));
            }
        }

    } catch (const json::exception& e) {
        last_error_ = std::string("Error parsing JSON config: ") + e.what();
        return false;
    } catch (const std::exception& e) {
        last_error_ = std::string("Error loading config: ") + e.what();
        return false;
    }

    config_ = std::move(loaded);
    return true;
}

std::string ConfigurationManager::to_json_string() const {
    return config_to_json(config_).dump(2);
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    file << to_json_string() << "\n";
    return file.good();
}

bool ConfigurationManager::create_sample_file(const std::string& filename) {
    SearchConfig sample;
    sample.site.reference = "DS/2025/001";
    sample.site.name = "Example Site";
    sample.site.radius = "1km";
    sample.site.location = "POINT (530000 180000)";
    sample.output_folder = "output/%{shortref}";
    sample.log_file = "output/%{shortref}/%{shortref}.log";

    sample.combined_sites.table_name = "%{shortref}_combined_sites";
    sample.combined_sites.columns = "Layer,Count";
    sample.combined_sites.mode = CombinedSitesMode::OVERWRITE;

    LayerConfig sites;
    sites.name = "Designated Sites";
    sites.dataset = "data/designated_sites.shp";
    sites.columns = "\"Designated Sites\",Name,Type,Area,Distance,Radius";
    sites.group_columns = "Name;Type";
    sites.statistics_columns = "Area SUM;Distance MIN";
    sites.order_columns = "Distance,Name";
    sites.include_area = true;
    sites.include_distance = true;
    sites.include_radius = true;
    sites.output_type = OutputType::CLIP;
    sites.keep_layer = true;
    sites.gis_output_name = "designated_%{shortref}";
    sites.table_output_name = "designated_%{shortref}";
    sites.combined_sites_columns = "\"Designated Sites\",Name";
    sites.combined_sites_group_columns = "Name";
    sample.layers.push_back(sites);

    LayerConfig species;
    species.name = "Protected Species";
    species.dataset = "data/species_records.shp";
    species.columns = "Species,Year,Distance";
    species.criteria = "Year >= 2000";
    species.include_distance = true;
    species.format = "txt";
    species.table_output_name = "species_%{subref}";
    sample.layers.push_back(species);

    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    file << config_to_json(sample).dump(2) << "\n";
    return file.good();
}

// ============================================================================
// Output names
// ============================================================================

SearchStrings SearchStrings::from_site(const SiteConfig& site, char replacement) {
    SearchStrings strings;

    strings.ref = site.reference;
    for (auto& c : strings.ref) {
        if (c == '/') c = replacement;
    }

    for (char c : strings.ref) {
        if (std::isdigit(static_cast<unsigned char>(c)) || c == ' ' || c == replacement) {
            strings.shortref += c;
        }
    }
    const size_t first = strings.shortref.find_first_not_of(std::string(" ") + replacement);
    const size_t last = strings.shortref.find_last_not_of(std::string(" ") + replacement);
    strings.shortref = (first == std::string::npos) ? "" : strings.shortref.substr(first, last - first + 1);

    const size_t split = strings.shortref.find_last_of(replacement);
    strings.subref = (split == std::string::npos) ? strings.shortref : strings.shortref.substr(split + 1);

    strings.site = strip_illegal_characters(site.name, replacement);
    strings.radius = site.radius;
    return strings;
}

std::string substitute_search_strings(const std::string& pattern, const SearchStrings& strings,
                                      const std::string& layer_name) {
    const std::map<std::string, std::string> substitutions = {
        {"ref", strings.ref},
        {"shortref", strings.shortref},
        {"subref", strings.subref},
        {"site", strings.site},
        {"radius", strings.radius},
        {"layer", layer_name}
    };

    std::string result;
    size_t pos = 0;
    while (pos < pattern.size()) {
        const size_t open = pattern.find("%{", pos);
        if (open == std::string::npos) {
            result += pattern.substr(pos);
            break;
        }
        const size_t close = pattern.find('}', open + 2);
        if (close == std::string::npos) {
            result += pattern.substr(pos);
            break;
        }

        result += pattern.substr(pos, open - pos);
        const std::string key = pattern.substr(open + 2, close - open - 2);
        auto it = substitutions.find(key);
        if (it != substitutions.end()) {
            result += it->second;
        } else {
            result += pattern.substr(open, close - open + 1);  // unknown: keep as written
        }
        pos = close + 1;
    }
    return result;
}

std::string strip_illegal_characters(const std::string& name, char replacement) {
    static const std::string illegal = "\\/:*?\"<>|";
    std::string result = name;
    for (auto& c : result) {
        if (illegal.find(c) != std::string::npos || std::iscntrl(static_cast<unsigned char>(c))) {
            c = replacement;
        }
    }
    return result;
}

} // namespace dsearch
