/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../core/ColumnSpec.hpp"
#include "../core/Logger.hpp"
#include "version.h"
#include <iostream>
#include <cstdlib>
#include <optional>
#include <set>

namespace dsearch {

namespace {

// Default level of a log configuration such as "4,CsvSerializer=6"
std::optional<int> leading_level(const std::string& log_config) {
    const std::string first = trim(log_config.substr(0, log_config.find(',')));
    if (first.empty() || first.find('=') != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoi(first);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // anonymous namespace

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("data-search",
        "Selects the features of each configured layer that fall within a search\n"
        "radius of a site, then writes them out as CSV/TXT tables or feature datasets,\n"
        "optionally grouped and summarised, with area, distance and radius columns.");

    // Job options
    parser.add_option("config", "c", "Path to JSON search job");
    parser.add_option("site-ref", "r", "Site reference");
    parser.add_option("site-name", "n", "Site name");
    parser.add_option("radius", "", "Search radius with optional unit (500m, 2km, 1mi)");
    parser.add_option("area-unit", "", "Unit of the Area field: ha, m2, km2");
    parser.add_option("output-dir", "o", "Output folder");
    parser.add_option("layers", "l", "Comma separated names of the configured layers to run");

    // Logging and utility options
    parser.add_flag("silent", "s", "Suppress console output");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_option("log-level", "", "Logging level: 1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE\n"
                                       "                Supports facility-specific: \"3,CsvSerializer=6\"");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_option("create-config", "", "Create a sample search job at path");
    parser.add_flag("dry-run", "", "Load and validate the job without searching");
    parser.add_flag("version", "", "Show version information");

    if (!parser.parse(argc, argv)) {
        exit_code_ = parser.help_requested() ? 0 : 2;
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "DataSearch v" << DSEARCH_VERSION_STRING << std::endl;
        std::cout << "Selection export and aggregation for site searches" << std::endl;
        std::cout << "Built with GDAL/OGR and nlohmann/json" << std::endl;
        exit_code_ = 0;
        return false;
    }

    if (auto config_path = parser.get("create-config")) {
        if (!ConfigurationManager::create_sample_file(config_path.value())) {
            std::cerr << "Error: Could not write configuration file: " << config_path.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        std::cout << "Created sample search job: " << config_path.value() << std::endl;
        exit_code_ = 0;
        return false;
    }

    if (auto config_file = parser.get("config")) {
        ConfigurationManager manager;
        if (!manager.load_from_file(config_file.value())) {
            std::cerr << "Error: " << manager.last_error() << std::endl;
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        config_ = manager.config();
    }

    try {
        parse_all_options(parser);
    } catch (const UnitParseError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code_ = 2;
        return false;
    }

    if (auto value = parser.get("layers")) {
        if (!restrict_layers(value.value())) {
            exit_code_ = 2;
            return false;
        }
    }

    dry_run_ = parser.get_flag("dry-run");
    return true;
}

void CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    if (auto value = parser.get("site-ref")) config_.site.reference = value.value();
    if (auto value = parser.get("site-name")) config_.site.name = value.value();
    if (auto value = parser.get("output-dir")) config_.output_folder = value.value();

    if (auto value = parser.get("radius")) {
        // Validate now; the orchestrator keeps the text as the radius tag
        unit_parser_.parse_distance(value.value());
        config_.site.radius = value.value();
    }
    if (auto value = parser.get("area-unit")) {
        config_.area_unit = UnitParser::parse_area_unit(value.value());
    }

    parse_logging_options(parser);
}

void CommandLineInterface::parse_logging_options(const SimpleCommandLineParser& parser) {
    // Logging options with priority: CLI > ENV > defaults
    const char* env_log_level = std::getenv("DSEARCH_LOG_LEVEL");
    if (env_log_level) {
        std::string env_config(env_log_level);
        Logger::parseLogConfig(env_config);
        config_.log_level = leading_level(env_config).value_or(3);
    }

    if (auto value = parser.get("log-level")) {
        Logger::parseLogConfig(value.value());
        if (auto level = leading_level(value.value())) {
            config_.log_level = level.value();
        }
    }

    // Flags override everything
    if (parser.get_flag("silent")) {
        config_.log_level = 0;
        Logger::setDefaultLevel(LogLevel::ERROR);
        Logger::setConsoleEnabled(false);
    }
    if (parser.get_flag("verbose")) {
        config_.log_level = 6;
        Logger::setDefaultLevel(LogLevel::TRACE);
    }

    // Log file: CLI > ENV > job file
    const char* env_log_file = std::getenv("DSEARCH_LOG_FILE");
    if (env_log_file) {
        config_.log_file = std::string(env_log_file);
    }
    if (auto value = parser.get("log-file")) {
        config_.log_file = value.value();
    }
}

bool CommandLineInterface::restrict_layers(const std::string& names) {
    std::vector<LayerConfig> selected;
    std::set<std::string> seen;

    for (const auto& name : split_list(names, ',')) {
        if (!seen.insert(to_lower(name)).second) {
            continue;
        }
        bool found = false;
        for (const auto& layer : config_.layers) {
            if (iequals(layer.name, name)) {
                selected.push_back(layer);
                found = true;
                break;
            }
        }
        if (!found) {
            std::cerr << "Error: No layer named '" << name << "' in the search job" << std::endl;
            return false;
        }
    }

    config_.layers = std::move(selected);
    return true;
}

std::vector<std::string> CommandLineInterface::validate() const {
    std::vector<std::string> problems;

    if (config_.site.reference.empty()) {
        problems.push_back("No site reference (use --site-ref or site.reference)");
    }
    if (config_.site.location.empty() && config_.site.search_area.empty()) {
        problems.push_back("No site location or search area in the job");
    }
    if (config_.site.search_area.empty()) {
        try {
            if (unit_parser_.parse_distance(config_.site.radius).value < 0.0) {
                problems.push_back("Negative search radius: " + config_.site.radius);
            }
        } catch (const UnitParseError& e) {
            problems.push_back(e.what());
        }
    }
    if (config_.output_folder.empty()) {
        problems.push_back("No output folder");
    }
    if (config_.layers.empty()) {
        problems.push_back("No layers to search");
    }
    for (const auto& layer : config_.layers) {
        if (layer.dataset.empty()) {
            problems.push_back("Layer '" + layer.name + "' has no dataset");
        }
    }

    return problems;
}

void CommandLineInterface::print_config() const {
    if (config_.log_level < 4) return;  // Only print at DETAILED level or higher

    std::cout << "\n=== Search Job ===\n";
    if (!config_.config_file.empty()) {
        std::cout << "Job file: " << config_.config_file << "\n";
    }
    std::cout << "Site: " << config_.site.reference << " (" << config_.site.name << ")\n";
    if (!config_.site.search_area.empty()) {
        std::cout << "Search area: " << config_.site.search_area << "\n";
    } else {
        std::cout << "Radius: " << config_.site.radius << "\n";
    }
    std::cout << "Output folder: " << config_.output_folder << "\n";
    std::cout << "Area unit: " << UnitParser::area_unit_to_string(config_.area_unit) << "\n";
    std::cout << "Overwrite: " << (config_.overwrite ? "yes" : "no") << "\n";
    std::cout << "Layers: ";
    for (size_t i = 0; i < config_.layers.size(); ++i) {
        if (i > 0) std::cout << ", ";
        std::cout << config_.layers[i].name;
    }
    std::cout << "\n==================\n\n";
}

} // namespace dsearch
