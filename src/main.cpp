/**
 * @file main.cpp
 * @brief Main entry point for data-search
 *
 * Loads a search job, then selects and exports the features of every
 * configured layer found within the site's search radius.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "core/FeatureStore.hpp"
#include "core/Geoprocessor.hpp"
#include "core/Logger.hpp"
#include "core/OutputTracker.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/SearchOrchestrator.hpp"
#include <iostream>
#include <chrono>
#include <filesystem>

using namespace dsearch;

/**
 * @brief Attach the run's log file, creating its folder if needed
 */
bool attach_log_file(const std::string& log_file) {
    if (log_file.empty()) {
        return true;
    }
    const std::filesystem::path parent = std::filesystem::path(log_file).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    return Logger::setGlobalLogFile(log_file);
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    auto start_time = std::chrono::steady_clock::now();

    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_code();  // Help, version, create-config or a usage error
        }

        SearchConfig config = cli.get_config();
        Logger logger("DataSearch");

        const std::vector<std::string> problems = cli.validate();
        if (!problems.empty()) {
            for (const auto& problem : problems) {
                logger.error(problem);
            }
            return 2;
        }

        cli.print_config();

        if (cli.is_dry_run()) {
            if (config.log_level > 0) {
                std::cout << "Dry run mode - search job validated successfully\n";
            }
            return 0;
        }

        FeatureStore store;
        OgrGeoprocessor engine(store);
        OutputTracker tracker;
        SearchOrchestrator orchestrator(config, store, engine, tracker);

        const std::string log_file = orchestrator.resolve_name(config.log_file);
        if (!attach_log_file(log_file)) {
            std::cerr << "Warning: cannot open log file " << log_file << "\n";
        }

        const bool success = orchestrator.run();

        if (config.log_level >= 4) {
            tracker.printDetailedReport();
        }
        tracker.printSummary();

        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        logger.info("Search finished in " + std::to_string(total_duration.count()) + "ms");

        Logger::setGlobalLogFile(std::nullopt);
        return success ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
