/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for data-search
 */

#pragma once

#include "ConfigurationManager.hpp"
#include "SimpleCommandLineParser.hpp"
#include "UnitParser.hpp"
#include <string>
#include <vector>

namespace dsearch {

/**
 * @brief Parses arguments, loads the search job and applies overrides
 *
 * Priority for every setting: command line > job file > defaults. Logging
 * follows command line > DSEARCH_LOG_LEVEL / DSEARCH_LOG_FILE > job file.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if a search should run (or be dry-run), false when the
     *         program should exit (help, version, create-config or an error)
     */
    bool parse_arguments(int argc, char* argv[]);

    const SearchConfig& get_config() const { return config_; }

    bool is_dry_run() const { return dry_run_; }

    /**
     * @brief Exit code to use when parse_arguments() returned false
     */
    int exit_code() const { return exit_code_; }

    /**
     * @brief Check that the loaded job can run
     * @return One message per problem; empty when the job is valid
     */
    std::vector<std::string> validate() const;

    /**
     * @brief Print the effective job (DETAILED level and above)
     */
    void print_config() const;

private:
    SearchConfig config_;
    bool dry_run_ = false;
    int exit_code_ = 0;
    UnitParser unit_parser_;

    void parse_all_options(const SimpleCommandLineParser& parser);
    void parse_logging_options(const SimpleCommandLineParser& parser);

    /**
     * @brief Keep only the configured layers named in a comma list
     * @return false if a name matches no configured layer
     */
    bool restrict_layers(const std::string& names);
};

} // namespace dsearch
