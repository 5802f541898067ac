#pragma once

/**
 * @file ScriptHook.hpp
 * @brief Post-export script invocation
 *
 * The script is run with three arguments after its own path: the output
 * folder, the primary output file name and a companion spreadsheet name.
 * The caller waits for it to exit; a non-zero exit status is logged only.
 */

#include "Logger.hpp"

#include <string>
#include <vector>

namespace dsearch {

class ScriptHook {
public:
    explicit ScriptHook(std::string script_path);

    /**
     * @brief Argument vector passed to the script, script path first
     */
    std::vector<std::string> arguments(const std::string& output_folder,
                                       const std::string& table_file) const;

    /**
     * @brief Run the script and wait for it
     * @return Exit status, or -1 if it could not be started or did not exit normally
     */
    int run(const std::string& output_folder, const std::string& table_file) const;

    /**
     * @brief "<stem>.xlsx" companion name for a table file
     */
    static std::string spreadsheet_name(const std::string& table_file);

private:
    std::string script_path_;
    Logger logger_;
};

} // namespace dsearch
