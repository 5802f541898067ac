/**
 * @file ScriptHook.cpp
 * @brief Implementation of the post-export script runner
 */

#include "ScriptHook.hpp"

#include <filesystem>

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace dsearch {

ScriptHook::ScriptHook(std::string script_path)
    : script_path_(std::move(script_path)), logger_("ScriptHook") {
}

std::string ScriptHook::spreadsheet_name(const std::string& table_file) {
    return std::filesystem::path(table_file).stem().string() + ".xlsx";
}

std::vector<std::string> ScriptHook::arguments(const std::string& output_folder,
                                               const std::string& table_file) const {
    return {script_path_, output_folder, table_file, spreadsheet_name(table_file)};
}

int ScriptHook::run(const std::string& output_folder, const std::string& table_file) const {
    const std::vector<std::string> args = arguments(output_folder, table_file);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    logger_.detailed("Running " + script_path_);

    pid_t pid = -1;
    const int spawn_rc = ::posix_spawn(&pid, script_path_.c_str(), nullptr, nullptr, argv.data(), environ);
    if (spawn_rc != 0 || pid <= 0) {
        logger_.error("Cannot start " + script_path_ + ": error " + std::to_string(spawn_rc));
        return -1;
    }

    int status = 0;
    if (::waitpid(pid, &status, 0) < 0) {
        logger_.error("Lost track of " + script_path_);
        return -1;
    }
    if (!WIFEXITED(status)) {
        logger_.warning(script_path_ + " did not exit normally");
        return -1;
    }

    const int exit_code = WEXITSTATUS(status);
    if (exit_code != 0) {
        logger_.warning(script_path_ + " exited with status " + std::to_string(exit_code));
    } else {
        logger_.detailed(script_path_ + " finished");
    }
    return exit_code;
}

} // namespace dsearch
