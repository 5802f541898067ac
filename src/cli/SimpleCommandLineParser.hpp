/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for data-search
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <sstream>
#include <iostream>

namespace dsearch {

/**
 * @brief Long/short option parser with flags, defaults and a help screen
 *
 * Defaults fill get() but not was_given(), so values from a job file are only
 * overridden by options the user actually typed.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        std::string default_value;
        
        // Default constructor for std::map
        Option() : required(false), has_value(true) {}
        
        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required = false,
               bool has_value = true, const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), default_value(default_value) {}
    };
    
    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}
    
    // Add command line options
    void add_option(const std::string& long_name, const std::string& short_name,
                   const std::string& description, bool required = false,
                   const std::string& default_value = "") {
        options_[long_name] = Option(long_name, short_name, description, required, true, default_value);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }
    
    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        options_[long_name] = Option(long_name, short_name, description, false, false);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }
    
    /**
     * @brief Parse argv
     *
     * Accepts --name VALUE, --name=VALUE and -x VALUE. A value may itself
     * start with '-' when it is a number ("--offset -5").
     *
     * @return false on --help or on a usage error (already reported on stderr)
     */
    bool parse(int argc, char* argv[]) {
        parsed_values_.clear();
        given_.clear();
        positional_args_.clear();
        help_requested_ = false;

        std::vector<std::string> args(argv + 1, argv + argc);

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                show_help();
                return false;
            }

            std::string option_name;
            std::string value;
            bool inline_value = false;

            if (arg.starts_with("--")) {
                option_name = arg.substr(2);
                const size_t eq_pos = option_name.find('=');
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }
            } else if (arg.starts_with("-") && arg.size() > 1) {
                auto it = short_to_long_.find(arg.substr(1));
                if (it == short_to_long_.end()) {
                    std::cerr << "Unknown option: " << arg << std::endl;
                    return false;
                }
                option_name = it->second;
            } else {
                positional_args_.push_back(arg);
                continue;
            }

            auto option = options_.find(option_name);
            if (option == options_.end()) {
                std::cerr << "Unknown option: --" << option_name << std::endl;
                return false;
            }

            if (!option->second.has_value) {
                parsed_values_[option_name] = "true";
            } else if (inline_value) {
                parsed_values_[option_name] = value;
            } else {
                if (i + 1 >= args.size() || !looks_like_value(args[i + 1])) {
                    std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                    return false;
                }
                parsed_values_[option_name] = args[++i];
            }
            given_.insert(option_name);
        }

        for (const auto& [name, option] : options_) {
            if (option.required && given_.find(name) == given_.end()) {
                std::cerr << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
            if (given_.find(name) == given_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    bool help_requested() const { return help_requested_; }

    /**
     * @brief True only when the option appeared on the command line
     */
    bool was_given(const std::string& option_name) const {
        return given_.find(option_name) != given_.end();
    }

    // Get parsed values
    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }
    
    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }
    
    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }
        
        std::istringstream iss(value.value());
        T result;
        if (iss >> result) {
            return result;
        }
        return std::nullopt;
    }
    
    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }
    
    void show_help() const {
        std::cout << "DATA SEARCH - Selection export and aggregation for site searches\n\n";
        if (!description_.empty()) {
            std::cout << description_ << "\n\n";
        }

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " --config JOB.json [OPTIONS]\n\n";

        std::cout << "QUICK START:\n";
        std::cout << "    # Create a sample search job\n";
        std::cout << "    " << program_name_ << " --create-config job.json\n";
        std::cout << "    \n";
        std::cout << "    # Run it for a site, overriding the reference and radius\n";
        std::cout << "    " << program_name_ << " --config job.json --site-ref DS/2025/014 --radius 2km\n\n";

        std::cout << "MAIN OPTIONS:\n";
        print_help_section("config", "Load the search job from a JSON file");
        print_help_section("site-ref", "Site reference (overrides the job)");
        print_help_section("site-name", "Site name (overrides the job)");
        print_help_section("radius", "Search radius with unit: 500m, 2km, 1mi, 300ft, 200yd");
        print_help_section("area-unit", "Unit of the Area field: ha, m2 or km2 (default: ha)");
        print_help_section("output-dir", "Output folder (overrides the job)");
        print_help_section("layers", "Run only these configured layers (comma separated)");
        print_help_section("create-config", "Write a sample search job to the specified path");
        std::cout << "\n";

        std::cout << "LOGGING OPTIONS:\n";
        print_help_section("silent", "Suppress console output (errors still reach the log file)");
        print_help_section("verbose", "Enable verbose logging (same as --log-level 6)");
        print_help_section("log-level", "Verbosity: 1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE");
        print_help_section("log-file", "Append the run log to this file");
        std::cout << "\n";

        std::cout << "OUTPUT NAME VARIABLES:\n";
        std::cout << "    %{ref}       = Site reference ('/' replaced)\n";
        std::cout << "    %{shortref}  = Numeric part of the reference\n";
        std::cout << "    %{subref}    = Last part of the short reference\n";
        std::cout << "    %{site}      = Site name\n";
        std::cout << "    %{radius}    = Radius as written (e.g. \"2km\")\n";
        std::cout << "    %{layer}     = Layer name\n";
        std::cout << "\n";

        std::cout << "OTHER:\n";
        print_help_section("dry-run", "Load and validate the job without searching");
        print_help_section("version", "Show version information");
        std::cout << "    -h, --help               Show this help\n\n";

        std::cout << "ENVIRONMENT:\n";
        std::cout << "    DSEARCH_LOG_LEVEL        Default log configuration (e.g. \"4,CsvSerializer=6\")\n";
        std::cout << "    DSEARCH_LOG_FILE         Default log file\n";
    }

private:
    void print_help_section(const std::string& option_name, const std::string& description) const {
        auto it = options_.find(option_name);
        if (it != options_.end()) {
            const auto& option = it->second;
            std::cout << "    --" << option.long_name;
            if (option.has_value) {
                std::cout << " VALUE";
            }
            std::cout << "            " << description << "\n";
        }
    }
    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::map<std::string, std::string> parsed_values_;
    std::set<std::string> given_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;

    static bool looks_like_value(const std::string& arg) {
        if (!arg.starts_with("-") || arg.size() == 1) {
            return true;
        }
        const char next = arg[1];
        return (next >= '0' && next <= '9') || next == '.';
    }
};

} // namespace dsearch