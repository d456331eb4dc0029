#pragma once

#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include <yaml-cpp/yaml.h>
#include <core/config.hpp>
#include <core/resource_spec.hpp>

// Parsed command line. Config-level flags are collected into `overrides`,
// a YAML mapping laid out like config.yaml, so they go through the same
// validation as the config file.
struct CliArgs {
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::filesystem::path> config_path;
    YAML::Node overrides{YAML::NodeType::Map};
    YAML::Node kwargs{YAML::NodeType::Map};
    std::vector<std::string> deps;
    int mem_step_gb = 0;
    long long time_step_secs = 0;
};

class SgerunCLI {
public:
    // Returns the process exit code.
    int run(int argc, char** argv);

    // Throws std::invalid_argument on an unknown flag or missing value.
    static CliArgs parse_args(const std::vector<std::string>& argv);

    static void print_usage();

private:
    int cmd_run(const CliArgs& args, const Config& config);
    int cmd_map(const CliArgs& args, const Config& config);
    int cmd_exec(const CliArgs& args);
    int cmd_tasks();
    int cmd_check(const Config& config);

    static EscalationPolicy escalation_for(const CliArgs& args);
};
