#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "constants.hpp"
#include "types.hpp"
#include "resource_spec.hpp"

namespace YAML { class Node; }

namespace fs = std::filesystem;

// Status-poll backoff: sleep initial_delay_ms, then multiply by growth after
// every check, never exceeding max_delay_ms.
struct PollPolicy {
    int initial_delay_ms = POLL_INITIAL_DELAY_MS;
    double growth = POLL_DELAY_GROWTH;
    int max_delay_ms = POLL_MAX_DELAY_MS;
    int unknown_pause_ms = POLL_UNKNOWN_PAUSE_MS;   // extra pause when the status command has no answer
    int timeout_s = POLL_TIMEOUT_SECS;              // per-attempt client-side timeout, 0 = none
};

// Names (or paths) of the scheduler command-line tools.
struct SchedulerCommands {
    std::string submit;
    std::string status;
    std::string accounting;
    std::string del;
};

struct WorkerSettings {
    std::string tmp_dir;        // parent of per-job workspaces
    bool keep_tmp = false;
    int max_attempts = DEFAULT_MAX_ATTEMPTS;
    std::string conda_env;
    std::string conda_path;     // PATH prefix when ~/.bashrc has no conda hook
    std::string executor;       // remote executor binary (default: this binary)
    PollPolicy poll;
};

class Config {
public:
    Config();

    // Load global config from ~/.sgerun/config.yaml (if present), then `path`
    // (if given). Later files override earlier ones key by key.
    static Result<Config> load(const std::optional<fs::path>& path = std::nullopt);

    // Parse a single YAML document on top of the defaults.
    static Result<Config> from_string(const std::string& yaml);

    // Apply the keys present in `node` on top of the current values.
    // Throws ConfigError / InvalidResourceSpec on bad values.
    void overlay(const YAML::Node& node);

    const ResourceRequest& resources() const { return resources_; }
    const SchedulerCommands& scheduler() const { return scheduler_; }
    const WorkerSettings& worker() const { return worker_; }
    int jobs() const { return jobs_; }
    bool verbose() const { return verbose_; }
    const std::string& log_file() const { return log_file_; }

private:
    ResourceRequest resources_;
    SchedulerCommands scheduler_;
    WorkerSettings worker_;
    int jobs_ = 1;
    bool verbose_ = false;
    std::string log_file_;
};

fs::path get_global_config_dir();
fs::path get_global_config_path();
bool global_config_exists();
