#include "config.hpp"
#include "constants.hpp"
#include "errors.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

// ── Scalar helpers ──────────────────────────────────────────

static bool has_scalar(const YAML::Node& node, const char* key) {
    return node[key] && node[key].IsScalar();
}

template <typename T>
static T scalar_as(const YAML::Node& node, const char* key) {
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception&) {
        throw ConfigError(fmt::format("Invalid value for '{}': {}", key,
                                      node[key].as<std::string>("")));
    }
}

// Overlay resource keys (threads, time, mem, gpu, parallel_env) on `base`.
// The request is rebuilt so validation runs on the merged values.
static ResourceRequest overlay_resources(const YAML::Node& node, const ResourceRequest& base) {
    int threads = base.threads();
    std::string time = base.time();
    std::string mem = base.mem();
    bool gpu = base.gpu();
    std::string pe = base.parallel_env();

    if (has_scalar(node, "threads")) threads = scalar_as<int>(node, "threads");
    if (has_scalar(node, "time")) time = node["time"].as<std::string>();
    if (has_scalar(node, "mem")) mem = node["mem"].as<std::string>();
    if (has_scalar(node, "gpu")) {
        // Accept both "true"/"false" and the qsub-style 0/1
        std::string v = node["gpu"].as<std::string>();
        gpu = (v == "1" || v == "true" || v == "yes");
    }
    if (has_scalar(node, "parallel_env")) pe = node["parallel_env"].as<std::string>();

    return ResourceRequest(threads, time, mem, gpu, pe);
}

static void overlay_poll(const YAML::Node& node, PollPolicy& p) {
    if (has_scalar(node, "initial_delay_ms")) p.initial_delay_ms = scalar_as<int>(node, "initial_delay_ms");
    if (has_scalar(node, "growth")) p.growth = scalar_as<double>(node, "growth");
    if (has_scalar(node, "max_delay_ms")) p.max_delay_ms = scalar_as<int>(node, "max_delay_ms");
    if (has_scalar(node, "unknown_pause_ms")) p.unknown_pause_ms = scalar_as<int>(node, "unknown_pause_ms");
    if (has_scalar(node, "timeout_s")) p.timeout_s = scalar_as<int>(node, "timeout_s");

    if (p.initial_delay_ms < 0 || p.max_delay_ms < 0 || p.unknown_pause_ms < 0 || p.timeout_s < 0) {
        throw ConfigError("poll delays and timeout must be non-negative");
    }
    if (p.growth < 1.0) {
        throw ConfigError(fmt::format("poll.growth must be >= 1.0 (got {})", p.growth));
    }
}

static void overlay_scheduler(const YAML::Node& node, SchedulerCommands& s) {
    if (has_scalar(node, "submit")) s.submit = node["submit"].as<std::string>();
    if (has_scalar(node, "status")) s.status = node["status"].as<std::string>();
    if (has_scalar(node, "accounting")) s.accounting = node["accounting"].as<std::string>();
    if (has_scalar(node, "delete")) s.del = node["delete"].as<std::string>();
}

// ── Config ──────────────────────────────────────────────────

Config::Config() {
    scheduler_ = {SGE_SUBMIT_CMD, SGE_STATUS_CMD, SGE_ACCOUNTING_CMD, SGE_DELETE_CMD};

    worker_.tmp_dir = (platform::temp_dir() / "sgerun").string();
    worker_.conda_env = DEFAULT_CONDA_ENV;
    worker_.conda_path = DEFAULT_CONDA_PATH;
    worker_.executor = platform::self_executable().string();
}

void Config::overlay(const YAML::Node& node) {
    if (!node || node.IsNull()) return;
    if (!node.IsMap()) throw ConfigError("config root must be a mapping");

    if (has_scalar(node, "tmp_dir")) worker_.tmp_dir = node["tmp_dir"].as<std::string>();
    if (has_scalar(node, "keep_tmp")) worker_.keep_tmp = scalar_as<bool>(node, "keep_tmp");
    if (has_scalar(node, "max_attempts")) worker_.max_attempts = scalar_as<int>(node, "max_attempts");
    if (has_scalar(node, "conda_env")) worker_.conda_env = node["conda_env"].as<std::string>();
    if (has_scalar(node, "conda_path")) worker_.conda_path = node["conda_path"].as<std::string>();
    if (has_scalar(node, "executor")) worker_.executor = node["executor"].as<std::string>();
    if (has_scalar(node, "verbose")) verbose_ = scalar_as<bool>(node, "verbose");
    if (has_scalar(node, "log_file")) log_file_ = node["log_file"].as<std::string>();
    if (has_scalar(node, "jobs")) jobs_ = scalar_as<int>(node, "jobs");

    if (node["resources"] && node["resources"].IsMap()) {
        resources_ = overlay_resources(node["resources"], resources_);
    }
    if (node["poll"] && node["poll"].IsMap()) {
        overlay_poll(node["poll"], worker_.poll);
    }
    if (node["scheduler"] && node["scheduler"].IsMap()) {
        overlay_scheduler(node["scheduler"], scheduler_);
    }

    if (worker_.max_attempts < 1) {
        throw ConfigError(fmt::format("max_attempts must be >= 1 (got {})", worker_.max_attempts));
    }
    if (jobs_ < 1) {
        throw ConfigError(fmt::format("jobs must be >= 1 (got {})", jobs_));
    }
    if (worker_.tmp_dir.empty()) {
        throw ConfigError("tmp_dir must not be empty");
    }
}

Result<Config> Config::from_string(const std::string& yaml) {
    try {
        Config config;
        config.overlay(YAML::Load(yaml));
        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse config: {}", e.what()));
    } catch (const SgerunError& e) {
        return Result<Config>::Err(e.what());
    }
}

Result<Config> Config::load(const std::optional<fs::path>& path) {
    Config config;
    std::string current;
    try {
        if (global_config_exists()) {
            current = get_global_config_path().string();
            config.overlay(YAML::LoadFile(current));
        }
        if (path) {
            current = path->string();
            if (!fs::exists(*path)) {
                return Result<Config>::Err(fmt::format("Config file not found: {}", current));
            }
            config.overlay(YAML::LoadFile(current));
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse {}: {}", current, e.what()));
    } catch (const SgerunError& e) {
        return Result<Config>::Err(fmt::format("{}: {}", current, e.what()));
    }
    return Result<Config>::Ok(config);
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".sgerun";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}
