#include "task_registry.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <map>
#include <mutex>
#include <stdexcept>

// ── Built-in tasks ──────────────────────────────────────────

static YAML::Node task_echo(const YAML::Node& args, const YAML::Node&) {
    return YAML::Clone(args);
}

// [0, 1, 4, ..., (n-1)^2]
static YAML::Node task_squares(const YAML::Node& args, const YAML::Node&) {
    long long n = args.as<long long>();
    if (n < 0) throw std::invalid_argument("squares: n must be non-negative");
    YAML::Node out(YAML::NodeType::Sequence);
    for (long long i = 0; i < n; i++) out.push_back(i * i);
    return out;
}

// Sleep x seconds, return x * y * z (y defaults to 1, z to 2)
static YAML::Node task_multiply(const YAML::Node& args, const YAML::Node& kwargs) {
    long long x = args.as<long long>();
    long long y = kwargs["y"] ? kwargs["y"].as<long long>() : 1;
    long long z = kwargs["z"] ? kwargs["z"].as<long long>() : 2;
    if (x > 0) platform::sleep_ms(static_cast<int>(x * 1000));
    return YAML::Node(x * y * z);
}

static YAML::Node task_fail(const YAML::Node& args, const YAML::Node&) {
    std::string msg = args.IsScalar() ? args.as<std::string>() : "requested failure";
    throw std::runtime_error(fmt::format("fail: {}", msg));
}

// Run a command line through /bin/sh, return its trimmed stdout
static YAML::Node task_shell(const YAML::Node& args, const YAML::Node&) {
    std::string cmd = args.as<std::string>();
    auto r = platform::run_command("/bin/sh", {"-c", cmd});
    if (r.failed()) {
        std::string err = r.stderr_data;
        trim(err);
        throw std::runtime_error(fmt::format("shell: '{}' exited with {}: {}", cmd, r.exit_code, err));
    }
    std::string out = r.stdout_data;
    trim(out);
    return YAML::Node(out);
}

// ── Registry ────────────────────────────────────────────────

namespace {

struct Registry {
    std::mutex mutex;
    std::map<std::string, TaskFn> tasks = {
        {"echo", task_echo},
        {"squares", task_squares},
        {"multiply", task_multiply},
        {"fail", task_fail},
        {"shell", task_shell},
    };
};

Registry& registry() {
    static Registry r;
    return r;
}

} // namespace

void register_task(const std::string& name, TaskFn fn) {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    r.tasks[name] = std::move(fn);
}

TaskFn find_task(const std::string& name) {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    auto it = r.tasks.find(name);
    if (it == r.tasks.end()) return {};
    return it->second;
}

std::vector<std::string> list_tasks() {
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    std::vector<std::string> names;
    names.reserve(r.tasks.size());
    for (const auto& [name, _] : r.tasks) {
        names.push_back(name);
    }
    return names;
}
