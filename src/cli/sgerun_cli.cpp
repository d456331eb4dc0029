#include "sgerun_cli.hpp"
#include "theme.hpp"
#include <core/cancel_token.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <managers/pool.hpp>
#include <managers/worker.hpp>
#include <scheduler/sge_client.hpp>
#include <task/result_codec.hpp>
#include <task/task_executor.hpp>
#include <task/task_registry.hpp>
#include <task/task_serializer.hpp>
#include <fmt/format.h>
#include <atomic>
#include <cctype>
#include <csignal>
#include <ctime>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <pthread.h>

// ── Signal handling ─────────────────────────────────────────

// Blocks SIGINT/SIGTERM for the process (worker threads inherit the mask) and
// turns them into a cancel() on the token from a dedicated thread.
class SignalCanceller {
public:
    explicit SignalCanceller(std::shared_ptr<CancelToken> token) : token_(std::move(token)) {
        sigemptyset(&set_);
        sigaddset(&set_, SIGINT);
        sigaddset(&set_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &set_, &old_);
        thread_ = std::thread([this] { watch(); });
    }

    ~SignalCanceller() {
        done_ = true;
        if (thread_.joinable()) thread_.join();
        pthread_sigmask(SIG_SETMASK, &old_, nullptr);
    }

    SignalCanceller(const SignalCanceller&) = delete;
    SignalCanceller& operator=(const SignalCanceller&) = delete;

private:
    void watch() {
        struct timespec tick = {0, 200 * 1000 * 1000};
        while (!done_) {
            int sig = sigtimedwait(&set_, nullptr, &tick);
            if (sig == SIGINT || sig == SIGTERM) {
                std::cerr << theme::info("Interrupted, cancelling jobs...");
                sgerun_log(fmt::format("signal {} received, cancelling", sig));
                token_->cancel();
            }
        }
    }

    std::shared_ptr<CancelToken> token_;
    sigset_t set_;
    sigset_t old_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

// ── Argument parsing ────────────────────────────────────────

static YAML::Node parse_value(const std::string& text) {
    try {
        return YAML::Load(text);
    } catch (const YAML::Exception&) {
        return YAML::Node(text);
    }
}

CliArgs SgerunCLI::parse_args(const std::vector<std::string>& argv) {
    CliArgs a;
    auto& o = a.overrides;

    for (std::size_t i = 0; i < argv.size(); i++) {
        const std::string& arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argv.size()) {
                throw std::invalid_argument(fmt::format("Missing value for {}", arg));
            }
            return argv[++i];
        };

        if (arg == "--config") a.config_path = value();
        else if (arg == "--tmp-dir") o["tmp_dir"] = value();
        else if (arg == "--keep-tmp") o["keep_tmp"] = true;
        else if (arg == "--verbose" || arg == "-v") o["verbose"] = true;
        else if (arg == "--conda-env") o["conda_env"] = value();
        else if (arg == "--executor") o["executor"] = value();
        else if (arg == "--log-file") o["log_file"] = value();
        else if (arg == "--max-attempts") o["max_attempts"] = value();
        else if (arg == "-n" || arg == "--jobs") o["jobs"] = value();
        else if (arg == "--threads") o["resources"]["threads"] = value();
        else if (arg == "--time") o["resources"]["time"] = value();
        else if (arg == "--mem") o["resources"]["mem"] = value();
        else if (arg == "--gpu") o["resources"]["gpu"] = true;
        else if (arg == "--pe") o["resources"]["parallel_env"] = value();
        else if (arg == "--timeout") o["poll"]["timeout_s"] = value();
        else if (arg == "--mem-step") a.mem_step_gb = std::stoi(value());
        else if (arg == "--time-step") a.time_step_secs = std::stoll(value());
        else if (arg == "--dep") a.deps.push_back(value());
        else if (arg == "--kwarg") {
            std::string kv = value();
            auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw std::invalid_argument(fmt::format("--kwarg expects KEY=VALUE, got '{}'", kv));
            }
            a.kwargs[kv.substr(0, eq)] = parse_value(kv.substr(eq + 1));
        }
        else if (arg.size() > 1 && arg[0] == '-' && !std::isdigit(static_cast<unsigned char>(arg[1]))) {
            throw std::invalid_argument(fmt::format("Unknown option: {}", arg));
        }
        else if (a.command.empty()) a.command = arg;
        else a.positional.push_back(arg);
    }
    return a;
}

EscalationPolicy SgerunCLI::escalation_for(const CliArgs& args) {
    if (args.mem_step_gb <= 0 && args.time_step_secs <= 0) return nullptr;

    EscalationPolicy mem = args.mem_step_gb > 0 ? scale_memory_per_attempt(args.mem_step_gb) : nullptr;
    EscalationPolicy time = args.time_step_secs > 0 ? scale_time_per_attempt(args.time_step_secs) : nullptr;
    return [mem, time](int attempt, const ResourceRequest& base) {
        ResourceRequest r = mem ? mem(attempt, base) : base;
        return time ? time(attempt, r) : r;
    };
}

// ── Usage ───────────────────────────────────────────────────

void SgerunCLI::print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::usage("sgerun run <task> [arg]", "Run one task as a cluster job");
    std::cout << theme::usage("sgerun map <task> <arg>...", "Run a task once per argument");
    std::cout << theme::usage("sgerun tasks", "List registered tasks");
    std::cout << theme::usage("sgerun check", "Verify the scheduler commands exist");
    std::cout << theme::usage("sgerun exec <params> <results>", "Remote side of a job (used by scripts)");
    std::cout << theme::section("Options");
    std::cout << theme::usage("--config <file>", "Extra config file (after ~/.sgerun/config.yaml)");
    std::cout << theme::usage("--threads <n> --time <t> --mem <m>", "Resources (time: secs or HH:MM:SS)");
    std::cout << theme::usage("--gpu --pe <env>", "GPU request, parallel environment");
    std::cout << theme::usage("--mem-step <G> --time-step <s>", "Grow mem/time on every retry");
    std::cout << theme::usage("--kwarg K=V --dep <exe>", "Task keyword argument, remote dependency");
    std::cout << theme::usage("--max-attempts <n> -n <jobs>", "Retry budget, concurrent jobs for map");
    std::cout << theme::usage("--tmp-dir <dir> --keep-tmp", "Workspace parent, keep workspaces");
    std::cout << theme::usage("--conda-env <env> --timeout <s>", "Job environment, client poll timeout");
    std::cout << theme::usage("--verbose --version --help", "");
    std::cout << "\n";
}

// ── Commands ────────────────────────────────────────────────

static ScriptTaskSerializer make_serializer(const Config& config) {
    return ScriptTaskSerializer({config.worker().executor, config.worker().conda_env,
                                 config.worker().conda_path});
}

static void print_job_file(const char* name, const std::string& data) {
    std::cerr << theme::dim(fmt::format("#------ {} ------#", name)) << "\n" << data;
    if (!data.empty() && data.back() != '\n') std::cerr << "\n";
}

static void print_failure(const JobFailure& f) {
    std::cerr << theme::fail(fmt::format("{}: {}", to_string(f.kind), f.reason));
    if (!f.job_id.empty()) std::cerr << theme::step(fmt::format("job id: {}", f.job_id));
    if (f.stdout_data.empty() && f.stderr_data.empty()) return;
    print_job_file("stdout.txt", f.stdout_data);
    print_job_file("stderr.txt", f.stderr_data);
    std::cerr << theme::dim("#------------------------#") << "\n";
}

int SgerunCLI::cmd_check(const Config& config) {
    SgeClient client(config.scheduler());
    auto pre = client.preflight();
    if (pre.is_err()) {
        std::cerr << theme::fail(pre.error);
        return 1;
    }
    std::cout << theme::ok(fmt::format("{}, {}, {} found", config.scheduler().submit,
                                       config.scheduler().status, config.scheduler().accounting));
    std::cout << theme::step(fmt::format("tmp dir: {}", config.worker().tmp_dir));
    std::cout << theme::step(fmt::format("debug log: {}", sgerun_log_path()));
    return 0;
}

int SgerunCLI::cmd_run(const CliArgs& args, const Config& config) {
    if (args.positional.empty() || args.positional.size() > 2) {
        std::cerr << theme::fail("Usage: sgerun run <task> [arg]");
        return 2;
    }

    SgeClient client(config.scheduler());
    auto pre = client.preflight();
    if (pre.is_err()) {
        std::cerr << theme::fail(pre.error);
        return 1;
    }

    YAML::Node task_arg = args.positional.size() > 1 ? parse_value(args.positional[1]) : YAML::Node();
    auto task = TaskDescriptor::make(args.positional[0], task_arg, args.kwargs, args.deps);
    auto serializer = make_serializer(config);

    auto cancel = std::make_shared<CancelToken>();
    WorkerOptions options = WorkerOptions::from_config(config);
    options.cancel = cancel;

    SignalCanceller signals(cancel);
    Worker worker(client, serializer, options);
    std::cerr << theme::info(fmt::format("Workspace {}", worker.workspace().root().string()));

    JobOutcome outcome = worker.run(task, config.resources(), config.worker().max_attempts,
                                    escalation_for(args));
    if (!outcome.ok()) {
        print_failure(outcome.failure());
        return 1;
    }

    std::cout << outcome.payload() << "\n";
    return 0;
}

int SgerunCLI::cmd_map(const CliArgs& args, const Config& config) {
    if (args.positional.size() < 2) {
        std::cerr << theme::fail("Usage: sgerun map <task> <arg>...");
        return 2;
    }

    SgeClient client(config.scheduler());
    auto pre = client.preflight();
    if (pre.is_err()) {
        std::cerr << theme::fail(pre.error);
        return 1;
    }

    std::vector<TaskDescriptor> tasks;
    for (std::size_t i = 1; i < args.positional.size(); i++) {
        tasks.push_back(TaskDescriptor::make(args.positional[0], parse_value(args.positional[i]),
                                             args.kwargs, args.deps));
    }

    auto serializer = make_serializer(config);
    auto cancel = std::make_shared<CancelToken>();
    WorkerOptions options = WorkerOptions::from_config(config);
    options.cancel = cancel;

    Pool pool(client, serializer, options);
    Pool::ProgressCallback progress = nullptr;
    // Verbose mode echoes the log instead
    if (!log_verbose()) {
        progress = [](std::size_t done, std::size_t total) {
            std::cerr << "\r" << theme::dim(fmt::format("    {}/{} jobs finished", done, total))
                      << (done == total ? "\n" : "") << std::flush;
        };
    }

    std::vector<JobOutcome> outcomes;
    {
        SignalCanceller signals(cancel);
        outcomes = pool.map(tasks, config.resources(), config.jobs(),
                            config.worker().max_attempts, escalation_for(args), progress);
    }

    // One YAML sequence entry per input, failures as {error: ...}
    YAML::Node results(YAML::NodeType::Sequence);
    int failed = 0;
    for (const auto& o : outcomes) {
        if (o.ok()) {
            results.push_back(decode_payload(o.payload()));
        } else {
            failed++;
            print_failure(o.failure());
            YAML::Node err;
            err["error"] = fmt::format("{}: {}", to_string(o.failure().kind), o.failure().reason);
            results.push_back(err);
        }
    }
    std::cout << YAML::Dump(results) << "\n";

    if (failed > 0) {
        std::cerr << theme::fail(fmt::format("{} of {} tasks failed", failed, outcomes.size()));
        return 1;
    }
    return 0;
}

int SgerunCLI::cmd_exec(const CliArgs& args) {
    if (args.positional.size() != 2) {
        std::cerr << "usage: sgerun exec <params> <results>\n";
        return 2;
    }
    return execute_task_file(args.positional[0], args.positional[1], std::cerr);
}

int SgerunCLI::cmd_tasks() {
    for (const auto& name : list_tasks()) {
        std::cout << name << "\n";
    }
    return 0;
}

// ── Entry ───────────────────────────────────────────────────

int SgerunCLI::run(int argc, char** argv) {
    std::vector<std::string> raw(argv + 1, argv + argc);

    if (raw.empty() || raw[0] == "--help" || raw[0] == "-h" || raw[0] == "help") {
        print_usage();
        return raw.empty() ? 2 : 0;
    }
    if (raw[0] == "--version") {
        std::cout << theme::brown(theme::bold("sgerun")) << theme::dim(" version " SGERUN_VERSION) << "\n";
        return 0;
    }

    CliArgs args;
    try {
        args = parse_args(raw);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(e.what());
        return 2;
    }

    // The remote executor needs neither config nor scheduler
    if (args.command == "exec") return cmd_exec(args);
    if (args.command == "tasks") return cmd_tasks();

    auto loaded = Config::load(args.config_path);
    if (loaded.is_err()) {
        std::cerr << theme::fail(loaded.error);
        return 1;
    }
    Config config = loaded.value;
    try {
        config.overlay(args.overrides);
    } catch (const SgerunError& e) {
        std::cerr << theme::fail(e.what());
        return 2;
    } catch (const YAML::Exception& e) {
        std::cerr << theme::fail(e.what());
        return 2;
    }

    set_log_path(config.log_file());
    set_log_verbose(config.verbose());

    if (args.command == "run") return cmd_run(args, config);
    if (args.command == "map") return cmd_map(args, config);
    if (args.command == "check") return cmd_check(config);

    std::cerr << theme::fail("Unknown command: " + args.command);
    print_usage();
    return 2;
}
