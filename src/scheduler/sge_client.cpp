#include "sge_client.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <regex>
#include <sstream>

// ── Parsing ─────────────────────────────────────────────────

std::optional<std::string> parse_submit_output(const std::string& stdout_data) {
    static const std::regex job_re("Your job ([0-9]+)");
    std::smatch m;
    if (std::regex_search(stdout_data, m, job_re)) {
        return m[1].str();
    }
    return std::nullopt;
}

JobStatus map_state_code(const std::string& code) {
    if (code == "r" || code == "qw" || code == "t") return JobStatus::Running;
    if (code == "Eqw" || code == "d") return JobStatus::Failed;
    return JobStatus::Running;
}

JobStatus parse_status_output(const std::string& stdout_data, const std::string& job_id) {
    std::istringstream iss(stdout_data);
    std::string line;
    while (std::getline(iss, line)) {
        auto fields = split_whitespace(line);
        if (fields.empty() || fields[0] != job_id) continue;
        // job-ID prior name user state ...
        if (fields.size() < 5) return JobStatus::Running;
        return map_state_code(fields[4]);
    }
    return JobStatus::Unknown;
}

AccountingStatus parse_accounting_output(const std::string& stdout_data) {
    std::istringstream iss(stdout_data);
    std::string line;
    while (std::getline(iss, line)) {
        auto fields = split_whitespace(line);
        if (fields.empty() || fields[0] != "exit_status") continue;
        if (fields.size() < 2) return AccountingStatus::Unknown;
        return fields[1] == "0" ? AccountingStatus::Success : AccountingStatus::Failed;
    }
    return AccountingStatus::Unknown;
}

// ── SgeClient ───────────────────────────────────────────────

SgeClient::SgeClient(SchedulerCommands commands, platform::CommandRunner runner)
    : commands_(std::move(commands)), runner_(std::move(runner)) {
    if (!runner_) runner_ = platform::run_command;
}

Result<void> SgeClient::preflight() const {
    for (const auto* exe : {&commands_.submit, &commands_.status, &commands_.accounting}) {
        if (!platform::find_executable(*exe)) {
            return Result<void>::Err(fmt::format("Cannot find command: {}", *exe));
        }
    }
    return Result<void>::Ok();
}

CommandResult SgeClient::run(const std::string& label, const std::string& program,
                             const std::vector<std::string>& args) const {
    auto r = runner_(program, args);
    sgerun_log_command(label, program, args, r);
    return r;
}

std::vector<std::string> SgeClient::submit_args(const std::filesystem::path& submission_script,
                                                const std::filesystem::path& stdout_file,
                                                const std::filesystem::path& stderr_file,
                                                const ResourceRequest& resources) const {
    std::vector<std::string> args = {"-wd", submission_script.parent_path().string()};
    for (auto& f : sge_resource_flags(resources)) args.push_back(std::move(f));
    args.push_back("-o");
    args.push_back(stdout_file.string());
    args.push_back("-e");
    args.push_back(stderr_file.string());
    args.push_back(submission_script.string());
    return args;
}

std::string SgeClient::submit(const std::filesystem::path& submission_script,
                              const std::filesystem::path& stdout_file,
                              const std::filesystem::path& stderr_file,
                              const ResourceRequest& resources) {
    auto r = run("qsub", commands_.submit,
                 submit_args(submission_script, stdout_file, stderr_file, resources));
    if (r.failed()) {
        std::string err = r.stderr_data;
        trim(err);
        throw SubmissionError(fmt::format("{} exited with {}: {}", commands_.submit,
                                          r.exit_code, err),
                              r.stderr_data);
    }

    auto job_id = parse_submit_output(r.stdout_data);
    if (!job_id) {
        std::string out = r.stdout_data;
        trim(out);
        throw SubmissionError(fmt::format("Could not find a job id in {} output: '{}'",
                                          commands_.submit, out),
                              r.stderr_data);
    }
    return *job_id;
}

JobStatus SgeClient::check_status(const std::string& job_id) {
    auto r = run("qstat", commands_.status, {});
    // A failing qstat is transient; let the poll loop try again
    if (r.failed()) return JobStatus::Unknown;
    return parse_status_output(r.stdout_data, job_id);
}

AccountingStatus SgeClient::check_accounting(const std::string& job_id) {
    auto r = run("qacct", commands_.accounting, {"-j", job_id});
    if (r.failed()) return AccountingStatus::Unknown;
    return parse_accounting_output(r.stdout_data);
}

bool SgeClient::cancel(const std::string& job_id) {
    auto r = run("qdel", commands_.del, {job_id});
    return r.success();
}
