#pragma once

#include <string>
#include <optional>
#include "scheduler_client.hpp"
#include <core/config.hpp>
#include <core/types.hpp>
#include <platform/process.hpp>

// ── Output parsing (pure) ───────────────────────────────────

// Extract <digits> from "Your job <digits> ..." in qsub output.
std::optional<std::string> parse_submit_output(const std::string& stdout_data);

// Map a qstat state code. r/qw/t -> Running, Eqw/d -> Failed, and every other
// code -> Running: an unfamiliar state is never treated as a failure, the
// accounting check decides once the job leaves the listing.
JobStatus map_state_code(const std::string& code);

// Find the line whose first field is job_id and map its 5th field.
// No such line -> Unknown.
JobStatus parse_status_output(const std::string& stdout_data, const std::string& job_id);

// Find the "exit_status <n>" line. "0" -> Success, anything else -> Failed,
// no such line -> Unknown.
AccountingStatus parse_accounting_output(const std::string& stdout_data);

// ── SGE command-line client ─────────────────────────────────

class SgeClient : public SchedulerClient {
public:
    // runner defaults to platform::run_command
    explicit SgeClient(SchedulerCommands commands,
                       platform::CommandRunner runner = nullptr);

    // Check that submit/status/accounting commands exist on PATH.
    Result<void> preflight() const;

    std::string submit(const std::filesystem::path& submission_script,
                       const std::filesystem::path& stdout_file,
                       const std::filesystem::path& stderr_file,
                       const ResourceRequest& resources) override;
    JobStatus check_status(const std::string& job_id) override;
    AccountingStatus check_accounting(const std::string& job_id) override;
    bool cancel(const std::string& job_id) override;

    // Full qsub argument list (without the program name).
    std::vector<std::string> submit_args(const std::filesystem::path& submission_script,
                                         const std::filesystem::path& stdout_file,
                                         const std::filesystem::path& stderr_file,
                                         const ResourceRequest& resources) const;

private:
    CommandResult run(const std::string& label, const std::string& program,
                      const std::vector<std::string>& args) const;

    SchedulerCommands commands_;
    platform::CommandRunner runner_;
};
