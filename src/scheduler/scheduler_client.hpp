#pragma once

#include <string>
#include <filesystem>
#include <core/resource_spec.hpp>

// What the live status listing says about a job.
enum class JobStatus {
    Running,    // queued, running or transferring
    Failed,     // error state or marked for deletion
    Unknown     // not listed, or the status command itself failed
};

// What the accounting database says about a finished job.
enum class AccountingStatus {
    Success,    // exit_status 0
    Failed,     // any other exit_status
    Unknown     // no record yet, or the accounting command failed
};

const char* to_string(JobStatus s);
const char* to_string(AccountingStatus s);

// The three (plus one) scheduler operations a Worker needs. Implementations
// must be safe to call from several Worker threads at once.
class SchedulerClient {
public:
    virtual ~SchedulerClient() = default;

    // Submit the script with the given resources. Returns the scheduler job id.
    // Throws SubmissionError if the command fails or its output has no job id.
    virtual std::string submit(const std::filesystem::path& submission_script,
                               const std::filesystem::path& stdout_file,
                               const std::filesystem::path& stderr_file,
                               const ResourceRequest& resources) = 0;

    virtual JobStatus check_status(const std::string& job_id) = 0;
    virtual AccountingStatus check_accounting(const std::string& job_id) = 0;

    // Best-effort removal of a queued/running job. Returns false on failure.
    virtual bool cancel(const std::string& job_id) = 0;
};
