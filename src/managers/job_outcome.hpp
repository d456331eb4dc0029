#pragma once

#include <string>
#include <optional>
#include <variant>

enum class FailureKind {
    JobFailed,          // scheduler reported failure on every attempt
    SubmissionError,    // could not prepare or submit the job
    ResultCorrupt,      // success reported but the result artifact is bad
    Cancelled,          // cancelled by the caller
    TimedOut            // client-side poll timeout expired
};

const char* to_string(FailureKind kind);

struct JobSuccess {
    std::string payload;    // YAML text of the task's return value
};

struct JobFailure {
    FailureKind kind = FailureKind::JobFailed;
    std::string reason;
    std::string job_id;     // empty if nothing was submitted
    int attempts = 0;
    std::string stdout_data;
    std::string stderr_data;
};

// Terminal result of one Worker::run(). Exactly one of success/failure.
class JobOutcome {
public:
    static JobOutcome success(std::string payload);
    static JobOutcome failure(JobFailure failure);

    bool ok() const { return std::holds_alternative<JobSuccess>(value_); }

    // Throws std::bad_variant_access when called on the wrong branch.
    const std::string& payload() const { return std::get<JobSuccess>(value_).payload; }
    const JobFailure& failure() const { return std::get<JobFailure>(value_); }

    // Payload on success, otherwise throws the matching SgerunError subclass
    // (JobFailedError, SubmissionError, ResultCorrupt, JobCancelled).
    const std::string& value_or_throw() const;

private:
    explicit JobOutcome(std::variant<JobSuccess, JobFailure> v) : value_(std::move(v)) {}

    std::variant<JobSuccess, JobFailure> value_;
};

// Scheduler-side identity of the job a Worker is driving.
struct JobHandle {
    std::optional<std::string> scheduler_job_id;   // set once per attempt after submit
    int attempt = 1;
    int max_attempts = 1;
};
