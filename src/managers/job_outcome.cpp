#include "job_outcome.hpp"
#include <core/errors.hpp>
#include <fmt/format.h>

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::JobFailed:       return "job failed";
        case FailureKind::SubmissionError: return "submission error";
        case FailureKind::ResultCorrupt:   return "result corrupt";
        case FailureKind::Cancelled:       return "cancelled";
        case FailureKind::TimedOut:        return "timed out";
    }
    return "unknown";
}

JobOutcome JobOutcome::success(std::string payload) {
    return JobOutcome(JobSuccess{std::move(payload)});
}

JobOutcome JobOutcome::failure(JobFailure failure) {
    return JobOutcome(std::move(failure));
}

const std::string& JobOutcome::value_or_throw() const {
    if (ok()) return payload();

    const auto& f = failure();
    switch (f.kind) {
        case FailureKind::JobFailed:
            throw JobFailedError(f.reason, f.job_id, f.stdout_data, f.stderr_data);
        case FailureKind::SubmissionError:
            throw SubmissionError(f.reason, f.stderr_data);
        case FailureKind::ResultCorrupt:
            throw ResultCorrupt(f.reason);
        case FailureKind::Cancelled:
        case FailureKind::TimedOut:
            throw JobCancelled(f.reason);
    }
    throw SgerunError(fmt::format("{}: {}", to_string(f.kind), f.reason));
}
