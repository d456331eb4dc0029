#include "worker.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <task/result_codec.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>

const char* to_string(WorkerState s) {
    switch (s) {
        case WorkerState::Idle:       return "idle";
        case WorkerState::Serialized: return "serialized";
        case WorkerState::Submitted:  return "submitted";
        case WorkerState::Polling:    return "polling";
        case WorkerState::Succeeded:  return "succeeded";
        case WorkerState::Failed:     return "failed";
        case WorkerState::CleanedUp:  return "cleaned-up";
    }
    return "unknown";
}

WorkerOptions WorkerOptions::from_config(const Config& config) {
    WorkerOptions o;
    o.base_dir = config.worker().tmp_dir;
    o.keep_workspace = config.worker().keep_tmp;
    o.poll = config.worker().poll;
    return o;
}

// ── Construction ────────────────────────────────────────────

Worker::Worker(SchedulerClient& scheduler, TaskSerializer& serializer, WorkerOptions options)
    : scheduler_(scheduler), serializer_(serializer), options_(std::move(options)),
      workspace_(Workspace::create(options_.base_dir)) {}

Worker::~Worker() {
    // Covers a Worker destroyed without run(); no-op after a normal run
    workspace_.cleanup(options_.keep_workspace, options_.cleanup_retry_delay_ms);
}

// ── Helpers ─────────────────────────────────────────────────

bool Worker::cancelled() const {
    return options_.cancel && options_.cancel->cancelled();
}

bool Worker::wait(int ms) const {
    if (options_.sleep) {
        return options_.sleep(ms) || cancelled();
    }
    if (options_.cancel) {
        return options_.cancel->wait_for(std::chrono::milliseconds(ms));
    }
    platform::sleep_ms(ms);
    return false;
}

JobOutcome Worker::fail(FailureKind kind, const std::string& reason,
                        const std::string& extra_stderr) {
    state_ = WorkerState::Failed;

    JobFailure f;
    f.kind = kind;
    f.reason = reason;
    f.job_id = handle_.scheduler_job_id.value_or("");
    f.attempts = handle_.attempt;
    f.stdout_data = read_file(workspace_.stdout_file()).value_or("");
    f.stderr_data = read_file(workspace_.stderr_file()).value_or("");
    if (!extra_stderr.empty()) {
        if (!f.stderr_data.empty() && f.stderr_data.back() != '\n') f.stderr_data += "\n";
        f.stderr_data += extra_stderr;
    }

    sgerun_log(fmt::format("worker {}: {} ({})", workspace_.id(), to_string(kind), reason));
    if (kind == FailureKind::JobFailed) dump_job_logs(f);
    return JobOutcome::failure(std::move(f));
}

void Worker::dump_job_logs(const JobFailure& f) const {
    sgerun_log("#------ stdout.txt ------#");
    sgerun_log(f.stdout_data);
    sgerun_log("#------ stderr.txt ------#");
    sgerun_log(f.stderr_data);
    sgerun_log("#------------------------#");
}

// ── Run ─────────────────────────────────────────────────────

JobOutcome Worker::run(const TaskDescriptor& task, const ResourceRequest& resources,
                       int max_attempts, const EscalationPolicy& escalation) {
    if (state_ != WorkerState::Idle) {
        throw std::logic_error("Worker::run called more than once");
    }
    if (max_attempts < 1) {
        throw std::invalid_argument(fmt::format("max_attempts must be >= 1 (got {})", max_attempts));
    }

    handle_ = JobHandle{std::nullopt, 1, max_attempts};
    JobOutcome outcome = drive(task, resources, escalation);

    workspace_.cleanup(options_.keep_workspace, options_.cleanup_retry_delay_ms);
    state_ = WorkerState::CleanedUp;
    return outcome;
}

JobOutcome Worker::drive(const TaskDescriptor& task, const ResourceRequest& resources,
                         const EscalationPolicy& escalation) {
    // Idle -> Serialized: scripts are written once and reused by every attempt
    try {
        serializer_.write(task, workspace_);
    } catch (const std::exception& e) {
        return fail(FailureKind::SubmissionError,
                    fmt::format("could not prepare job files: {}", e.what()));
    }
    state_ = WorkerState::Serialized;

    while (true) {
        if (cancelled()) {
            return fail(FailureKind::Cancelled, "cancelled before submission");
        }

        std::optional<ResourceRequest> req;
        try {
            req = escalation ? escalation(handle_.attempt, resources) : resources;
        } catch (const InvalidResourceSpec& e) {
            return fail(FailureKind::SubmissionError,
                        fmt::format("invalid resources for attempt {}: {}", handle_.attempt, e.what()));
        }

        // Serialized -> Submitted
        handle_.scheduler_job_id.reset();
        std::error_code ec;
        std::filesystem::remove(workspace_.results_file(), ec);
        try {
            handle_.scheduler_job_id = scheduler_.submit(workspace_.submit_script(),
                                                         workspace_.stdout_file(),
                                                         workspace_.stderr_file(), *req);
        } catch (const SubmissionError& e) {
            return fail(FailureKind::SubmissionError, e.what(), e.stderr_data());
        }
        state_ = WorkerState::Submitted;

        const std::string job_id = *handle_.scheduler_job_id;
        sgerun_log(fmt::format("worker {}: submitted job {} (attempt {}/{}, mem={} time={})",
                               workspace_.id(), job_id, handle_.attempt, handle_.max_attempts,
                               req->mem(), req->time()));

        // Submitted -> Polling -> terminal
        PollResult result = poll(job_id);

        if (result == PollResult::Success) {
            try {
                std::string payload = read_result_file(workspace_.results_file());
                state_ = WorkerState::Succeeded;
                sgerun_log(fmt::format("worker {}: job {} succeeded", workspace_.id(), job_id));
                return JobOutcome::success(std::move(payload));
            } catch (const ResultCorrupt& e) {
                return fail(FailureKind::ResultCorrupt, e.what());
            }
        }

        if (result == PollResult::Cancelled || result == PollResult::TimedOut) {
            bool removed = scheduler_.cancel(job_id);
            sgerun_log(fmt::format("worker {}: removing job {} {}", workspace_.id(), job_id,
                                   removed ? "ok" : "failed"));
            if (result == PollResult::Cancelled) {
                return fail(FailureKind::Cancelled, fmt::format("job {} cancelled", job_id));
            }
            return fail(FailureKind::TimedOut,
                        fmt::format("job {} exceeded the {}s poll timeout", job_id,
                                    options_.poll.timeout_s));
        }

        if (result == PollResult::FailedInQueue) {
            // An error-state job (Eqw) stays queued and could still run later,
            // racing the retry for the same workspace files
            bool removed = scheduler_.cancel(job_id);
            sgerun_log(fmt::format("worker {}: removing errored job {} {}", workspace_.id(), job_id,
                                   removed ? "ok" : "failed"));
        }

        if (handle_.attempt >= handle_.max_attempts) {
            return fail(FailureKind::JobFailed,
                        fmt::format("{} (after {} attempts)", job_id, handle_.attempt));
        }

        sgerun_log(fmt::format("worker {}: job {} failed, resubmitting (attempt {}/{})",
                               workspace_.id(), job_id, handle_.attempt + 1, handle_.max_attempts));
        handle_.attempt++;
        state_ = WorkerState::Serialized;
    }
}

// Backoff loop. Running keeps polling; Failed in the listing is terminal
// for this attempt (FailedInQueue, the job may still be queued).
// Once the job is no longer listed (Unknown) the accounting record decides;
// no record yet means keep polling.
Worker::PollResult Worker::poll(const std::string& job_id) {
    state_ = WorkerState::Polling;

    const auto& policy = options_.poll;
    double delay = policy.initial_delay_ms;
    const auto started = std::chrono::steady_clock::now();

    while (true) {
        if (wait(static_cast<int>(delay))) return PollResult::Cancelled;
        delay = std::min(delay * policy.growth, static_cast<double>(policy.max_delay_ms));

        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - started).count();
        if (policy.timeout_s > 0 && elapsed >= policy.timeout_s) {
            return PollResult::TimedOut;
        }

        JobStatus status = scheduler_.check_status(job_id);
        sgerun_log(fmt::format("worker {}: status {} = {} ({} elapsed)", workspace_.id(), job_id,
                               to_string(status), format_duration(elapsed)));
        if (status == JobStatus::Running) continue;
        if (status == JobStatus::Failed) return PollResult::FailedInQueue;

        if (wait(policy.unknown_pause_ms)) return PollResult::Cancelled;

        AccountingStatus acct = scheduler_.check_accounting(job_id);
        sgerun_log(fmt::format("worker {}: accounting {} = {}", workspace_.id(), job_id,
                               to_string(acct)));
        if (acct == AccountingStatus::Unknown) continue;
        return acct == AccountingStatus::Success ? PollResult::Success : PollResult::Failed;
    }
}
