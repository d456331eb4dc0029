#pragma once

#include <functional>
#include <memory>
#include <string>
#include <filesystem>
#include <core/cancel_token.hpp>
#include <core/config.hpp>
#include <core/resource_spec.hpp>
#include <scheduler/scheduler_client.hpp>
#include <task/task_serializer.hpp>
#include "job_outcome.hpp"
#include "workspace.hpp"

enum class WorkerState {
    Idle,
    Serialized,
    Submitted,
    Polling,
    Succeeded,
    Failed,
    CleanedUp
};

const char* to_string(WorkerState s);

struct WorkerOptions {
    std::filesystem::path base_dir;     // parent directory of the workspace
    bool keep_workspace = false;
    PollPolicy poll;
    int cleanup_retry_delay_ms = CLEANUP_RETRY_DELAY_MS;
    std::shared_ptr<CancelToken> cancel;  // optional
    // Replaces the wait between polls when set; returns true to cancel.
    std::function<bool(int ms)> sleep;

    // Settings taken from a loaded Config
    static WorkerOptions from_config(const Config& config);
};

// Drives one task through serialize -> submit -> poll -> resolve, retrying
// scheduler-reported failures up to max_attempts, then cleans up its workspace.
//
// Retries reuse the same workspace and scripts; only the submission is redone.
// Submission errors and corrupt results are fatal on first occurrence.
// Ambiguous status/accounting answers are absorbed by the poll loop.
class Worker {
public:
    // Creates the workspace immediately. Throws std::filesystem::filesystem_error.
    Worker(SchedulerClient& scheduler, TaskSerializer& serializer, WorkerOptions options);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Run the task to completion. May be called once per Worker; a second call
    // throws std::logic_error. Job-level failures are reported in the outcome,
    // not thrown. `escalation`, if set, chooses the resources for each attempt.
    JobOutcome run(const TaskDescriptor& task, const ResourceRequest& resources,
                   int max_attempts, const EscalationPolicy& escalation = nullptr);

    WorkerState state() const { return state_; }
    const JobHandle& handle() const { return handle_; }
    const Workspace& workspace() const { return workspace_; }

private:
    enum class PollResult { Success, Failed, FailedInQueue, Cancelled, TimedOut };

    JobOutcome drive(const TaskDescriptor& task, const ResourceRequest& resources,
                     const EscalationPolicy& escalation);
    PollResult poll(const std::string& job_id);

    // Sleep; true if cancelled while waiting.
    bool wait(int ms) const;
    bool cancelled() const;

    JobOutcome fail(FailureKind kind, const std::string& reason,
                    const std::string& extra_stderr = "");
    void dump_job_logs(const JobFailure& f) const;

    SchedulerClient& scheduler_;
    TaskSerializer& serializer_;
    WorkerOptions options_;
    Workspace workspace_;
    JobHandle handle_;
    WorkerState state_ = WorkerState::Idle;
};
