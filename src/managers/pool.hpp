#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <vector>
#include <core/cancel_token.hpp>
#include <core/resource_spec.hpp>
#include <scheduler/scheduler_client.hpp>
#include <task/task_serializer.hpp>
#include "job_outcome.hpp"
#include "worker.hpp"

// Fans tasks out over at most `concurrency_limit` Workers running at once.
// Each task gets its own Worker and workspace; outcomes come back in input
// order. A failed task never stops its siblings.
class Pool {
public:
    // Called after each task finishes with (completed, total).
    using ProgressCallback = std::function<void(std::size_t completed, std::size_t total)>;

    Pool(SchedulerClient& scheduler, TaskSerializer& serializer, WorkerOptions options);

    std::vector<JobOutcome> map(const std::vector<TaskDescriptor>& tasks,
                                const ResourceRequest& resources,
                                int concurrency_limit,
                                int max_attempts,
                                const EscalationPolicy& escalation = nullptr,
                                const ProgressCallback& progress = nullptr);

    // Cancel running Workers and skip queued tasks; both report Cancelled.
    // Safe to call from any thread. A token passed in WorkerOptions::cancel
    // also cancels the Pool, but is never cancelled by it.
    void cancel();

private:
    JobOutcome run_one(const TaskDescriptor& task, const ResourceRequest& resources,
                       int max_attempts, const EscalationPolicy& escalation);

    SchedulerClient& scheduler_;
    TaskSerializer& serializer_;
    WorkerOptions options_;
    std::shared_ptr<CancelToken> cancel_;
};
