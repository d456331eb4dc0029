#include "pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>

Pool::Pool(SchedulerClient& scheduler, TaskSerializer& serializer, WorkerOptions options)
    : scheduler_(scheduler), serializer_(serializer), options_(std::move(options)),
      cancel_(options_.cancel ? CancelToken::linked(options_.cancel)
                              : std::make_shared<CancelToken>()) {
    options_.cancel = cancel_;
}

void Pool::cancel() {
    cancel_->cancel();
}

JobOutcome Pool::run_one(const TaskDescriptor& task, const ResourceRequest& resources,
                         int max_attempts, const EscalationPolicy& escalation) {
    if (cancel_->cancelled()) {
        JobFailure f;
        f.kind = FailureKind::Cancelled;
        f.reason = "cancelled before start";
        return JobOutcome::failure(std::move(f));
    }

    try {
        Worker worker(scheduler_, serializer_, options_);
        return worker.run(task, resources, max_attempts, escalation);
    } catch (const std::filesystem::filesystem_error& e) {
        // Workspace could not be created; nothing was submitted
        JobFailure f;
        f.kind = FailureKind::SubmissionError;
        f.reason = fmt::format("could not create workspace: {}", e.what());
        return JobOutcome::failure(std::move(f));
    }
}

std::vector<JobOutcome> Pool::map(const std::vector<TaskDescriptor>& tasks,
                                  const ResourceRequest& resources,
                                  int concurrency_limit,
                                  int max_attempts,
                                  const EscalationPolicy& escalation,
                                  const ProgressCallback& progress) {
    if (concurrency_limit < 1) {
        throw std::invalid_argument(fmt::format("concurrency limit must be >= 1 (got {})",
                                                concurrency_limit));
    }
    if (max_attempts < 1) {
        throw std::invalid_argument(fmt::format("max_attempts must be >= 1 (got {})", max_attempts));
    }

    const std::size_t total = tasks.size();
    // One slot per task; each slot is written by exactly one thread
    std::vector<std::optional<JobOutcome>> slots(total);
    std::atomic<std::size_t> next{0};
    std::size_t completed = 0;
    std::mutex progress_mutex;
    std::exception_ptr first_error;

    auto worker_loop = [&]() {
        while (true) {
            std::size_t i = next.fetch_add(1);
            if (i >= total) return;

            try {
                slots[i] = run_one(tasks[i], resources, max_attempts, escalation);

                std::lock_guard<std::mutex> lock(progress_mutex);
                completed++;
                if (progress) progress(completed, total);
            } catch (...) {
                // Not a job failure (callback or escalation bug): stop handing
                // out tasks and rethrow on the calling thread
                std::lock_guard<std::mutex> lock(progress_mutex);
                if (!first_error) first_error = std::current_exception();
                next.store(total);
                cancel_->cancel();
                return;
            }
        }
    };

    std::size_t n_threads = std::min<std::size_t>(static_cast<std::size_t>(concurrency_limit), total);
    sgerun_log(fmt::format("pool: {} tasks, {} concurrent workers", total, n_threads));

    if (n_threads <= 1) {
        worker_loop();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(n_threads);
        for (std::size_t t = 0; t < n_threads; t++) {
            threads.emplace_back(worker_loop);
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    if (first_error) std::rethrow_exception(first_error);

    std::vector<JobOutcome> out;
    out.reserve(total);
    for (auto& slot : slots) {
        out.push_back(std::move(*slot));
    }
    return out;
}
