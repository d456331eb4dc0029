#pragma once

// In-process SchedulerClient for Worker/Pool tests. A "job" runs the task
// through execute_task_file at submit time, writing the result artifact and
// stdout/stderr into the workspace; what the scheduler then reports about it
// is driven by `plan`.

#include <gtest/gtest.h>
#include <algorithm>
#include <functional>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <scheduler/scheduler_client.hpp>
#include <task/task_executor.hpp>
#include <task/task_serializer.hpp>

enum class FakeJob {
    Run,            // run the task; accounting reports its exit status
    FailInQueue,    // listed in an error state
    FailAccounting, // leaves the listing, accounting says exit_status 1
    NoResult,       // accounting says success but nothing was written
    Hang            // listed as running forever
};

class FakeScheduler : public SchedulerClient {
public:
    // Behaviour of successive submissions; the last entry repeats.
    std::vector<FakeJob> plan{FakeJob::Run};
    // "Running" answers before a job leaves the listing, from the task args.
    std::function<int(const YAML::Node& args)> running_polls;
    // "No record yet" accounting answers before the real one.
    int unknown_accounting = 0;
    bool reject_submit = false;

    std::string submit(const std::filesystem::path& submission_script,
                       const std::filesystem::path& stdout_file,
                       const std::filesystem::path& stderr_file,
                       const ResourceRequest& resources) override {
        const auto dir = submission_script.parent_path();
        TaskDescriptor task = read_params_file(dir / PARAMS_FILE);

        std::lock_guard<std::mutex> lock(mutex_);
        submits_++;
        if (reject_submit) {
            throw SubmissionError("qsub exited with 1: denied by policy", "denied by policy\n");
        }
        requests_.push_back(resources);

        Job job;
        job.behaviour = plan[std::min<std::size_t>(submits_ - 1, plan.size() - 1)];
        job.running_polls = running_polls ? running_polls(task.args()) : 0;
        job.unknown_accounting = unknown_accounting;

        if (job.behaviour == FakeJob::Run) {
            std::ostringstream err;
            int rc = execute_task_file(dir / PARAMS_FILE, dir / RESULTS_FILE, err);
            job.succeeded = rc == 0;
            if (!write_file(stdout_file, "running " + task.name + "\n") ||
                !write_file(stderr_file, err.str())) {
                ADD_FAILURE() << "could not write job logs in " << dir;
            }
        } else {
            job.succeeded = job.behaviour == FakeJob::NoResult;
        }

        std::string id = std::to_string(next_id_++);
        jobs_[id] = job;
        in_flight_++;
        max_in_flight_ = std::max(max_in_flight_, in_flight_);
        return id;
    }

    JobStatus check_status(const std::string& job_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        status_calls_++;
        Job& job = jobs_.at(job_id);
        if (job.behaviour == FakeJob::Hang) return JobStatus::Running;
        if (job.behaviour == FakeJob::FailInQueue) {
            finish(job);
            return JobStatus::Failed;
        }
        if (job.running_polls > 0) {
            job.running_polls--;
            return JobStatus::Running;
        }
        return JobStatus::Unknown;
    }

    AccountingStatus check_accounting(const std::string& job_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        accounting_calls_++;
        Job& job = jobs_.at(job_id);
        if (job.unknown_accounting > 0) {
            job.unknown_accounting--;
            return AccountingStatus::Unknown;
        }
        finish(job);
        return job.succeeded ? AccountingStatus::Success : AccountingStatus::Failed;
    }

    bool cancel(const std::string& job_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.push_back(job_id);
        finish(jobs_.at(job_id));
        return true;
    }

    int submits() const { std::lock_guard<std::mutex> l(mutex_); return submits_; }
    int status_calls() const { std::lock_guard<std::mutex> l(mutex_); return status_calls_; }
    int accounting_calls() const { std::lock_guard<std::mutex> l(mutex_); return accounting_calls_; }
    int max_in_flight() const { std::lock_guard<std::mutex> l(mutex_); return max_in_flight_; }
    std::vector<ResourceRequest> requests() const { std::lock_guard<std::mutex> l(mutex_); return requests_; }
    std::vector<std::string> cancelled() const { std::lock_guard<std::mutex> l(mutex_); return cancelled_; }

private:
    struct Job {
        FakeJob behaviour = FakeJob::Run;
        int running_polls = 0;
        int unknown_accounting = 0;
        bool succeeded = false;
        bool finished = false;
    };

    void finish(Job& job) {
        if (!job.finished) {
            job.finished = true;
            in_flight_--;
        }
    }

    mutable std::mutex mutex_;
    std::map<std::string, Job> jobs_;
    std::vector<ResourceRequest> requests_;
    std::vector<std::string> cancelled_;
    int next_id_ = 1000;
    int submits_ = 0;
    int status_calls_ = 0;
    int accounting_calls_ = 0;
    int in_flight_ = 0;
    int max_in_flight_ = 0;
};
