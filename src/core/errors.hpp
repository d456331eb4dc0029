#pragma once

#include <stdexcept>
#include <string>

// Base for every error sgerun raises to its callers.
class SgerunError : public std::runtime_error {
public:
    explicit SgerunError(const std::string& msg) : std::runtime_error(msg) {}
};

// Bad time/memory/thread input; raised while building a ResourceRequest.
class InvalidResourceSpec : public SgerunError {
public:
    explicit InvalidResourceSpec(const std::string& msg) : SgerunError(msg) {}
};

// Submit command failed or printed something we could not parse. Not retried.
class SubmissionError : public SgerunError {
public:
    SubmissionError(const std::string& msg, std::string stderr_data = "")
        : SgerunError(msg), stderr_data_(std::move(stderr_data)) {}

    const std::string& stderr_data() const { return stderr_data_; }

private:
    std::string stderr_data_;
};

// Scheduler reported failure on every attempt.
class JobFailedError : public SgerunError {
public:
    JobFailedError(const std::string& msg, std::string job_id,
                   std::string stdout_data, std::string stderr_data)
        : SgerunError(msg), job_id_(std::move(job_id)),
          stdout_data_(std::move(stdout_data)), stderr_data_(std::move(stderr_data)) {}

    const std::string& job_id() const { return job_id_; }
    const std::string& stdout_data() const { return stdout_data_; }
    const std::string& stderr_data() const { return stderr_data_; }

private:
    std::string job_id_;
    std::string stdout_data_;
    std::string stderr_data_;
};

// Result artifact missing or unreadable after the scheduler reported success.
class ResultCorrupt : public SgerunError {
public:
    explicit ResultCorrupt(const std::string& msg) : SgerunError(msg) {}
};

// Job was cancelled (or timed out) on the client side.
class JobCancelled : public SgerunError {
public:
    explicit JobCancelled(const std::string& msg) : SgerunError(msg) {}
};

class ConfigError : public SgerunError {
public:
    explicit ConfigError(const std::string& msg) : SgerunError(msg) {}
};
