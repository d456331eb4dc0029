#include "scheduler_client.hpp"

const char* to_string(JobStatus s) {
    switch (s) {
        case JobStatus::Running: return "running";
        case JobStatus::Failed:  return "failed";
        case JobStatus::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(AccountingStatus s) {
    switch (s) {
        case AccountingStatus::Success: return "success";
        case AccountingStatus::Failed:  return "failed";
        case AccountingStatus::Unknown: return "unknown";
    }
    return "unknown";
}
