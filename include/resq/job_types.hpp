#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace resq {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ============================================================================
// Batch spec resolution job types
// ============================================================================

enum class JobState {
    Queued,
    Processing,
    Completed,
    Failed,     // declared unprocessable by the worker, no retry
    Errored     // retry or reset budget exhausted
};

const char* to_string(JobState state);
std::optional<JobState> parse_job_state(const std::string& name);

inline bool is_terminal(JobState state) {
    return state == JobState::Completed || state == JobState::Failed || state == JobState::Errored;
}

// One closed attempt. Appended once, never edited.
struct ExecutionLogEntry {
    std::string key;                    // "attempt.<n>"
    std::string outcome;                // completed, failed, errored, permanently_failed, requeued, reset
    std::string detail;
    std::string worker_hostname;
    std::optional<TimePoint> started_at;
    TimePoint finished_at;
    int64_t duration_ms = 0;

    nlohmann::json to_json() const;
    static ExecutionLogEntry from_json(const nlohmann::json& j);
};

struct Job {
    int64_t id = 0;

    // Payload, not interpreted by the queue
    int64_t batch_spec_id = 0;
    bool allow_unsupported = false;
    bool allow_ignored = false;

    JobState state = JobState::Queued;
    std::optional<std::string> failure_message;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> finished_at;
    std::optional<TimePoint> process_after;
    int num_resets = 0;
    int num_failures = 0;
    std::vector<ExecutionLogEntry> execution_logs;
    std::string worker_hostname;
    std::optional<std::string> progress;

    TimePoint created_at;
    TimePoint updated_at;

    // 1-based index of the attempt a claim starts. Every closed attempt
    // appends one log entry, so no two claims of a job share an index.
    int attempt() const { return static_cast<int>(execution_logs.size()) + 1; }

    nlohmann::json to_json() const;
};

// What a submitter provides to create()
struct JobDescriptor {
    int64_t batch_spec_id = 0;
    bool allow_unsupported = false;
    bool allow_ignored = false;
    std::optional<JobState> state;      // defaults to queued
    std::optional<TimePoint> created_at;
};

// Lookup of a single job; at least one field must be set
struct GetJobOptions {
    std::optional<int64_t> id;
    std::optional<int64_t> batch_spec_id;
};

struct ListJobsOptions {
    std::optional<JobState> state;
    std::optional<std::string> worker_hostname;
    std::optional<int> limit;
};

struct ReclaimResult {
    int requeued = 0;
    int errored = 0;

    int total() const { return requeued + errored; }
};

// Epoch milliseconds <-> time_point, the representation used in SQL and JSON
int64_t to_epoch_ms(TimePoint tp);
TimePoint from_epoch_ms(int64_t ms);

// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T10:00:00.123Z
std::string format_timestamp(TimePoint tp);

} // namespace resq
