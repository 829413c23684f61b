#include "resq/job_types.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace resq {

const char* to_string(JobState state) {
    switch (state) {
        case JobState::Queued: return "queued";
        case JobState::Processing: return "processing";
        case JobState::Completed: return "completed";
        case JobState::Failed: return "failed";
        case JobState::Errored: return "errored";
    }
    return "unknown";
}

std::optional<JobState> parse_job_state(const std::string& name) {
    if (name == "queued") return JobState::Queued;
    if (name == "processing") return JobState::Processing;
    if (name == "completed") return JobState::Completed;
    if (name == "failed") return JobState::Failed;
    if (name == "errored") return JobState::Errored;
    return std::nullopt;
}

int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

std::string format_timestamp(TimePoint tp) {
    int64_t ms = to_epoch_ms(tp);
    int64_t millis = ms % 1000;
    if (millis < 0) {
        millis += 1000;
    }
    std::time_t seconds = static_cast<std::time_t>((ms - millis) / 1000);

    std::tm tm = {};
    gmtime_r(&seconds, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

nlohmann::json ExecutionLogEntry::to_json() const {
    nlohmann::json j = {
        {"key", key},
        {"outcome", outcome},
        {"detail", detail},
        {"worker_hostname", worker_hostname},
        {"finished_at", format_timestamp(finished_at)},
        {"duration_ms", duration_ms}
    };
    j["started_at"] = started_at ? nlohmann::json(format_timestamp(*started_at)) : nlohmann::json(nullptr);
    return j;
}

// Parses the stored shape written by the job store's append expression,
// which uses *_ms epoch fields rather than formatted timestamps
ExecutionLogEntry ExecutionLogEntry::from_json(const nlohmann::json& j) {
    ExecutionLogEntry entry;
    entry.key = j.value("key", "");
    entry.outcome = j.value("outcome", "");
    if (j.contains("detail") && j["detail"].is_string()) {
        entry.detail = j["detail"].get<std::string>();
    }
    entry.worker_hostname = j.value("worker_hostname", "");
    if (j.contains("started_at_ms") && j["started_at_ms"].is_number()) {
        entry.started_at = from_epoch_ms(j["started_at_ms"].get<int64_t>());
    }
    if (j.contains("finished_at_ms") && j["finished_at_ms"].is_number()) {
        entry.finished_at = from_epoch_ms(j["finished_at_ms"].get<int64_t>());
    }
    if (j.contains("duration_ms") && j["duration_ms"].is_number()) {
        entry.duration_ms = j["duration_ms"].get<int64_t>();
    }
    return entry;
}

nlohmann::json Job::to_json() const {
    auto optional_time = [](const std::optional<TimePoint>& tp) {
        return tp ? nlohmann::json(format_timestamp(*tp)) : nlohmann::json(nullptr);
    };

    nlohmann::json logs = nlohmann::json::array();
    for (const auto& entry : execution_logs) {
        logs.push_back(entry.to_json());
    }

    return {
        {"id", id},
        {"batch_spec_id", batch_spec_id},
        {"allow_unsupported", allow_unsupported},
        {"allow_ignored", allow_ignored},
        {"state", to_string(state)},
        {"failure_message", failure_message ? nlohmann::json(*failure_message) : nlohmann::json(nullptr)},
        {"started_at", optional_time(started_at)},
        {"finished_at", optional_time(finished_at)},
        {"process_after", optional_time(process_after)},
        {"num_resets", num_resets},
        {"num_failures", num_failures},
        {"execution_logs", logs},
        {"worker_hostname", worker_hostname},
        {"progress", progress ? nlohmann::json(*progress) : nlohmann::json(nullptr)},
        {"created_at", format_timestamp(created_at)},
        {"updated_at", format_timestamp(updated_at)}
    };
}

} // namespace resq
