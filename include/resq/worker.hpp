#pragma once

#include "resq/config.hpp"
#include "resq/job_store.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace resq {

enum class HandlerOutcome {
    Success,
    Failure,            // retried with backoff until max_failures
    PermanentFailure,   // terminal, no retry
    Requeue             // back to queued without counting a failure
};

struct HandlerResult {
    HandlerOutcome outcome = HandlerOutcome::Success;
    std::string message;
    std::chrono::milliseconds requeue_after{0};

    static HandlerResult success() { return HandlerResult{}; }
    static HandlerResult failure(const std::string& message) {
        return HandlerResult{HandlerOutcome::Failure, message, std::chrono::milliseconds(0)};
    }
    static HandlerResult permanent_failure(const std::string& message) {
        return HandlerResult{HandlerOutcome::PermanentFailure, message, std::chrono::milliseconds(0)};
    }
    static HandlerResult requeue(std::chrono::milliseconds after) {
        return HandlerResult{HandlerOutcome::Requeue, "", after};
    }
};

const char* to_string(HandlerOutcome outcome);

// State shared between a running handler and the heartbeat thread of its job
class JobContext {
public:
    explicit JobContext(const std::atomic<bool>& stop_requested) : stop_requested_(stop_requested) {}

    // Sent with the next heartbeat
    void set_progress(const std::string& progress);
    std::optional<std::string> progress() const;

    void mark_lease_lost() { lease_lost_ = true; }
    bool lease_lost() const { return lease_lost_.load(); }

    // Long-running handlers should poll this and return early
    bool should_stop() const { return lease_lost_.load() || stop_requested_.load(); }

private:
    const std::atomic<bool>& stop_requested_;
    std::atomic<bool> lease_lost_{false};
    mutable std::mutex mutex_;
    std::optional<std::string> progress_;
};

class JobHandler {
public:
    virtual ~JobHandler() = default;
    virtual HandlerResult handle(const Job& job, JobContext& context) = 0;
};

/**
 * Worker - claim loop for one worker host
 *
 * Claims a job, heartbeats it from a side thread while the handler runs, then
 * reports the handler's outcome. When the queue is empty the poll interval
 * grows by backoff_multiplier after backoff_threshold empty claims, up to
 * max_poll_interval_ms, and drops back to poll_interval_ms on the next claim.
 *
 * Reports and heartbeats carry the claimed attempt, so a worker whose lease
 * was reclaimed cannot touch a later attempt of the same job. An
 * InvariantViolation, from the store or thrown by a handler, stops the loop;
 * run() rethrows it and has_fatal_error() reports it for start().
 */
class Worker {
private:
    std::shared_ptr<JobStore> store_;
    std::shared_ptr<JobHandler> handler_;
    WorkerConfig config_;
    std::chrono::milliseconds claim_timeout_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread worker_thread_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::shared_ptr<CancellationToken> active_claim_;
    std::exception_ptr fatal_error_;

    // Poll backoff state, touched only by the claiming thread
    int current_interval_ms_;
    int consecutive_empty_ = 0;

    std::atomic<int64_t> processed_{0};
    std::atomic<int64_t> succeeded_{0};
    std::atomic<int64_t> failed_{0};

    void run_loop();
    void process(const Job& job);
    HandlerResult invoke_handler(const Job& job, JobContext& context);
    void report(const Job& job, const HandlerResult& result);
    void update_backoff(bool had_job);
    void sleep_for(std::chrono::milliseconds duration);

public:
    Worker(std::shared_ptr<JobStore> store,
           std::shared_ptr<JobHandler> handler,
           const WorkerConfig& config,
           std::chrono::milliseconds claim_timeout = std::chrono::milliseconds(0));
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Runs the claim loop on the calling thread until stop(). Rethrows the
    // InvariantViolation that ended it, if any.
    void run();

    bool has_fatal_error() const;
    void rethrow_fatal_error() const;

    // Claims and processes at most one job. Returns false when nothing was
    // claimable. StoreError from the claim or the report propagates, as does
    // InvariantViolation.
    bool run_once();

    int current_poll_interval_ms() const { return current_interval_ms_; }
    int64_t processed() const { return processed_.load(); }
    int64_t succeeded() const { return succeeded_.load(); }
    int64_t failed() const { return failed_.load(); }
    const std::string& hostname() const { return config_.hostname; }
};

} // namespace resq
