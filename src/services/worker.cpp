#include "resq/worker.hpp"
#include "resq/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace resq {

namespace {

// Heartbeats one claimed attempt until destroyed. A rejected heartbeat means
// the lease was reclaimed, which is surfaced to the handler through the
// context. So is a lease that outlived lease_timeout without one accepted
// heartbeat, since the monitor may already have reclaimed it.
class HeartbeatGuard {
public:
    HeartbeatGuard(JobStore& store, const Job& job, const std::string& hostname,
                   JobContext& context, std::chrono::milliseconds interval,
                   std::chrono::milliseconds lease_timeout)
        : store_(store), job_id_(job.id), attempt_(job.attempt()), hostname_(hostname),
          context_(context), interval_(interval), lease_timeout_(lease_timeout) {
        thread_ = std::thread(&HeartbeatGuard::loop, this);
    }

    ~HeartbeatGuard() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        wake_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    HeartbeatGuard(const HeartbeatGuard&) = delete;
    HeartbeatGuard& operator=(const HeartbeatGuard&) = delete;

private:
    JobStore& store_;
    int64_t job_id_;
    int attempt_;
    std::string hostname_;
    JobContext& context_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds lease_timeout_;

    std::mutex mutex_;
    std::condition_variable wake_;
    bool done_ = false;
    std::thread thread_;

    void loop() {
        auto last_accepted = std::chrono::steady_clock::now();
        std::unique_lock<std::mutex> lock(mutex_);
        while (!done_) {
            if (wake_.wait_for(lock, interval_, [this] { return done_; })) break;

            lock.unlock();
            try {
                if (!store_.heartbeat(job_id_, hostname_, context_.progress(), attempt_)) {
                    context_.mark_lease_lost();
                    lock.lock();
                    break;
                }
                last_accepted = std::chrono::steady_clock::now();
            } catch (const StoreError& e) {
                spdlog::warn("Heartbeat for job {} failed: {}", job_id_, e.what());
                if (std::chrono::steady_clock::now() - last_accepted >= lease_timeout_) {
                    spdlog::error("Job {}: no heartbeat accepted for {}ms, treating the lease as lost",
                                  job_id_, lease_timeout_.count());
                    context_.mark_lease_lost();
                    lock.lock();
                    break;
                }
            }
            lock.lock();
        }
    }
};

} // namespace

const char* to_string(HandlerOutcome outcome) {
    switch (outcome) {
        case HandlerOutcome::Success: return "success";
        case HandlerOutcome::Failure: return "failure";
        case HandlerOutcome::PermanentFailure: return "permanent_failure";
        case HandlerOutcome::Requeue: return "requeue";
    }
    return "unknown";
}

void JobContext::set_progress(const std::string& progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_ = progress;
}

std::optional<std::string> JobContext::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

Worker::Worker(std::shared_ptr<JobStore> store,
               std::shared_ptr<JobHandler> handler,
               const WorkerConfig& config,
               std::chrono::milliseconds claim_timeout)
    : store_(std::move(store)),
      handler_(std::move(handler)),
      config_(config),
      claim_timeout_(claim_timeout),
      current_interval_ms_(config.poll_interval_ms) {
    if (!store_ || !handler_) {
        throw std::invalid_argument("Worker requires a job store and a handler");
    }
    if (config_.hostname.empty()) {
        throw std::invalid_argument("Worker hostname must not be empty");
    }
}

Worker::~Worker() {
    stop();
}

void Worker::start() {
    if (running_) {
        spdlog::warn("Worker {} already running", config_.hostname);
        return;
    }
    // A loop that ended on a fatal error leaves its thread to be joined
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fatal_error_ = nullptr;
    }
    running_ = true;
    stop_requested_ = false;
    worker_thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::run() {
    if (running_) {
        spdlog::warn("Worker {} already running", config_.hostname);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fatal_error_ = nullptr;
    }
    running_ = true;
    stop_requested_ = false;
    run_loop();
    rethrow_fatal_error();
}

void Worker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        stop_requested_ = true;
        if (active_claim_) {
            active_claim_->cancel();
        }
    }
    wake_.notify_all();

    if (worker_thread_.joinable() && worker_thread_.get_id() != std::this_thread::get_id()) {
        worker_thread_.join();
    }
}

void Worker::run_loop() {
    spdlog::info("Worker {} started - poll_interval={}ms, backoff={}x@{}, max={}ms, heartbeat_interval={}ms",
                 config_.hostname, config_.poll_interval_ms, config_.backoff_multiplier,
                 config_.backoff_threshold, config_.max_poll_interval_ms, config_.heartbeat_interval_ms);

    while (running_) {
        bool had_job = false;
        try {
            had_job = run_once();
        } catch (const StoreError& e) {
            if (!running_ && e.is_cancellation()) break;
            if (e.is_contention() || e.is_cancellation()) {
                spdlog::warn("Worker {}: {}", config_.hostname, e.what());
            } else {
                spdlog::error("Worker {}: {}", config_.hostname, e.what());
            }
        } catch (const InvariantViolation& e) {
            spdlog::critical("Worker {} stopping on invariant violation: {}", config_.hostname, e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            fatal_error_ = std::current_exception();
            running_ = false;
            stop_requested_ = true;
            break;
        } catch (const std::exception& e) {
            spdlog::error("Worker {} error: {}", config_.hostname, e.what());
        }

        update_backoff(had_job);
        if (!had_job && running_) {
            sleep_for(std::chrono::milliseconds(current_interval_ms_));
        }
    }

    spdlog::info("Worker {} stopped: processed={}, succeeded={}, failed={}",
                 config_.hostname, processed_.load(), succeeded_.load(), failed_.load());
}

bool Worker::has_fatal_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fatal_error_ != nullptr;
}

void Worker::rethrow_fatal_error() const {
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        error = fatal_error_;
    }
    if (error) std::rethrow_exception(error);
}

bool Worker::run_once() {
    auto token = std::make_shared<CancellationToken>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_claim_ = token;
    }

    ClaimOptions options;
    options.timeout = claim_timeout_;
    options.cancellation = token;

    std::optional<Job> job;
    try {
        job = store_->dequeue(config_.hostname, options);
    } catch (const StoreError&) {
        std::lock_guard<std::mutex> lock(mutex_);
        active_claim_.reset();
        throw;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_claim_.reset();
    }

    if (!job) return false;

    process(*job);
    return true;
}

void Worker::process(const Job& job) {
    spdlog::info("Worker {} processing job {} (batch_spec_id={}, failures={}, resets={})",
                 config_.hostname, job.id, job.batch_spec_id, job.num_failures, job.num_resets);

    JobContext context(stop_requested_);
    HandlerResult result;
    {
        HeartbeatGuard heartbeat(*store_, job, config_.hostname, context,
                                 std::chrono::milliseconds(config_.heartbeat_interval_ms),
                                 std::chrono::milliseconds(store_->config().heartbeat_timeout_ms));
        result = invoke_handler(job, context);
    }

    processed_++;
    if (context.lease_lost()) {
        spdlog::warn("Worker {} lost the lease on job {}; dropping its {} result",
                     config_.hostname, job.id, to_string(result.outcome));
        return;
    }
    report(job, result);
}

HandlerResult Worker::invoke_handler(const Job& job, JobContext& context) {
    try {
        return handler_->handle(job, context);
    } catch (const InvariantViolation&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Handler threw on job {}: {}", job.id, e.what());
        return HandlerResult::failure(std::string("handler error: ") + e.what());
    }
}

void Worker::report(const Job& job, const HandlerResult& result) {
    const int attempt = job.attempt();
    bool accepted = false;
    switch (result.outcome) {
        case HandlerOutcome::Success:
            accepted = store_->report_success(job.id, config_.hostname, attempt);
            if (accepted) succeeded_++;
            break;
        case HandlerOutcome::Failure:
            accepted = store_->report_failure(job.id, result.message, config_.hostname, attempt);
            if (accepted) failed_++;
            break;
        case HandlerOutcome::PermanentFailure:
            accepted = store_->report_permanent_failure(job.id, result.message, config_.hostname, attempt);
            if (accepted) failed_++;
            break;
        case HandlerOutcome::Requeue:
            accepted = store_->requeue(job.id, result.requeue_after, config_.hostname, attempt);
            break;
    }

    if (!accepted) {
        spdlog::warn("Worker {}: {} report for job {} was not accepted",
                     config_.hostname, to_string(result.outcome), job.id);
    }
}

void Worker::update_backoff(bool had_job) {
    if (had_job) {
        if (consecutive_empty_ > 0) {
            spdlog::debug("Worker {}: resetting poll backoff (was: {}ms, {} empty)",
                          config_.hostname, current_interval_ms_, consecutive_empty_);
        }
        consecutive_empty_ = 0;
        current_interval_ms_ = config_.poll_interval_ms;
        return;
    }

    consecutive_empty_++;
    if (consecutive_empty_ >= config_.backoff_threshold) {
        int old_interval = current_interval_ms_;
        current_interval_ms_ = std::min(
            static_cast<int>(current_interval_ms_ * config_.backoff_multiplier),
            config_.max_poll_interval_ms
        );
        if (current_interval_ms_ > old_interval) {
            spdlog::debug("Worker {}: poll backoff {}ms -> {}ms (empty count: {})",
                          config_.hostname, old_interval, current_interval_ms_, consecutive_empty_);
        }
    }
}

void Worker::sleep_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    wake_.wait_for(lock, duration, [this] { return !running_.load(); });
}

} // namespace resq
