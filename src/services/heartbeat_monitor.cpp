#include "resq/heartbeat_monitor.hpp"
#include "resq/errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace resq {

HeartbeatMonitor::HeartbeatMonitor(std::shared_ptr<JobStore> store,
                                   const MonitorConfig& config,
                                   std::chrono::milliseconds heartbeat_timeout)
    : store_(std::move(store)), config_(config), heartbeat_timeout_(heartbeat_timeout) {
    if (!store_) {
        throw std::invalid_argument("HeartbeatMonitor requires a job store");
    }
    if (config_.reclaim_interval_ms <= 0) {
        throw std::invalid_argument("reclaim interval must be > 0");
    }
}

HeartbeatMonitor::~HeartbeatMonitor() {
    stop();
}

void HeartbeatMonitor::start() {
    if (running_) {
        spdlog::warn("HeartbeatMonitor already running");
        return;
    }

    running_ = true;
    monitor_thread_ = std::thread(&HeartbeatMonitor::monitor_loop, this);

    spdlog::info("HeartbeatMonitor started: interval={}ms, heartbeat_timeout={}ms, max_resets={}",
                 config_.reclaim_interval_ms, heartbeat_timeout_.count(), store_->config().max_resets);
}

void HeartbeatMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    wake_.notify_all();

    if (monitor_thread_.joinable()) monitor_thread_.join();
    spdlog::info("HeartbeatMonitor stopped after {} cycles (requeued={}, errored={})",
                 cycles_.load(), requeued_total_.load(), errored_total_.load());
}

ReclaimResult HeartbeatMonitor::run_cycle() {
    ReclaimResult result;
    try {
        result = store_->reclaim_stale(heartbeat_timeout_);
    } catch (const StoreError& e) {
        spdlog::error("HeartbeatMonitor cycle error: {}", e.what());
        return ReclaimResult{};
    }

    cycles_++;
    requeued_total_ += result.requeued;
    errored_total_ += result.errored;

    // Only log if something was reclaimed
    if (result.total() > 0) {
        spdlog::info("HeartbeatMonitor: reclaimed {} stale jobs (requeued={}, errored={})",
                     result.total(), result.requeued, result.errored);
    }
    return result;
}

void HeartbeatMonitor::monitor_loop() {
    spdlog::debug("HeartbeatMonitor: thread started");

    while (running_) {
        auto cycle_start = std::chrono::steady_clock::now();
        run_cycle();
        auto cycle_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - cycle_start);

        auto sleep_time = std::chrono::milliseconds(config_.reclaim_interval_ms) - cycle_duration;
        if (sleep_time.count() < 0) sleep_time = std::chrono::milliseconds(0);

        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_for(lock, sleep_time, [this] { return !running_.load(); });
    }

    spdlog::debug("HeartbeatMonitor: thread exiting");
}

} // namespace resq
