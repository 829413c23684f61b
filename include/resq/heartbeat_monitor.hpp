#pragma once

#include "resq/config.hpp"
#include "resq/job_store.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace resq {

/**
 * HeartbeatMonitor - Background sweep that reclaims jobs with expired leases
 *
 * Every reclaim_interval_ms it calls JobStore::reclaim_stale(heartbeat_timeout).
 * Several monitors may run against the same table; the reclaim statement
 * skips rows locked by another sweep, so each stale job is reset once.
 */
class HeartbeatMonitor {
private:
    std::shared_ptr<JobStore> store_;
    MonitorConfig config_;
    std::chrono::milliseconds heartbeat_timeout_;

    std::atomic<bool> running_{false};
    std::thread monitor_thread_;
    std::mutex mutex_;
    std::condition_variable wake_;

    // Totals since start()
    std::atomic<int64_t> cycles_{0};
    std::atomic<int64_t> requeued_total_{0};
    std::atomic<int64_t> errored_total_{0};

    void monitor_loop();

public:
    HeartbeatMonitor(std::shared_ptr<JobStore> store,
                     const MonitorConfig& config,
                     std::chrono::milliseconds heartbeat_timeout);
    ~HeartbeatMonitor();

    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    // One sweep; errors are logged and reported as an empty result
    ReclaimResult run_cycle();

    int64_t cycles() const { return cycles_.load(); }
    int64_t requeued_total() const { return requeued_total_.load(); }
    int64_t errored_total() const { return errored_total_.load(); }
};

} // namespace resq
