#pragma once

#include "resq/config.hpp"
#include "resq/database.hpp"
#include "resq/job_types.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace resq {

/**
 * Lets one thread abort a claim that another thread is running.
 *
 * cancel() sends PQcancel to the connection executing the claim statement.
 * A claim observing cancellation rolls back, so no partial state survives.
 */
class CancellationToken {
public:
    void cancel();
    bool is_cancelled() const { return cancelled_.load(); }

private:
    friend class JobStore;

    // Returns false if already cancelled
    bool attach(DatabaseConnection* conn);
    void detach();

    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    DatabaseConnection* active_ = nullptr;
};

struct ClaimOptions {
    // Upper bound for the claim statement; zero keeps the connection default
    std::chrono::milliseconds timeout{0};
    std::shared_ptr<CancellationToken> cancellation;
};

/**
 * JobStore - the batch spec resolution job table and every transition on it.
 *
 * Each mutation is one SQL statement (claim, report, heartbeat, reclaim), so
 * workers in different processes coordinate only through row locks taken
 * with FOR UPDATE SKIP LOCKED. No in-process lock guards job state.
 *
 * Errors:
 * - missing rows are std::nullopt / false
 * - database failures throw StoreError
 * - rows in impossible states throw InvariantViolation
 */
class JobStore {
public:
    JobStore(std::shared_ptr<DatabasePool> db_pool,
             const JobQueueConfig& config = JobQueueConfig{},
             const std::string& schema_name = "resq");

    // Creates schema, table and indexes. Safe to run from several processes.
    bool initialize_schema();
    bool health_check();

    // --- Record store -------------------------------------------------------

    // Inserts all descriptors atomically; returns the stored rows in id order
    std::vector<Job> create(const std::vector<JobDescriptor>& descriptors);
    int64_t create(const JobDescriptor& descriptor);

    std::optional<Job> get_by_id(int64_t id);
    std::optional<Job> get_by_filter(const GetJobOptions& options);

    // --- Query/filter -------------------------------------------------------

    // Ascending id order
    std::vector<Job> list_by_filter(const ListJobsOptions& options = ListJobsOptions{});
    std::map<JobState, int64_t> count_by_state();

    // --- Claim --------------------------------------------------------------

    // Oldest eligible queued job (created_at, then id) now owned by
    // worker_hostname, or std::nullopt when nothing is claimable
    std::optional<Job> dequeue(const std::string& worker_hostname,
                               const ClaimOptions& options = ClaimOptions{});

    // --- Worker reports -----------------------------------------------------
    // All return false when the job is not processing or belongs to another
    // worker. An empty worker_hostname skips the ownership check. A non-zero
    // attempt (Job::attempt() of the claimed row) additionally rejects the
    // report once that attempt was closed, even if the same worker has since
    // claimed the job again. Text is stored as UTF-8 with invalid bytes replaced.

    bool report_success(int64_t id, const std::string& worker_hostname = "", int attempt = 0);
    bool report_failure(int64_t id, const std::string& message,
                        const std::string& worker_hostname = "", int attempt = 0);
    bool report_permanent_failure(int64_t id, const std::string& message,
                                  const std::string& worker_hostname = "", int attempt = 0);
    bool requeue(int64_t id, std::chrono::milliseconds after,
                 const std::string& worker_hostname = "", int attempt = 0);

    // --- Leases -------------------------------------------------------------

    // Same ownership and attempt rules as the reports
    bool heartbeat(int64_t id, const std::string& worker_hostname,
                   const std::optional<std::string>& progress = std::nullopt,
                   int attempt = 0);

    // Returns the subset of ids still owned by worker_hostname
    std::vector<int64_t> heartbeat_many(const std::vector<int64_t>& ids,
                                        const std::string& worker_hostname);

    // Requeues (or errors, once resets are exhausted) every processing job
    // whose last heartbeat is older than timeout
    ReclaimResult reclaim_stale(std::chrono::milliseconds timeout);

    // Operator reset of a single processing job, same accounting as reclaim
    bool reset(int64_t id);

    const JobQueueConfig& config() const { return config_; }
    const std::string& table_name() const { return table_; }

private:
    std::shared_ptr<DatabasePool> db_pool_;
    JobQueueConfig config_;
    BackoffPolicy backoff_;
    std::string schema_name_;
    std::string table_;

    static const char* const kJobColumns;

    static Job scan_job(const QueryResult& result, int row);
    static std::vector<Job> scan_jobs(const QueryResult& result);

    // SQL expression appending one attempt record to j.execution_logs
    static std::string append_log_entry_sql(const std::string& outcome_expr,
                                            const std::string& detail_expr);

    // SET clause shared by reclaim_stale and reset ($1 = max_resets, $3 = detail)
    std::string reset_update_sql(const std::string& where_clause) const;

    void validate_worker_hostname(const std::string& worker_hostname) const;
};

} // namespace resq
