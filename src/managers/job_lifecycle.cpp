#include "resq/job_store.hpp"
#include "resq/errors.hpp"
#include "resq/utf8.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace resq {

namespace {

constexpr const char* kCancelledSqlstate = "57014";

std::string to_pg_array(const std::vector<int64_t>& values) {
    std::ostringstream ss;
    ss << '{';
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) ss << ',';
        ss << values[i];
    }
    ss << '}';
    return ss.str();
}

// Row is processing, owned by the worker in $worker_param (unless empty) and
// still in the attempt in $attempt_param (unless 0)
std::string owned_attempt_predicate(int worker_param, int attempt_param) {
    const std::string worker = "$" + std::to_string(worker_param) + "::TEXT";
    const std::string attempt = "$" + std::to_string(attempt_param) + "::INTEGER";
    return "j.state = 'processing' "
           "AND (" + worker + " = '' OR j.worker_hostname = " + worker + ") "
           "AND (" + attempt + " = 0 OR jsonb_array_length(j.execution_logs) + 1 = " + attempt + ")";
}

} // namespace

// ============================================================================
// CancellationToken
// ============================================================================

void CancellationToken::cancel() {
    cancelled_.store(true);
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
        active_->cancel();
    }
}

bool CancellationToken::attach(DatabaseConnection* conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load()) return false;
    active_ = conn;
    return true;
}

void CancellationToken::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = nullptr;
}

// ============================================================================
// Claim
// ============================================================================

void JobStore::validate_worker_hostname(const std::string& worker_hostname) const {
    if (worker_hostname.empty()) {
        throw std::invalid_argument("worker_hostname must not be empty");
    }
}

std::optional<Job> JobStore::dequeue(const std::string& worker_hostname, const ClaimOptions& options) {
    validate_worker_hostname(worker_hostname);

    // The candidate is locked with SKIP LOCKED so racing claimers move on to
    // the next row instead of waiting; the outer predicate re-checks queued
    std::string sql =
        "UPDATE " + table_ + R"( AS j SET
            state = 'processing',
            started_at = NOW(),
            updated_at = NOW(),
            worker_hostname = $1::TEXT,
            process_after = NULL,
            progress = NULL
        WHERE j.id = (
            SELECT id FROM )" + table_ + R"(
            WHERE state = 'queued'
              AND (process_after IS NULL OR process_after <= NOW())
            ORDER BY created_at ASC, id ASC
            FOR UPDATE SKIP LOCKED
            LIMIT 1
        )
        AND j.state = 'queued'
        RETURNING )" + kJobColumns;

    ScopedConnection conn(db_pool_.get());
    Transaction tx(conn.get());

    if (options.timeout.count() > 0) {
        auto timeout_result = QueryResult(conn->exec(
            "SET LOCAL statement_timeout = " + std::to_string(options.timeout.count())));
        timeout_result.throw_if_failed("Failed to set claim timeout");
    }

    CancellationToken* token = options.cancellation.get();
    if (token && !token->attach(conn.get())) {
        throw StoreError("Claim cancelled before it started", kCancelledSqlstate);
    }

    auto result = QueryResult(conn->exec_params(sql, {worker_hostname}));
    if (token) {
        token->detach();
    }
    result.throw_if_failed("Failed to claim job");

    // Cancelled after the statement finished: undo the claim
    if (token && token->is_cancelled()) {
        tx.rollback();
        throw StoreError("Claim cancelled", kCancelledSqlstate);
    }

    if (result.num_rows() == 0) {
        tx.commit();
        return std::nullopt;
    }

    Job job = scan_job(result, 0);
    if (job.state != JobState::Processing || job.worker_hostname != worker_hostname || !job.started_at) {
        throw InvariantViolation("Claim of job " + std::to_string(job.id) + " returned state '" +
                                 to_string(job.state) + "' owned by '" + job.worker_hostname + "'");
    }

    tx.commit();
    spdlog::debug("Worker {} claimed job {} (batch_spec_id={}, attempt {})",
                  worker_hostname, job.id, job.batch_spec_id, job.attempt());
    return job;
}

// ============================================================================
// Worker reports
// ============================================================================

std::string JobStore::append_log_entry_sql(const std::string& outcome_expr, const std::string& detail_expr) {
    return "j.execution_logs || jsonb_build_array(jsonb_build_object("
           "'key', 'attempt.' || (jsonb_array_length(j.execution_logs) + 1), "
           "'outcome', " + outcome_expr + ", "
           "'detail', " + detail_expr + ", "
           "'worker_hostname', j.worker_hostname, "
           "'started_at_ms', (EXTRACT(EPOCH FROM j.started_at) * 1000)::BIGINT, "
           "'finished_at_ms', (EXTRACT(EPOCH FROM NOW()) * 1000)::BIGINT, "
           "'duration_ms', COALESCE((EXTRACT(EPOCH FROM (NOW() - j.started_at)) * 1000)::BIGINT, 0)))";
}

bool JobStore::report_success(int64_t id, const std::string& worker_hostname, int attempt) {
    std::string sql =
        "UPDATE " + table_ + " AS j SET "
        "state = 'completed', "
        "finished_at = NOW(), "
        "failure_message = NULL, "
        "progress = NULL, "
        "execution_logs = " + append_log_entry_sql("'completed'", "COALESCE(j.progress, '')") + ", "
        "updated_at = NOW() "
        "WHERE j.id = $1::BIGINT AND " + owned_attempt_predicate(2, 3) + " "
        "RETURNING j.id";

    auto result = QueryResult(db_pool_->query_params(
        sql, {std::to_string(id), worker_hostname, std::to_string(attempt)}));
    result.throw_if_failed("Failed to mark job completed");

    if (result.num_rows() == 0) {
        spdlog::warn("Success report for job {} ignored: not processing or not owned by '{}'", id, worker_hostname);
        return false;
    }
    spdlog::info("Job {} completed", id);
    return true;
}

bool JobStore::report_failure(int64_t id, const std::string& message, const std::string& worker_hostname,
                              int attempt) {
    // Failure number n (1-based) waits delays[n]; reaching max_failures is terminal
    const std::string exhausted = "j.num_failures + 1 >= $3::INTEGER";
    const std::string delay = "COALESCE(($5::BIGINT[])[j.num_failures + 1], 0)";

    std::string sql =
        "UPDATE " + table_ + " AS j SET "
        "num_failures = j.num_failures + 1, "
        "state = CASE WHEN " + exhausted + " THEN 'errored' ELSE 'queued' END, "
        "failure_message = CASE WHEN " + exhausted + " THEN $4::TEXT ELSE NULL END, "
        "finished_at = CASE WHEN " + exhausted + " THEN NOW() ELSE NULL END, "
        "process_after = CASE WHEN " + exhausted + " THEN NULL "
        "                     WHEN " + delay + " <= 0 THEN NULL "
        "                     ELSE NOW() + INTERVAL '1 millisecond' * (" + delay + ")::DOUBLE PRECISION END, "
        "worker_hostname = CASE WHEN " + exhausted + " THEN j.worker_hostname ELSE '' END, "
        "progress = NULL, "
        "execution_logs = " + append_log_entry_sql(
            "CASE WHEN " + exhausted + " THEN 'errored' ELSE 'failed' END", "$4::TEXT") + ", "
        "updated_at = NOW() "
        "WHERE j.id = $1::BIGINT AND " + owned_attempt_predicate(2, 6) + " "
        "RETURNING j.state, j.num_failures";

    std::vector<std::string> params = {
        std::to_string(id),
        worker_hostname,
        std::to_string(config_.max_failures),
        sanitize_utf8(message),
        to_pg_array(backoff_.delay_table(config_.max_failures)),
        std::to_string(attempt)
    };

    auto result = QueryResult(db_pool_->query_params(sql, params));
    result.throw_if_failed("Failed to record job failure");

    if (result.num_rows() == 0) {
        spdlog::warn("Failure report for job {} ignored: not processing or not owned by '{}'", id, worker_hostname);
        return false;
    }

    std::string state = result.get_value(0, "state");
    int64_t failures = result.get_int64(0, "num_failures");
    if (state == "errored") {
        spdlog::warn("Job {} errored after {}/{} failures: {}", id, failures, config_.max_failures, message);
    } else {
        spdlog::info("Job {} failed ({}/{}), retry in {}ms: {}", id, failures, config_.max_failures,
                     backoff_.delay(static_cast<int>(failures)).count(), message);
    }
    return true;
}

bool JobStore::report_permanent_failure(int64_t id, const std::string& message,
                                        const std::string& worker_hostname, int attempt) {
    std::string sql =
        "UPDATE " + table_ + " AS j SET "
        "state = 'failed', "
        "failure_message = $3::TEXT, "
        "finished_at = NOW(), "
        "progress = NULL, "
        "execution_logs = " + append_log_entry_sql("'permanently_failed'", "$3::TEXT") + ", "
        "updated_at = NOW() "
        "WHERE j.id = $1::BIGINT AND " + owned_attempt_predicate(2, 4) + " "
        "RETURNING j.id";

    auto result = QueryResult(db_pool_->query_params(
        sql, {std::to_string(id), worker_hostname, sanitize_utf8(message), std::to_string(attempt)}));
    result.throw_if_failed("Failed to mark job failed");

    if (result.num_rows() == 0) {
        spdlog::warn("Permanent failure report for job {} ignored: not processing or not owned by '{}'",
                     id, worker_hostname);
        return false;
    }
    spdlog::warn("Job {} failed permanently: {}", id, message);
    return true;
}

bool JobStore::requeue(int64_t id, std::chrono::milliseconds after, const std::string& worker_hostname,
                       int attempt) {
    if (after.count() < 0) {
        throw std::invalid_argument("requeue delay must not be negative");
    }

    std::string sql =
        "UPDATE " + table_ + " AS j SET "
        "state = 'queued', "
        "process_after = CASE WHEN $3::DOUBLE PRECISION > 0 "
        "                     THEN NOW() + INTERVAL '1 millisecond' * $3::DOUBLE PRECISION END, "
        "worker_hostname = '', "
        "failure_message = NULL, "
        "progress = NULL, "
        "execution_logs = " + append_log_entry_sql("'requeued'", "'requeued by worker'") + ", "
        "updated_at = NOW() "
        "WHERE j.id = $1::BIGINT AND " + owned_attempt_predicate(2, 4) + " "
        "RETURNING j.id";

    auto result = QueryResult(db_pool_->query_params(
        sql, {std::to_string(id), worker_hostname, std::to_string(after.count()), std::to_string(attempt)}));
    result.throw_if_failed("Failed to requeue job");

    if (result.num_rows() == 0) {
        spdlog::warn("Requeue of job {} ignored: not processing or not owned by '{}'", id, worker_hostname);
        return false;
    }
    spdlog::info("Job {} requeued, eligible in {}ms", id, after.count());
    return true;
}

// ============================================================================
// Leases
// ============================================================================

bool JobStore::heartbeat(int64_t id, const std::string& worker_hostname,
                         const std::optional<std::string>& progress, int attempt) {
    validate_worker_hostname(worker_hostname);

    std::string set_clause = "updated_at = NOW()";
    std::vector<std::string> params = {std::to_string(id), worker_hostname, std::to_string(attempt)};
    if (progress) {
        set_clause += ", progress = $4::TEXT";
        params.push_back(sanitize_utf8(*progress));
    }

    std::string sql =
        "UPDATE " + table_ + " AS j SET " + set_clause +
        " WHERE j.id = $1::BIGINT AND " + owned_attempt_predicate(2, 3) +
        " RETURNING j.id";

    auto result = QueryResult(db_pool_->query_params(sql, params));
    result.throw_if_failed("Failed to record heartbeat");

    if (result.num_rows() == 0) {
        spdlog::warn("Heartbeat for job {} from {} rejected: lease lost", id, worker_hostname);
        return false;
    }
    return true;
}

std::vector<int64_t> JobStore::heartbeat_many(const std::vector<int64_t>& ids,
                                              const std::string& worker_hostname) {
    validate_worker_hostname(worker_hostname);

    std::vector<int64_t> known;
    if (ids.empty()) return known;

    std::string sql =
        "UPDATE " + table_ + " SET updated_at = NOW()"
        " WHERE id = ANY($1::BIGINT[]) AND state = 'processing' AND worker_hostname = $2::TEXT"
        " RETURNING id";

    auto result = QueryResult(db_pool_->query_params(sql, {to_pg_array(ids), worker_hostname}));
    result.throw_if_failed("Failed to record heartbeats");

    known.reserve(static_cast<size_t>(result.num_rows()));
    for (int i = 0; i < result.num_rows(); ++i) {
        known.push_back(result.get_int64(i, "id"));
    }
    std::sort(known.begin(), known.end());

    if (known.size() != ids.size()) {
        spdlog::warn("Heartbeat from {}: {} of {} jobs no longer owned", worker_hostname,
                     ids.size() - known.size(), ids.size());
    }
    return known;
}

std::string JobStore::reset_update_sql(const std::string& where_clause) const {
    const std::string exhausted = "j.num_resets + 1 > $1::INTEGER";

    return "UPDATE " + table_ + " AS j SET "
           "num_resets = j.num_resets + 1, "
           "state = CASE WHEN " + exhausted + " THEN 'errored' ELSE 'queued' END, "
           "failure_message = CASE WHEN " + exhausted +
           "    THEN 'job reset limit exceeded (' || (j.num_resets + 1) || ' resets)' ELSE NULL END, "
           "finished_at = CASE WHEN " + exhausted + " THEN NOW() ELSE NULL END, "
           "process_after = NULL, "
           "worker_hostname = '', "
           "progress = NULL, "
           "execution_logs = " + append_log_entry_sql(
               "CASE WHEN " + exhausted + " THEN 'errored' ELSE 'reset' END",
               "$3::TEXT || COALESCE(' (last progress: ' || j.progress || ')', '')") + ", "
           "updated_at = NOW() "
           "WHERE " + where_clause + " AND j.state = 'processing' "
           "RETURNING j.id, j.state, j.num_resets";
}

ReclaimResult JobStore::reclaim_stale(std::chrono::milliseconds timeout) {
    if (timeout.count() < 0) {
        throw std::invalid_argument("heartbeat timeout must not be negative");
    }

    // SKIP LOCKED: rows being reported on right now, or reclaimed by another
    // monitor, are left alone; a row that is no longer processing is not matched
    std::string where_clause =
        "j.id IN (SELECT id FROM " + table_ +
        " WHERE state = 'processing' AND updated_at < NOW() - INTERVAL '1 millisecond' * $2::DOUBLE PRECISION"
        " ORDER BY id FOR UPDATE SKIP LOCKED)";

    std::vector<std::string> params = {
        std::to_string(config_.max_resets),
        std::to_string(timeout.count()),
        "heartbeat timeout after " + std::to_string(timeout.count()) + "ms"
    };

    auto result = QueryResult(db_pool_->query_params(reset_update_sql(where_clause), params));
    result.throw_if_failed("Failed to reclaim stale jobs");

    ReclaimResult reclaimed;
    for (int i = 0; i < result.num_rows(); ++i) {
        int64_t id = result.get_int64(i, "id");
        int64_t resets = result.get_int64(i, "num_resets");
        if (result.get_value(i, "state") == "errored") {
            ++reclaimed.errored;
            spdlog::warn("Job {} errored: reset limit exceeded ({} resets)", id, resets);
        } else {
            ++reclaimed.requeued;
            spdlog::info("Job {} reclaimed after heartbeat timeout ({}/{} resets)", id, resets, config_.max_resets);
        }
    }
    return reclaimed;
}

bool JobStore::reset(int64_t id) {
    std::vector<std::string> params = {
        std::to_string(config_.max_resets),
        std::to_string(id),
        "reset by operator"
    };

    auto result = QueryResult(db_pool_->query_params(reset_update_sql("j.id = $2::BIGINT"), params));
    result.throw_if_failed("Failed to reset job");

    if (result.num_rows() == 0) {
        spdlog::warn("Reset of job {} ignored: not processing", id);
        return false;
    }
    spdlog::info("Job {} reset by operator, now {}", id, result.get_value(0, "state"));
    return true;
}

} // namespace resq
