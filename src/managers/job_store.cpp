#include "resq/job_store.hpp"
#include "resq/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace resq {

namespace {

constexpr size_t kInsertChunkSize = 1000;

// Shared by every instance so concurrent initialize_schema() calls serialize
constexpr int64_t kSchemaLockId = 737101;

bool is_valid_identifier(const std::string& name) {
    if (name.empty() || name.size() > 63) return false;
    if (!(std::islower(static_cast<unsigned char>(name[0])) || name[0] == '_')) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        unsigned char uc = static_cast<unsigned char>(c);
        return std::islower(uc) || std::isdigit(uc) || c == '_';
    });
}

} // namespace

const char* const JobStore::kJobColumns = R"(
    id, batch_spec_id, allow_unsupported, allow_ignored,
    state, failure_message,
    (EXTRACT(EPOCH FROM started_at) * 1000)::BIGINT AS started_at_ms,
    (EXTRACT(EPOCH FROM finished_at) * 1000)::BIGINT AS finished_at_ms,
    (EXTRACT(EPOCH FROM process_after) * 1000)::BIGINT AS process_after_ms,
    num_resets, num_failures, execution_logs, worker_hostname, progress,
    (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms,
    (EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_at_ms
)";

JobStore::JobStore(std::shared_ptr<DatabasePool> db_pool,
                   const JobQueueConfig& config,
                   const std::string& schema_name)
    : db_pool_(std::move(db_pool)),
      config_(config),
      backoff_(config.backoff_policy()),
      schema_name_(schema_name) {
    if (!db_pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
    if (!is_valid_identifier(schema_name_)) {
        throw std::invalid_argument("Invalid schema name: " + schema_name_);
    }
    table_ = schema_name_ + ".batch_spec_resolution_jobs";
}

bool JobStore::initialize_schema() {
    try {
        ScopedConnection conn(db_pool_.get());
        Transaction tx(conn.get());

        auto lock_result = QueryResult(conn->exec_params(
            "SELECT pg_advisory_xact_lock($1::bigint)", {std::to_string(kSchemaLockId)}));
        lock_result.throw_if_failed("Failed to acquire schema lock");

        auto schema_result = QueryResult(conn->exec("CREATE SCHEMA IF NOT EXISTS " + schema_name_));
        if (!schema_result.is_success()) {
            spdlog::error("Failed to create schema: {}", schema_result.error_message());
            return false;
        }

        std::string create_table_sql = R"(
            CREATE TABLE IF NOT EXISTS )" + table_ + R"( (
                id BIGSERIAL PRIMARY KEY,
                batch_spec_id BIGINT NOT NULL,
                allow_unsupported BOOLEAN NOT NULL DEFAULT FALSE,
                allow_ignored BOOLEAN NOT NULL DEFAULT FALSE,
                state TEXT NOT NULL DEFAULT 'queued',
                failure_message TEXT,
                started_at TIMESTAMPTZ,
                finished_at TIMESTAMPTZ,
                process_after TIMESTAMPTZ,
                num_resets INTEGER NOT NULL DEFAULT 0,
                num_failures INTEGER NOT NULL DEFAULT 0,
                execution_logs JSONB NOT NULL DEFAULT '[]'::jsonb,
                worker_hostname TEXT NOT NULL DEFAULT '',
                progress TEXT,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                CHECK (state IN ('queued', 'processing', 'completed', 'failed', 'errored')),
                CHECK (state <> 'processing' OR (worker_hostname <> '' AND started_at IS NOT NULL)),
                CHECK (state NOT IN ('completed', 'failed', 'errored') OR finished_at IS NOT NULL),
                CHECK (jsonb_typeof(execution_logs) = 'array')
            )
        )";

        auto table_result = QueryResult(conn->exec(create_table_sql));
        if (!table_result.is_success()) {
            spdlog::error("Failed to create tables: {}", table_result.error_message());
            return false;
        }

        // Claim scans queued rows in FIFO order, reclaim scans processing rows by heartbeat
        std::string create_indexes_sql =
            "CREATE INDEX IF NOT EXISTS batch_spec_resolution_jobs_claim_idx ON " + table_ +
            " (created_at, id) WHERE state = 'queued';"
            "CREATE INDEX IF NOT EXISTS batch_spec_resolution_jobs_heartbeat_idx ON " + table_ +
            " (updated_at) WHERE state = 'processing';"
            "CREATE INDEX IF NOT EXISTS batch_spec_resolution_jobs_batch_spec_id_idx ON " + table_ +
            " (batch_spec_id);"
            "CREATE INDEX IF NOT EXISTS batch_spec_resolution_jobs_state_idx ON " + table_ +
            " (state);"
            "CREATE INDEX IF NOT EXISTS batch_spec_resolution_jobs_worker_hostname_idx ON " + table_ +
            " (worker_hostname) WHERE worker_hostname <> '';";

        auto index_result = QueryResult(conn->exec(create_indexes_sql));
        if (!index_result.is_success()) {
            spdlog::error("Failed to create indexes: {}", index_result.error_message());
            return false;
        }

        tx.commit();
        spdlog::info("Schema {} initialized", schema_name_);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("Schema initialization failed: {}", e.what());
        return false;
    }
}

bool JobStore::health_check() {
    try {
        auto result = QueryResult(db_pool_->query("SELECT 1"));
        return result.is_success();
    } catch (const std::exception& e) {
        spdlog::error("Health check failed: {}", e.what());
        return false;
    }
}

std::vector<Job> JobStore::create(const std::vector<JobDescriptor>& descriptors) {
    std::vector<Job> created;
    if (descriptors.empty()) return created;

    for (const auto& descriptor : descriptors) {
        if (descriptor.state && *descriptor.state == JobState::Processing) {
            throw std::invalid_argument("Jobs cannot be created in the processing state");
        }
    }

    created.reserve(descriptors.size());

    ScopedConnection conn(db_pool_.get());
    Transaction tx(conn.get());

    for (size_t offset = 0; offset < descriptors.size(); offset += kInsertChunkSize) {
        size_t end = std::min(offset + kInsertChunkSize, descriptors.size());

        std::string values;
        std::vector<std::string> params;
        params.reserve((end - offset) * 5);

        for (size_t i = offset; i < end; ++i) {
            const auto& d = descriptors[i];
            size_t base = params.size();
            if (!values.empty()) values += ",\n";
            values += "($" + std::to_string(base + 1) + "::BIGINT, $" + std::to_string(base + 2) +
                      "::BOOLEAN, $" + std::to_string(base + 3) + "::BOOLEAN, $" + std::to_string(base + 4) +
                      "::TEXT, COALESCE(to_timestamp(NULLIF($" + std::to_string(base + 5) +
                      "::TEXT, '')::DOUBLE PRECISION / 1000), NOW()))";

            params.push_back(std::to_string(d.batch_spec_id));
            params.push_back(d.allow_unsupported ? "true" : "false");
            params.push_back(d.allow_ignored ? "true" : "false");
            params.push_back(to_string(d.state.value_or(JobState::Queued)));
            params.push_back(d.created_at ? std::to_string(to_epoch_ms(*d.created_at)) : "");
        }

        std::string sql =
            "INSERT INTO " + table_ + R"( (batch_spec_id, allow_unsupported, allow_ignored,
                                          state, created_at, updated_at, finished_at)
            SELECT v.batch_spec_id, v.allow_unsupported, v.allow_ignored, v.state,
                   v.created_at, v.created_at,
                   CASE WHEN v.state IN ('completed', 'failed', 'errored') THEN v.created_at END
            FROM (VALUES )" + values + R"() AS v(batch_spec_id, allow_unsupported, allow_ignored, state, created_at)
            RETURNING )" + kJobColumns;

        auto result = QueryResult(conn->exec_params(sql, params));
        result.throw_if_failed("Batch insert failed");

        auto jobs = scan_jobs(result);
        created.insert(created.end(), jobs.begin(), jobs.end());
    }

    tx.commit();

    // Identifiers come from one sequence inside one transaction, so id order
    // is insertion order
    std::sort(created.begin(), created.end(),
              [](const Job& a, const Job& b) { return a.id < b.id; });

    spdlog::debug("Created {} batch spec resolution jobs", created.size());
    return created;
}

int64_t JobStore::create(const JobDescriptor& descriptor) {
    auto jobs = create(std::vector<JobDescriptor>{descriptor});
    if (jobs.size() != 1) {
        throw InvariantViolation("Insert of one job returned " + std::to_string(jobs.size()) + " rows");
    }
    return jobs.front().id;
}

std::optional<Job> JobStore::get_by_id(int64_t id) {
    GetJobOptions options;
    options.id = id;
    return get_by_filter(options);
}

std::optional<Job> JobStore::get_by_filter(const GetJobOptions& options) {
    std::vector<std::string> preds;
    std::vector<std::string> params;

    if (options.id) {
        params.push_back(std::to_string(*options.id));
        preds.push_back("id = $" + std::to_string(params.size()) + "::BIGINT");
    }
    if (options.batch_spec_id) {
        params.push_back(std::to_string(*options.batch_spec_id));
        preds.push_back("batch_spec_id = $" + std::to_string(params.size()) + "::BIGINT");
    }
    if (preds.empty()) {
        throw std::invalid_argument("get_by_filter requires an id or a batch_spec_id");
    }

    std::string where;
    for (const auto& pred : preds) {
        where += where.empty() ? pred : " AND " + pred;
    }

    std::string sql = std::string("SELECT ") + kJobColumns + " FROM " + table_ +
                      " WHERE " + where + " ORDER BY id ASC LIMIT 1";

    auto result = QueryResult(db_pool_->query_params(sql, params));
    result.throw_if_failed("Failed to get job");

    if (result.num_rows() == 0) {
        return std::nullopt;
    }
    return scan_job(result, 0);
}

std::vector<Job> JobStore::list_by_filter(const ListJobsOptions& options) {
    std::vector<std::string> preds;
    std::vector<std::string> params;

    if (options.state) {
        params.push_back(to_string(*options.state));
        preds.push_back("state = $" + std::to_string(params.size()) + "::TEXT");
    }
    if (options.worker_hostname && !options.worker_hostname->empty()) {
        params.push_back(*options.worker_hostname);
        preds.push_back("worker_hostname = $" + std::to_string(params.size()) + "::TEXT");
    }

    std::string where = "TRUE";
    for (const auto& pred : preds) {
        where += " AND " + pred;
    }

    std::string sql = std::string("SELECT ") + kJobColumns + " FROM " + table_ +
                      " WHERE " + where + " ORDER BY id ASC";
    if (options.limit && *options.limit > 0) {
        params.push_back(std::to_string(*options.limit));
        sql += " LIMIT $" + std::to_string(params.size()) + "::INTEGER";
    }

    auto result = QueryResult(db_pool_->query_params(sql, params));
    result.throw_if_failed("Failed to list jobs");
    return scan_jobs(result);
}

std::map<JobState, int64_t> JobStore::count_by_state() {
    std::map<JobState, int64_t> counts = {
        {JobState::Queued, 0},
        {JobState::Processing, 0},
        {JobState::Completed, 0},
        {JobState::Failed, 0},
        {JobState::Errored, 0}
    };

    auto result = QueryResult(db_pool_->query(
        "SELECT state, COUNT(*) AS count FROM " + table_ + " GROUP BY state"));
    result.throw_if_failed("Failed to count jobs");

    for (int i = 0; i < result.num_rows(); ++i) {
        auto state = parse_job_state(result.get_value(i, "state"));
        if (!state) {
            throw InvariantViolation("Unknown job state in table: " + result.get_value(i, "state"));
        }
        counts[*state] = result.get_int64(i, "count");
    }
    return counts;
}

Job JobStore::scan_job(const QueryResult& result, int row) {
    Job job;
    job.id = result.get_int64(row, "id");
    job.batch_spec_id = result.get_int64(row, "batch_spec_id");
    job.allow_unsupported = result.get_bool(row, "allow_unsupported");
    job.allow_ignored = result.get_bool(row, "allow_ignored");

    std::string state_name = result.get_value(row, "state");
    auto state = parse_job_state(state_name);
    if (!state) {
        throw InvariantViolation("Job " + std::to_string(job.id) + " has unknown state '" + state_name + "'");
    }
    job.state = *state;

    if (!result.is_null(row, "failure_message")) {
        job.failure_message = result.get_value(row, "failure_message");
    }
    if (!result.is_null(row, "started_at_ms")) {
        job.started_at = from_epoch_ms(result.get_int64(row, "started_at_ms"));
    }
    if (!result.is_null(row, "finished_at_ms")) {
        job.finished_at = from_epoch_ms(result.get_int64(row, "finished_at_ms"));
    }
    if (!result.is_null(row, "process_after_ms")) {
        job.process_after = from_epoch_ms(result.get_int64(row, "process_after_ms"));
    }

    job.num_resets = static_cast<int>(result.get_int64(row, "num_resets"));
    job.num_failures = static_cast<int>(result.get_int64(row, "num_failures"));
    job.worker_hostname = result.get_value(row, "worker_hostname");
    if (!result.is_null(row, "progress")) {
        job.progress = result.get_value(row, "progress");
    }

    std::string logs = result.get_value(row, "execution_logs");
    if (!logs.empty()) {
        try {
            auto parsed = nlohmann::json::parse(logs);
            for (const auto& entry : parsed) {
                job.execution_logs.push_back(ExecutionLogEntry::from_json(entry));
            }
        } catch (const nlohmann::json::exception& e) {
            throw StoreError("Malformed execution_logs for job " + std::to_string(job.id) + ": " + e.what());
        }
    }

    job.created_at = from_epoch_ms(result.get_int64(row, "created_at_ms"));
    job.updated_at = from_epoch_ms(result.get_int64(row, "updated_at_ms"));
    return job;
}

std::vector<Job> JobStore::scan_jobs(const QueryResult& result) {
    std::vector<Job> jobs;
    jobs.reserve(static_cast<size_t>(result.num_rows()));
    for (int i = 0; i < result.num_rows(); ++i) {
        jobs.push_back(scan_job(result, i));
    }
    return jobs;
}

} // namespace resq
