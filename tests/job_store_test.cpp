/**
 * Job Store Integration Test
 *
 * Runs every job transition against a real PostgreSQL (set PG_HOST). Each
 * test works in its own schema, dropped at the end of the run.
 *
 * Covers:
 * 1. create/get/list and the initial state of new rows
 * 2. FIFO claim order and exclusive claims under concurrency
 * 3. success, retry with backoff, failure exhaustion, permanent failure
 * 4. heartbeats, stale lease reclaim and the reset budget
 * 5. requeue, operator reset, claim cancellation (before and during the claim)
 * 6. attempt fencing for workers sharing a hostname, UTF-8 sanitizing
 */

#include "resq/database.hpp"
#include "resq/errors.hpp"
#include "resq/job_store.hpp"
#include "test_support.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace resq;
using std::chrono::milliseconds;

namespace {

std::shared_ptr<DatabasePool> g_pool;
std::vector<std::string> g_schemas;

// Fast-retry settings unless a test overrides them
JobQueueConfig test_queue_config() {
    JobQueueConfig config;
    config.max_failures = 3;
    config.max_resets = 3;
    config.backoff_function = "constant";
    config.backoff_base_ms = 0;
    config.backoff_max_ms = 0;
    return config;
}

std::shared_ptr<JobStore> make_store(const JobQueueConfig& config = test_queue_config()) {
    std::string schema = resq::testing::unique_schema_name("resq_test") + "_" + std::to_string(g_schemas.size());
    g_schemas.push_back(schema);
    auto store = std::make_shared<JobStore>(g_pool, config, schema);
    if (!store->initialize_schema()) {
        throw std::runtime_error("Failed to initialize schema " + schema);
    }
    return store;
}

JobDescriptor descriptor(int64_t batch_spec_id) {
    JobDescriptor d;
    d.batch_spec_id = batch_spec_id;
    return d;
}

void drop_schemas() {
    for (const auto& schema : g_schemas) {
        QueryResult result(g_pool->query("DROP SCHEMA IF EXISTS " + schema + " CASCADE"));
        if (!result.is_success()) {
            std::cerr << "Failed to drop " << schema << ": " << result.error_message() << std::endl;
        }
    }
}

} // namespace

bool test_pool_and_health() {
    std::cout << "\n=== Test 0: Pool And Health ===" << std::endl;

    TEST_ASSERT(g_pool->size() == 8, "Pool initialized with configured size");
    TEST_ASSERT(g_pool->available() == 8, "All connections available initially");
    {
        ScopedConnection conn(g_pool.get());
        TEST_ASSERT(conn.is_valid(), "Scoped connection is valid");
        TEST_ASSERT(g_pool->available() == 7, "Checked-out connection is not available");
    }
    TEST_ASSERT(g_pool->available() == 8, "Connection returned on scope exit");

    auto db_config = *resq::testing::database_config_from_env();
    DatabasePool small_pool(db_config.connection_string(), 1, 100);
    {
        ScopedConnection held(&small_pool);
        bool timed_out = false;
        try {
            small_pool.get_connection();
        } catch (const StoreError& e) {
            timed_out = e.sqlstate() == "08006";
        }
        TEST_ASSERT(timed_out, "Exhausted pool times out instead of growing");
        TEST_ASSERT(small_pool.size() == 1, "Pool size stays at its limit");
    }
    TEST_ASSERT(small_pool.available() == 1, "Held connection returned to the small pool");

    auto store = make_store();
    TEST_ASSERT(store->health_check(), "Health check passes");

    bool threw = false;
    try {
        JobStore bad(g_pool, test_queue_config(), "Bad-Schema; DROP");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Unsafe schema name rejected");
    return true;
}

bool test_create_and_get() {
    std::cout << "\n=== Test 1: Create And Get ===" << std::endl;

    auto store = make_store();
    TEST_ASSERT(store->initialize_schema(), "Schema initialization is idempotent");

    JobDescriptor flagged = descriptor(30);
    flagged.allow_unsupported = true;
    flagged.allow_ignored = true;

    auto jobs = store->create(std::vector<JobDescriptor>{descriptor(10), descriptor(20), flagged});
    TEST_ASSERT(jobs.size() == 3, "Three jobs created");
    TEST_ASSERT(jobs[0].id < jobs[1].id && jobs[1].id < jobs[2].id, "Ids ascend in insertion order");

    const Job& first = jobs[0];
    TEST_ASSERT(first.state == JobState::Queued, "New job is queued");
    TEST_ASSERT(first.num_resets == 0 && first.num_failures == 0, "Counters start at zero");
    TEST_ASSERT(first.execution_logs.empty(), "Execution log starts empty");
    TEST_ASSERT(first.worker_hostname.empty(), "No worker assigned");
    TEST_ASSERT(!first.started_at && !first.finished_at && !first.process_after, "Lifecycle timestamps unset");
    TEST_ASSERT(first.created_at == first.updated_at, "updated_at equals created_at");

    auto by_id = store->get_by_id(jobs[2].id);
    TEST_ASSERT(by_id.has_value(), "get_by_id finds the job");
    TEST_ASSERT(by_id->batch_spec_id == 30 && by_id->allow_unsupported && by_id->allow_ignored,
                "Payload round-trips");

    GetJobOptions by_spec;
    by_spec.batch_spec_id = 20;
    auto found = store->get_by_filter(by_spec);
    TEST_ASSERT(found && found->id == jobs[1].id, "get_by_filter matches batch_spec_id");

    GetJobOptions both;
    both.id = jobs[0].id;
    both.batch_spec_id = 20;
    TEST_ASSERT(!store->get_by_filter(both), "Filters are conjunctive");
    TEST_ASSERT(!store->get_by_id(jobs[2].id + 1000), "Missing id is empty");

    bool threw = false;
    try {
        store->get_by_filter(GetJobOptions{});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Empty filter is rejected");

    int64_t single = store->create(descriptor(40));
    TEST_ASSERT(single > jobs[2].id, "Single create returns the new id");
    TEST_ASSERT(store->create(std::vector<JobDescriptor>{}).empty(), "Empty batch creates nothing");
    return true;
}

bool test_initial_state() {
    std::cout << "\n=== Test 2: Initial State ===" << std::endl;

    auto store = make_store();

    JobDescriptor done = descriptor(1);
    done.state = JobState::Completed;
    auto jobs = store->create(std::vector<JobDescriptor>{done});
    TEST_ASSERT(jobs[0].state == JobState::Completed, "Explicit initial state is stored");
    TEST_ASSERT(jobs[0].finished_at.has_value(), "Terminal initial state gets finished_at");
    TEST_ASSERT(!store->dequeue("host-a"), "Completed job is not claimable");

    JobDescriptor processing = descriptor(2);
    processing.state = JobState::Processing;
    bool threw = false;
    try {
        store->create(std::vector<JobDescriptor>{descriptor(3), processing});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Processing initial state is rejected");
    TEST_ASSERT(store->list_by_filter().size() == 1, "Rejected batch inserted nothing");
    return true;
}

bool test_fifo_claim() {
    std::cout << "\n=== Test 3: FIFO Claim ===" << std::endl;

    auto store = make_store();
    auto now = Clock::now();

    JobDescriptor newer = descriptor(1);
    newer.created_at = now - std::chrono::seconds(10);
    JobDescriptor oldest = descriptor(2);
    oldest.created_at = now - std::chrono::seconds(30);
    JobDescriptor middle = descriptor(3);
    middle.created_at = now - std::chrono::seconds(20);
    store->create(std::vector<JobDescriptor>{newer, oldest, middle});

    auto a = store->dequeue("host-a");
    auto b = store->dequeue("host-a");
    auto c = store->dequeue("host-a");
    TEST_ASSERT(a && a->batch_spec_id == 2, "Oldest created_at claimed first");
    TEST_ASSERT(b && b->batch_spec_id == 3, "Then the middle one");
    TEST_ASSERT(c && c->batch_spec_id == 1, "Then the newest");
    TEST_ASSERT(!store->dequeue("host-a"), "Empty queue yields nothing");

    TEST_ASSERT(a->state == JobState::Processing, "Claimed job is processing");
    TEST_ASSERT(a->worker_hostname == "host-a", "Claimed job records the worker");
    TEST_ASSERT(a->started_at.has_value(), "Claimed job has started_at");

    bool threw = false;
    try {
        store->dequeue("");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Empty worker hostname is rejected");
    return true;
}

bool test_concurrent_claims() {
    std::cout << "\n=== Test 4: Concurrent Claims ===" << std::endl;

    auto store = make_store();
    const int job_count = 40;
    std::vector<JobDescriptor> descriptors;
    for (int i = 0; i < job_count; ++i) {
        descriptors.push_back(descriptor(i));
    }
    store->create(descriptors);

    std::mutex mutex;
    std::vector<int64_t> claimed;
    std::atomic<int> errors{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&, t]() {
            std::string host = "host-" + std::to_string(t);
            try {
                while (auto job = store->dequeue(host)) {
                    std::lock_guard<std::mutex> lock(mutex);
                    claimed.push_back(job->id);
                }
            } catch (const std::exception& e) {
                std::cerr << "Claim error: " << e.what() << std::endl;
                errors++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<int64_t> unique(claimed.begin(), claimed.end());
    TEST_ASSERT(errors == 0, "No claim errors");
    TEST_ASSERT(claimed.size() == static_cast<size_t>(job_count), "Every job claimed exactly once in total");
    TEST_ASSERT(unique.size() == claimed.size(), "No job claimed twice");

    auto counts = store->count_by_state();
    TEST_ASSERT(counts[JobState::Processing] == job_count, "All jobs processing");
    TEST_ASSERT(counts[JobState::Queued] == 0, "None left queued");
    return true;
}

bool test_report_success() {
    std::cout << "\n=== Test 5: Report Success ===" << std::endl;

    auto store = make_store();
    int64_t id = store->create(descriptor(1));
    auto job = store->dequeue("host-a");
    TEST_ASSERT(job && job->id == id, "Job claimed");

    TEST_ASSERT(store->heartbeat(id, "host-a", std::string("half way")), "Heartbeat with progress accepted");
    TEST_ASSERT(!store->report_success(id, "host-b"), "Other worker cannot complete the job");
    TEST_ASSERT(store->report_success(id, "host-a"), "Owner completes the job");

    auto done = store->get_by_id(id);
    TEST_ASSERT(done->state == JobState::Completed, "Job completed");
    TEST_ASSERT(done->finished_at.has_value(), "finished_at set");
    TEST_ASSERT(!done->failure_message, "No failure message");
    TEST_ASSERT(done->execution_logs.size() == 1, "One attempt logged");
    TEST_ASSERT(done->execution_logs[0].outcome == "completed", "Attempt outcome is completed");
    TEST_ASSERT(done->execution_logs[0].key == "attempt.1", "Attempt key is attempt.1");
    TEST_ASSERT(done->execution_logs[0].detail == "half way", "Last progress kept in the log");
    TEST_ASSERT(done->execution_logs[0].worker_hostname == "host-a", "Attempt records the worker");

    // Terminal states are immutable
    TEST_ASSERT(!store->report_success(id), "Second success rejected");
    TEST_ASSERT(!store->report_failure(id, "late"), "Failure after completion rejected");
    TEST_ASSERT(!store->heartbeat(id, "host-a"), "Heartbeat after completion rejected");
    TEST_ASSERT(!store->reset(id), "Reset after completion rejected");
    TEST_ASSERT(store->reclaim_stale(milliseconds(0)).total() == 0, "Reclaim ignores completed jobs");

    auto after = store->get_by_id(id);
    TEST_ASSERT(after->state == JobState::Completed && after->execution_logs.size() == 1,
                "Completed job unchanged");
    return true;
}

bool test_failure_exhaustion() {
    std::cout << "\n=== Test 6: Failure Exhaustion ===" << std::endl;

    auto store = make_store();
    int64_t id = store->create(descriptor(1));

    for (int attempt = 1; attempt <= 3; ++attempt) {
        auto job = store->dequeue("host-a");
        TEST_ASSERT(job && job->id == id, "Attempt " + std::to_string(attempt) + " claimed");
        TEST_ASSERT(store->report_failure(id, "boom " + std::to_string(attempt), "host-a"),
                    "Failure " + std::to_string(attempt) + " recorded");

        auto current = store->get_by_id(id);
        TEST_ASSERT(current->num_failures == attempt, "num_failures incremented");
        TEST_ASSERT(current->execution_logs.size() == static_cast<size_t>(attempt), "One log entry per attempt");
        if (attempt < 3) {
            TEST_ASSERT(current->state == JobState::Queued, "Job requeued for retry");
            TEST_ASSERT(current->worker_hostname.empty(), "Worker released");
            TEST_ASSERT(!current->process_after, "Zero backoff leaves process_after unset");
            TEST_ASSERT(current->execution_logs.back().outcome == "failed", "Attempt outcome is failed");
        }
    }

    auto errored = store->get_by_id(id);
    TEST_ASSERT(errored->state == JobState::Errored, "Job errored after max failures");
    TEST_ASSERT(errored->failure_message && *errored->failure_message == "boom 3", "Last failure kept");
    TEST_ASSERT(errored->finished_at.has_value(), "finished_at set");
    TEST_ASSERT(errored->execution_logs.back().outcome == "errored", "Final attempt outcome is errored");
    TEST_ASSERT(errored->execution_logs[0].key == "attempt.1" && errored->execution_logs[2].key == "attempt.3",
                "Attempt keys are sequential");
    TEST_ASSERT(!store->dequeue("host-a"), "Errored job is not claimable");

    TEST_ASSERT(!store->report_failure(id, "boom 4", "host-a"), "Fourth failure report rejected");
    TEST_ASSERT(!store->report_failure(id, "boom 4"), "Fourth failure rejected without owner check too");
    auto unchanged = store->get_by_id(id);
    TEST_ASSERT(unchanged->num_failures == 3, "num_failures stays at 3");
    TEST_ASSERT(unchanged->state == JobState::Errored, "Job stays errored");
    TEST_ASSERT(*unchanged->failure_message == "boom 3", "Failure message unchanged");
    TEST_ASSERT(unchanged->execution_logs.size() == 3, "No log entry for the rejected report");
    return true;
}

bool test_retry_backoff() {
    std::cout << "\n=== Test 7: Retry Backoff ===" << std::endl;

    JobQueueConfig config = test_queue_config();
    config.backoff_function = "exponential";
    config.backoff_base_ms = 60000;
    config.backoff_max_ms = 600000;
    auto store = make_store(config);

    int64_t id = store->create(descriptor(1));
    store->dequeue("host-a");
    TEST_ASSERT(store->report_failure(id, "transient"), "Failure recorded");

    auto job = store->get_by_id(id);
    TEST_ASSERT(job->state == JobState::Queued, "Job queued for retry");
    TEST_ASSERT(job->process_after.has_value(), "process_after set");
    TEST_ASSERT(*job->process_after >= job->updated_at + std::chrono::seconds(59), "Delay follows base delay");
    TEST_ASSERT(!store->dequeue("host-a"), "Job not claimable before process_after");

    int64_t other = store->create(descriptor(2));
    auto next = store->dequeue("host-b");
    TEST_ASSERT(next && next->id == other, "Eligible jobs are still claimed past a delayed one");

    JobQueueConfig short_config = test_queue_config();
    short_config.backoff_base_ms = 300;
    short_config.backoff_max_ms = 300;
    auto short_store = make_store(short_config);

    int64_t delayed = short_store->create(descriptor(3));
    short_store->dequeue("host-a");
    TEST_ASSERT(short_store->report_failure(delayed, "transient", "host-a"), "Short-delay failure recorded");
    TEST_ASSERT(!short_store->dequeue("host-a"), "Not claimable inside the delay");

    std::this_thread::sleep_for(milliseconds(500));
    auto retried = short_store->dequeue("host-a");
    TEST_ASSERT(retried && retried->id == delayed, "Claimable once process_after has passed");
    TEST_ASSERT(!retried->process_after, "Claim clears process_after");
    TEST_ASSERT(retried->num_failures == 1 && retried->attempt() == 2, "Second attempt after one failure");
    return true;
}

bool test_permanent_failure_and_requeue() {
    std::cout << "\n=== Test 8: Permanent Failure And Requeue ===" << std::endl;

    auto store = make_store();
    int64_t first = store->create(descriptor(1));
    int64_t second = store->create(descriptor(2));

    store->dequeue("host-a");
    TEST_ASSERT(store->report_permanent_failure(first, "unsupported spec", "host-a"), "Permanent failure recorded");
    auto failed = store->get_by_id(first);
    TEST_ASSERT(failed->state == JobState::Failed, "Job is failed");
    TEST_ASSERT(failed->failure_message && *failed->failure_message == "unsupported spec", "Message stored");
    TEST_ASSERT(failed->num_failures == 0, "Permanent failure does not count toward retries");
    TEST_ASSERT(failed->execution_logs.back().outcome == "permanently_failed", "Outcome logged");

    store->dequeue("host-a");
    TEST_ASSERT(store->requeue(second, milliseconds(0), "host-a"), "Requeue accepted");
    auto requeued = store->get_by_id(second);
    TEST_ASSERT(requeued->state == JobState::Queued, "Job queued again");
    TEST_ASSERT(requeued->num_failures == 0 && requeued->num_resets == 0, "Counters untouched");
    TEST_ASSERT(requeued->execution_logs.back().outcome == "requeued", "Requeue logged");

    auto again = store->dequeue("host-b");
    TEST_ASSERT(again && again->id == second, "Requeued job claimable immediately");
    TEST_ASSERT(store->requeue(second, milliseconds(60000)), "Delayed requeue accepted");
    TEST_ASSERT(!store->dequeue("host-b"), "Delayed requeue not claimable yet");
    return true;
}

bool test_heartbeats() {
    std::cout << "\n=== Test 9: Heartbeats ===" << std::endl;

    auto store = make_store();
    auto jobs = store->create(std::vector<JobDescriptor>{descriptor(1), descriptor(2)});
    store->dequeue("host-a");
    store->dequeue("host-a");

    TEST_ASSERT(store->heartbeat(jobs[0].id, "host-a", std::string("step 2")), "Heartbeat accepted");
    TEST_ASSERT(store->get_by_id(jobs[0].id)->progress == std::string("step 2"), "Progress stored");
    TEST_ASSERT(store->heartbeat(jobs[0].id, "host-a"), "Heartbeat without progress accepted");
    TEST_ASSERT(store->get_by_id(jobs[0].id)->progress == std::string("step 2"), "Progress kept");
    TEST_ASSERT(!store->heartbeat(jobs[0].id, "host-b"), "Heartbeat from non-owner rejected");

    auto owned = store->heartbeat_many({jobs[0].id, jobs[1].id, jobs[1].id + 1000}, "host-a");
    TEST_ASSERT(owned.size() == 2, "heartbeat_many returns owned ids only");
    TEST_ASSERT(owned[0] == jobs[0].id && owned[1] == jobs[1].id, "Owned ids sorted");
    TEST_ASSERT(store->heartbeat_many({}, "host-a").empty(), "Empty heartbeat batch");
    return true;
}

bool test_reclaim_stale() {
    std::cout << "\n=== Test 10: Reclaim Stale Leases ===" << std::endl;

    JobQueueConfig config = test_queue_config();
    config.max_resets = 1;
    auto store = make_store(config);

    int64_t id = store->create(descriptor(1));
    int64_t fresh = store->create(descriptor(2));
    store->dequeue("host-a");
    store->dequeue("host-b");
    store->heartbeat(fresh, "host-b", std::string("working"));

    TEST_ASSERT(store->reclaim_stale(milliseconds(60000)).total() == 0, "Recent heartbeats are not reclaimed");

    std::this_thread::sleep_for(milliseconds(100));
    store->heartbeat(fresh, "host-b");
    auto first = store->reclaim_stale(milliseconds(50));
    TEST_ASSERT(first.requeued == 1 && first.errored == 0, "Stale job requeued");

    auto job = store->get_by_id(id);
    TEST_ASSERT(job->state == JobState::Queued, "Reclaimed job is queued");
    TEST_ASSERT(job->num_resets == 1, "num_resets incremented");
    TEST_ASSERT(job->worker_hostname.empty(), "Worker released");
    TEST_ASSERT(job->execution_logs.size() == 1 && job->execution_logs[0].outcome == "reset", "Reset logged");
    TEST_ASSERT(store->get_by_id(fresh)->state == JobState::Processing, "Live job untouched");

    TEST_ASSERT(!store->report_success(id, "host-a"), "Old owner cannot report after reclaim");

    store->dequeue("host-c");
    std::this_thread::sleep_for(milliseconds(100));
    store->heartbeat(fresh, "host-b");
    auto second = store->reclaim_stale(milliseconds(50));
    TEST_ASSERT(second.errored == 1 && second.requeued == 0, "Reset budget exhausted");

    job = store->get_by_id(id);
    TEST_ASSERT(job->state == JobState::Errored, "Job errored");
    TEST_ASSERT(job->num_resets == 2, "num_resets counts the final reset");
    TEST_ASSERT(job->failure_message && *job->failure_message == "job reset limit exceeded (2 resets)",
                "Reset limit message");
    TEST_ASSERT(job->finished_at.has_value(), "finished_at set");
    TEST_ASSERT(job->execution_logs.size() == 2, "Every attempt logged");

    bool threw = false;
    try {
        store->reclaim_stale(milliseconds(-1));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Negative timeout rejected");
    return true;
}

bool test_operator_reset() {
    std::cout << "\n=== Test 11: Operator Reset ===" << std::endl;

    auto store = make_store();
    int64_t id = store->create(descriptor(1));

    TEST_ASSERT(!store->reset(id), "Queued job cannot be reset");
    store->dequeue("host-a");
    store->heartbeat(id, "host-a", std::string("stuck at 80%"));
    TEST_ASSERT(store->reset(id), "Processing job reset");

    auto job = store->get_by_id(id);
    TEST_ASSERT(job->state == JobState::Queued, "Reset job queued");
    TEST_ASSERT(job->num_resets == 1, "Reset counted");
    TEST_ASSERT(!job->progress, "Progress cleared");
    TEST_ASSERT(job->execution_logs.back().detail.find("stuck at 80%") != std::string::npos,
                "Last progress recorded in the log");
    return true;
}

bool test_claim_cancellation() {
    std::cout << "\n=== Test 12: Claim Cancellation ===" << std::endl;

    auto store = make_store();
    int64_t id = store->create(descriptor(1));

    ClaimOptions options;
    options.timeout = milliseconds(2000);
    options.cancellation = std::make_shared<CancellationToken>();
    options.cancellation->cancel();

    bool cancelled = false;
    try {
        store->dequeue("host-a", options);
    } catch (const StoreError& e) {
        cancelled = e.is_cancellation();
    }
    TEST_ASSERT(cancelled, "Cancelled claim throws a cancellation error");
    TEST_ASSERT(store->get_by_id(id)->state == JobState::Queued, "Cancelled claim left the job queued");

    ClaimOptions bounded;
    bounded.timeout = milliseconds(2000);
    bounded.cancellation = std::make_shared<CancellationToken>();
    auto job = store->dequeue("host-a", bounded);
    TEST_ASSERT(job && job->id == id, "Claim with timeout and live token succeeds");
    return true;
}

// Holds an exclusive lock on the job table so claim statements block
bool test_in_flight_claim_cancellation() {
    std::cout << "\n=== Test 13: In-Flight Claim Cancellation ===" << std::endl;

    auto store = make_store();
    int64_t id = store->create(descriptor(1));

    bool cancelled = false;
    bool timed_out = false;
    auto cancel_elapsed = milliseconds(0);
    auto timeout_elapsed = milliseconds(0);
    {
        ScopedConnection locker(g_pool.get());
        Transaction lock_tx(locker.get());
        QueryResult locked(locker->exec("LOCK TABLE " + store->table_name() + " IN ACCESS EXCLUSIVE MODE"));
        TEST_ASSERT(locked.is_success(), "Job table locked by another transaction");

        ClaimOptions in_flight;
        in_flight.timeout = milliseconds(10000);
        in_flight.cancellation = std::make_shared<CancellationToken>();
        auto token = in_flight.cancellation;
        std::thread canceller([token] {
            std::this_thread::sleep_for(milliseconds(300));
            token->cancel();
        });

        auto started = std::chrono::steady_clock::now();
        try {
            store->dequeue("host-a", in_flight);
        } catch (const StoreError& e) {
            cancelled = e.is_cancellation();
        }
        cancel_elapsed = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - started);
        canceller.join();

        ClaimOptions bounded;
        bounded.timeout = milliseconds(300);
        started = std::chrono::steady_clock::now();
        try {
            store->dequeue("host-a", bounded);
        } catch (const StoreError& e) {
            timed_out = e.is_cancellation();
        }
        timeout_elapsed = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - started);

        lock_tx.rollback();
    }

    TEST_ASSERT(cancelled, "Cancel from another thread aborts the blocked claim");
    TEST_ASSERT(cancel_elapsed < milliseconds(5000), "Blocked claim returned promptly after cancel");
    TEST_ASSERT(timed_out, "Claim timeout aborts the blocked claim");
    TEST_ASSERT(timeout_elapsed < milliseconds(5000), "Claim timeout bounds the wait");

    auto job = store->get_by_id(id);
    TEST_ASSERT(job->state == JobState::Queued, "Aborted claims left the job queued");
    TEST_ASSERT(job->worker_hostname.empty() && !job->started_at, "No claim state survived");

    auto claimed = store->dequeue("host-a");
    TEST_ASSERT(claimed && claimed->id == id, "Job claimable once the lock is released");
    return true;
}

bool test_list_filters() {
    std::cout << "\n=== Test 14: List Filters ===" << std::endl;

    auto store = make_store();
    std::vector<JobDescriptor> descriptors;
    for (int i = 0; i < 5; ++i) {
        descriptors.push_back(descriptor(i));
    }
    auto jobs = store->create(descriptors);

    store->dequeue("host-a");
    store->dequeue("host-b");
    store->dequeue("host-a");
    store->report_success(jobs[1].id);

    ListJobsOptions all;
    auto listed = store->list_by_filter(all);
    TEST_ASSERT(listed.size() == 5, "Unfiltered list returns every job");
    TEST_ASSERT(std::is_sorted(listed.begin(), listed.end(),
                               [](const Job& a, const Job& b) { return a.id < b.id; }),
                "List is in ascending id order");

    ListJobsOptions processing;
    processing.state = JobState::Processing;
    TEST_ASSERT(store->list_by_filter(processing).size() == 2, "State filter");

    ListJobsOptions by_worker;
    by_worker.worker_hostname = "host-a";
    TEST_ASSERT(store->list_by_filter(by_worker).size() == 2, "Worker filter");

    ListJobsOptions combined;
    combined.state = JobState::Completed;
    combined.worker_hostname = "host-b";
    auto completed = store->list_by_filter(combined);
    TEST_ASSERT(completed.size() == 1 && completed[0].id == jobs[1].id, "Combined filters");

    ListJobsOptions limited;
    limited.limit = 2;
    auto first_two = store->list_by_filter(limited);
    TEST_ASSERT(first_two.size() == 2 && first_two[0].id == jobs[0].id, "Limit keeps the lowest ids");

    auto counts = store->count_by_state();
    TEST_ASSERT(counts[JobState::Queued] == 2, "Two queued");
    TEST_ASSERT(counts[JobState::Processing] == 2, "Two processing");
    TEST_ASSERT(counts[JobState::Completed] == 1, "One completed");
    TEST_ASSERT(counts[JobState::Errored] == 0, "Zero errored reported");
    return true;
}

bool test_attempt_fencing() {
    std::cout << "\n=== Test 15: Attempt Fencing On A Shared Hostname ===" << std::endl;

    // Two processes on one machine, both configured with the same identity
    auto store = make_store();
    JobStore second_process(g_pool, test_queue_config(), store->table_name().substr(0, store->table_name().find('.')));
    int64_t id = store->create(descriptor(1));

    auto first_claim = store->dequeue("shared-host");
    TEST_ASSERT(first_claim && first_claim->attempt() == 1, "First process claims attempt 1");
    TEST_ASSERT(store->reset(id), "Stalled attempt reset");

    auto second_claim = second_process.dequeue("shared-host");
    TEST_ASSERT(second_claim && second_claim->id == id, "Second process claims the job again");
    TEST_ASSERT(second_claim->attempt() == 2, "New claim is attempt 2");

    TEST_ASSERT(!store->heartbeat(id, "shared-host", std::string("stale"), first_claim->attempt()),
                "Heartbeat for the closed attempt rejected");
    TEST_ASSERT(!store->report_success(id, "shared-host", first_claim->attempt()),
                "Success for the closed attempt rejected");
    TEST_ASSERT(!store->report_failure(id, "stale", "shared-host", first_claim->attempt()),
                "Failure for the closed attempt rejected");
    TEST_ASSERT(!store->requeue(id, milliseconds(0), "shared-host", first_claim->attempt()),
                "Requeue for the closed attempt rejected");

    auto live = store->get_by_id(id);
    TEST_ASSERT(live->state == JobState::Processing && live->num_failures == 0, "Live attempt untouched");
    TEST_ASSERT(!live->progress, "Stale progress not stored");

    TEST_ASSERT(second_process.heartbeat(id, "shared-host", std::string("live"), second_claim->attempt()),
                "Heartbeat for the live attempt accepted");
    TEST_ASSERT(second_process.report_success(id, "shared-host", second_claim->attempt()),
                "Success for the live attempt accepted");
    TEST_ASSERT(store->get_by_id(id)->state == JobState::Completed, "Job completed by the live attempt");
    return true;
}

bool test_text_sanitizing() {
    std::cout << "\n=== Test 16: Invalid UTF-8 In Progress And Messages ===" << std::endl;

    auto store = make_store();
    auto jobs = store->create(std::vector<JobDescriptor>{descriptor(1), descriptor(2)});
    store->dequeue("host-a");
    store->dequeue("host-a");

    TEST_ASSERT(store->heartbeat(jobs[0].id, "host-a", std::string("50% \xC3")), "Heartbeat with a split character accepted");
    TEST_ASSERT(store->get_by_id(jobs[0].id)->progress == std::string("50% \xEF\xBF\xBD"),
                "Split character stored as U+FFFD");

    TEST_ASSERT(store->report_failure(jobs[0].id, "bad \xFF byte", "host-a"), "Failure with an invalid byte recorded");
    TEST_ASSERT(store->get_by_id(jobs[0].id)->execution_logs.back().detail == "bad \xEF\xBF\xBD byte",
                "Invalid byte replaced in the log");

    TEST_ASSERT(store->report_permanent_failure(jobs[1].id, "caf\xC3\xA9 \xE2\x82", "host-a"),
                "Permanent failure with a truncated sequence recorded");
    auto failed = store->get_by_id(jobs[1].id);
    TEST_ASSERT(failed->failure_message == std::string("caf\xC3\xA9 \xEF\xBF\xBD\xEF\xBF\xBD"),
                "Valid characters kept, truncated bytes replaced");
    return true;
}

int main() {
    spdlog::set_level(spdlog::level::warn);
    resq::testing::print_banner("Job Store Integration Tests");

    auto db_config = resq::testing::database_config_from_env();
    if (!db_config) {
        std::cout << "⚠️  Skipping tests - PostgreSQL not configured (set PG_HOST env var)" << std::endl;
        return 0;
    }

    bool all_passed = true;
    try {
        g_pool = std::make_shared<DatabasePool>(db_config->connection_string(), db_config->pool_size,
                                                db_config->pool_acquisition_timeout);

        all_passed &= test_pool_and_health();
        all_passed &= test_create_and_get();
        all_passed &= test_initial_state();
        all_passed &= test_fifo_claim();
        all_passed &= test_concurrent_claims();
        all_passed &= test_report_success();
        all_passed &= test_failure_exhaustion();
        all_passed &= test_retry_backoff();
        all_passed &= test_permanent_failure_and_requeue();
        all_passed &= test_heartbeats();
        all_passed &= test_reclaim_stale();
        all_passed &= test_operator_reset();
        all_passed &= test_claim_cancellation();
        all_passed &= test_in_flight_claim_cancellation();
        all_passed &= test_list_filters();
        all_passed &= test_attempt_fencing();
        all_passed &= test_text_sanitizing();
    } catch (const std::exception& e) {
        std::cerr << "❌ Exception: " << e.what() << std::endl;
        all_passed = false;
    }

    if (g_pool) {
        drop_schemas();
    }
    return resq::testing::print_summary(all_passed);
}
