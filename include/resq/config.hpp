#pragma once

#include "resq/backoff_policy.hpp"
#include <string>
#include <vector>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace resq {

// Helper function to get boolean from environment
inline bool get_env_bool(const char* name, bool default_value) {
    const char* value = std::getenv(name);
    if (!value) return default_value;
    return std::strcmp(value, "true") == 0;
}

// Helper function to get int from environment
inline int get_env_int(const char* name, int default_value) {
    const char* value = std::getenv(name);
    return value ? std::atoi(value) : default_value;
}

// Helper function to get double from environment
inline double get_env_double(const char* name, double default_value) {
    const char* value = std::getenv(name);
    return value ? std::atof(value) : default_value;
}

// Helper function to get string from environment
inline std::string get_env_string(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_value;
}

inline std::string local_hostname() {
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
        return "resq-worker";
    }
    return std::string(buf);
}

// Unique among the processes of one host
inline std::string default_worker_identity() {
    return local_hostname() + ":" + std::to_string(static_cast<long>(getpid()));
}

struct DatabaseConfig {
    // Connection settings
    std::string user = "postgres";
    std::string host = "localhost";
    std::string database = "postgres";
    std::string password = "postgres";
    std::string port = "5432";
    std::string schema = "resq";

    bool use_ssl = false;                 // sslmode=require

    // Pool configuration
    int pool_size = 10;
    int idle_in_transaction_timeout = 30000; // 30 seconds
    int connection_timeout = 2000;        // 2 seconds
    int statement_timeout = 30000;        // 30 seconds
    int lock_timeout = 10000;             // 10 seconds
    int pool_acquisition_timeout = 10000; // timeout for acquiring connection from pool

    static DatabaseConfig from_env() {
        DatabaseConfig config;
        config.user = get_env_string("PG_USER", "postgres");
        config.host = get_env_string("PG_HOST", "localhost");
        config.database = get_env_string("PG_DB", "postgres");
        config.password = get_env_string("PG_PASSWORD", "postgres");
        config.port = get_env_string("PG_PORT", "5432");
        config.schema = get_env_string("PG_SCHEMA", "resq");

        config.use_ssl = get_env_bool("PG_USE_SSL", false);

        config.pool_size = get_env_int("DB_POOL_SIZE", 10);
        config.idle_in_transaction_timeout = get_env_int("DB_IDLE_IN_TRANSACTION_TIMEOUT", 30000);
        config.connection_timeout = get_env_int("DB_CONNECTION_TIMEOUT", 2000);
        config.statement_timeout = get_env_int("DB_STATEMENT_TIMEOUT", 30000);
        config.lock_timeout = get_env_int("DB_LOCK_TIMEOUT", 10000);
        config.pool_acquisition_timeout = get_env_int("DB_POOL_ACQUISITION_TIMEOUT", 10000);

        return config;
    }

    std::string connection_string() const {
        std::string conn_str = "host=" + host + " port=" + port + " dbname=" + database +
                               " user=" + user + " password=" + password;

        conn_str += use_ssl ? " sslmode=require" : " sslmode=disable";

        // connect_timeout is in seconds; the other timeouts are applied with SET
        // after connecting so that they also work behind PgBouncer
        int connect_seconds = connection_timeout / 1000;
        if (connect_seconds < 1) connect_seconds = 1;
        conn_str += " connect_timeout=" + std::to_string(connect_seconds);
        conn_str += " application_name=resq";

        return conn_str;
    }
};

// Knobs that drive the claim, retry and reclaim transitions of the job table
struct JobQueueConfig {
    int max_resets = 3;                  // reclaims/resets before a job is errored
    int max_failures = 3;                // failed attempts before a job is errored
    int heartbeat_timeout_ms = 60000;    // lease length without a heartbeat
    std::string backoff_function = "exponential";
    int backoff_base_ms = 1000;
    int backoff_max_ms = 300000;         // 5 minutes
    int claim_timeout_ms = 5000;         // upper bound for a single dequeue statement

    static JobQueueConfig from_env() {
        JobQueueConfig config;
        config.max_resets = get_env_int("RESQ_MAX_RESETS", 3);
        config.max_failures = get_env_int("RESQ_MAX_FAILURES", 3);
        config.heartbeat_timeout_ms = get_env_int("RESQ_HEARTBEAT_TIMEOUT_MS", 60000);
        config.backoff_function = get_env_string("RESQ_BACKOFF_FUNCTION", "exponential");
        config.backoff_base_ms = get_env_int("RESQ_BACKOFF_BASE_MS", 1000);
        config.backoff_max_ms = get_env_int("RESQ_BACKOFF_MAX_MS", 300000);
        config.claim_timeout_ms = get_env_int("RESQ_CLAIM_TIMEOUT_MS", 5000);
        return config;
    }

    BackoffPolicy backoff_policy() const {
        return BackoffPolicy(parse_backoff_function(backoff_function),
                             std::chrono::milliseconds(backoff_base_ms),
                             std::chrono::milliseconds(backoff_max_ms));
    }

    bool validate(std::string& error) const {
        if (max_resets < 0) { error = "RESQ_MAX_RESETS must be >= 0"; return false; }
        if (max_failures < 0) { error = "RESQ_MAX_FAILURES must be >= 0"; return false; }
        if (heartbeat_timeout_ms <= 0) { error = "RESQ_HEARTBEAT_TIMEOUT_MS must be > 0"; return false; }
        if (backoff_base_ms < 0) { error = "RESQ_BACKOFF_BASE_MS must be >= 0"; return false; }
        if (backoff_max_ms < backoff_base_ms) {
            error = "RESQ_BACKOFF_MAX_MS must be >= RESQ_BACKOFF_BASE_MS";
            return false;
        }
        if (claim_timeout_ms < 0) { error = "RESQ_CLAIM_TIMEOUT_MS must be >= 0"; return false; }
        BackoffFunction fn;
        if (!try_parse_backoff_function(backoff_function, fn)) {
            error = "Unknown RESQ_BACKOFF_FUNCTION '" + backoff_function + "'";
            return false;
        }
        return true;
    }
};

struct MonitorConfig {
    int reclaim_interval_ms = 5000;      // how often the stale-lease sweep runs

    static MonitorConfig from_env() {
        MonitorConfig config;
        config.reclaim_interval_ms = get_env_int("RESQ_RECLAIM_INTERVAL_MS", 5000);
        return config;
    }
};

struct WorkerConfig {
    std::string hostname;                // claim owner; must differ between worker processes
    int heartbeat_interval_ms = 10000;

    // Adaptive poll backoff when the queue is empty
    int poll_interval_ms = 500;
    int backoff_threshold = 1;           // consecutive empty claims before backoff starts
    double backoff_multiplier = 2.0;
    int max_poll_interval_ms = 10000;

    static WorkerConfig from_env() {
        WorkerConfig config;
        config.hostname = get_env_string("RESQ_WORKER_HOSTNAME", default_worker_identity());
        config.heartbeat_interval_ms = get_env_int("RESQ_WORKER_HEARTBEAT_INTERVAL_MS", 10000);
        config.poll_interval_ms = get_env_int("RESQ_WORKER_POLL_INTERVAL_MS", 500);
        config.backoff_threshold = get_env_int("RESQ_WORKER_BACKOFF_THRESHOLD", 1);
        config.backoff_multiplier = get_env_double("RESQ_WORKER_BACKOFF_MULTIPLIER", 2.0);
        config.max_poll_interval_ms = get_env_int("RESQ_WORKER_MAX_POLL_INTERVAL_MS", 10000);
        return config;
    }
};

struct LoggingConfig {
    std::string log_level = "info";
    std::string log_format = "text";     // "text" or "json"

    static LoggingConfig from_env() {
        LoggingConfig config;
        config.log_level = get_env_string("LOG_LEVEL", "info");
        config.log_format = get_env_string("LOG_FORMAT", "text");
        return config;
    }
};

struct Config {
    DatabaseConfig database;
    JobQueueConfig queue;
    MonitorConfig monitor;
    WorkerConfig worker;
    LoggingConfig logging;

    static Config load() {
        Config config;
        config.database = DatabaseConfig::from_env();
        config.queue = JobQueueConfig::from_env();
        config.monitor = MonitorConfig::from_env();
        config.worker = WorkerConfig::from_env();
        config.logging = LoggingConfig::from_env();
        return config;
    }

    // Returns the list of problems; empty means the configuration is usable
    std::vector<std::string> validate() const {
        std::vector<std::string> errors;
        std::string error;
        if (!queue.validate(error)) {
            errors.push_back(error);
        }
        if (database.pool_size <= 0) {
            errors.push_back("DB_POOL_SIZE must be > 0");
        }
        if (monitor.reclaim_interval_ms <= 0) {
            errors.push_back("RESQ_RECLAIM_INTERVAL_MS must be > 0");
        }
        if (worker.hostname.empty()) {
            errors.push_back("RESQ_WORKER_HOSTNAME must not be empty");
        }
        if (worker.heartbeat_interval_ms <= 0) {
            errors.push_back("RESQ_WORKER_HEARTBEAT_INTERVAL_MS must be > 0");
        } else if (worker.heartbeat_interval_ms >= queue.heartbeat_timeout_ms) {
            errors.push_back("RESQ_WORKER_HEARTBEAT_INTERVAL_MS must be below RESQ_HEARTBEAT_TIMEOUT_MS");
        }
        if (worker.poll_interval_ms <= 0 || worker.max_poll_interval_ms < worker.poll_interval_ms) {
            errors.push_back("worker poll intervals must be > 0 and max >= base");
        }
        if (worker.backoff_multiplier < 1.0) {
            errors.push_back("RESQ_WORKER_BACKOFF_MULTIPLIER must be >= 1.0");
        }
        return errors;
    }
};

} // namespace resq
