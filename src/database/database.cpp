#include "resq/database.hpp"
#include "resq/errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <chrono>

namespace resq {

// DatabaseConnection Implementation
DatabaseConnection::DatabaseConnection(const std::string& connection_string,
                                       int statement_timeout_ms,
                                       int lock_timeout_ms,
                                       int idle_in_transaction_timeout_ms)
    : conn_(nullptr), cancel_(nullptr) {
    conn_ = PQconnectdb(connection_string.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw StoreError("Failed to connect to database: " + error, "08001");
    }

    PQsetClientEncoding(conn_, "UTF8");

    // Timeouts are applied with SET so they also work behind PgBouncer
    std::string set_timeouts =
        "SET statement_timeout = " + std::to_string(statement_timeout_ms) + "; " +
        "SET lock_timeout = " + std::to_string(lock_timeout_ms) + "; " +
        "SET idle_in_transaction_session_timeout = " + std::to_string(idle_in_transaction_timeout_ms) + ";";

    PGresult* result = PQexec(conn_, set_timeouts.c_str());
    if (PQresultStatus(result) != PGRES_COMMAND_OK) {
        std::string error = PQerrorMessage(conn_);
        PQclear(result);
        PQfinish(conn_);
        conn_ = nullptr;
        throw StoreError("Failed to set timeout parameters: " + error);
    }
    PQclear(result);

    // Created up front: PQcancel on this object is thread-safe, PQgetCancel
    // on a connection busy in another thread is not
    cancel_ = PQgetCancel(conn_);
}

DatabaseConnection::~DatabaseConnection() {
    if (cancel_) {
        PQfreeCancel(cancel_);
    }
    if (conn_) {
        PQfinish(conn_);
    }
}

DatabaseConnection::DatabaseConnection(DatabaseConnection&& other) noexcept
    : conn_(other.conn_), cancel_(other.cancel_) {
    other.conn_ = nullptr;
    other.cancel_ = nullptr;
}

DatabaseConnection& DatabaseConnection::operator=(DatabaseConnection&& other) noexcept {
    if (this != &other) {
        if (cancel_) PQfreeCancel(cancel_);
        if (conn_) PQfinish(conn_);
        conn_ = other.conn_;
        cancel_ = other.cancel_;
        other.conn_ = nullptr;
        other.cancel_ = nullptr;
    }
    return *this;
}

bool DatabaseConnection::is_valid() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

PGresult* DatabaseConnection::exec(const std::string& query) {
    if (!is_valid()) return nullptr;
    return PQexec(conn_, query.c_str());
}

PGresult* DatabaseConnection::exec_params(const std::string& query, const std::vector<std::string>& params) {
    if (!is_valid()) return nullptr;

    std::vector<const char*> param_values;
    param_values.reserve(params.size());

    for (const auto& param : params) {
        param_values.push_back(param.c_str());
    }

    return PQexecParams(conn_, query.c_str(), static_cast<int>(params.size()),
                        nullptr, param_values.data(), nullptr, nullptr, 0);
}

bool DatabaseConnection::begin_transaction() {
    auto result = QueryResult(exec("BEGIN"));
    return result.is_success();
}

bool DatabaseConnection::commit_transaction() {
    auto result = QueryResult(exec("COMMIT"));
    return result.is_success();
}

bool DatabaseConnection::rollback_transaction() {
    auto result = QueryResult(exec("ROLLBACK"));
    return result.is_success();
}

bool DatabaseConnection::cancel() {
    if (!cancel_) return false;

    char errbuf[256] = {0};
    if (PQcancel(cancel_, errbuf, sizeof(errbuf)) != 1) {
        spdlog::warn("Failed to send cancel request: {}", errbuf);
        return false;
    }
    return true;
}

std::string DatabaseConnection::last_error() const {
    return conn_ ? PQerrorMessage(conn_) : "connection closed";
}

// DatabasePool Implementation
DatabasePool::DatabasePool(const std::string& connection_string,
                           size_t pool_size,
                           int acquisition_timeout_ms,
                           int statement_timeout_ms,
                           int lock_timeout_ms,
                           int idle_in_transaction_timeout_ms)
    : available_connections_(), mutex_(), condition_(),
      connection_string_(connection_string),
      pool_size_(pool_size),
      current_size_(0),
      acquisition_timeout_ms_(acquisition_timeout_ms),
      statement_timeout_ms_(statement_timeout_ms),
      lock_timeout_ms_(lock_timeout_ms),
      idle_in_transaction_timeout_ms_(idle_in_transaction_timeout_ms) {

    if (pool_size_ == 0) {
        throw std::invalid_argument("Database pool size must be > 0");
    }

    // Pre-populate the pool
    for (size_t i = 0; i < pool_size_; ++i) {
        try {
            auto conn = create_connection();
            if (conn && conn->is_valid()) {
                available_connections_.push(std::move(conn));
                ++current_size_;
            }
        } catch (const std::exception& e) {
            spdlog::error("Failed to create initial database connection: {}", e.what());
        }
    }

    if (current_size_ == 0) {
        throw StoreError("Failed to create any database connections", "08001");
    }

    spdlog::info("Database pool initialized with {}/{} connections (acquisition timeout: {}ms, statement timeout: {}ms)",
                 current_size_, pool_size_, acquisition_timeout_ms_, statement_timeout_ms_);
}

DatabasePool::~DatabasePool() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!available_connections_.empty()) {
        available_connections_.pop();
    }
}

std::unique_ptr<DatabaseConnection> DatabasePool::create_connection() {
    return std::make_unique<DatabaseConnection>(connection_string_,
                                                statement_timeout_ms_,
                                                lock_timeout_ms_,
                                                idle_in_transaction_timeout_ms_);
}

std::unique_ptr<DatabaseConnection> DatabasePool::get_connection() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!condition_.wait_for(lock, std::chrono::milliseconds(acquisition_timeout_ms_),
                             [this] { return !available_connections_.empty(); })) {
        const std::string timeout_message = "Database connection pool timeout (waited " +
                                            std::to_string(acquisition_timeout_ms_) + "ms)";
        if (current_size_ >= pool_size_) {
            spdlog::warn("Pool exhausted ({}/{} connections checked out)", current_size_, pool_size_);
            throw StoreError(timeout_message, "08006");
        }

        // Pool shrunk by a database outage: take the free slot so the pool
        // recovers once PostgreSQL is back
        size_t new_size = ++current_size_;
        lock.unlock();
        try {
            auto new_conn = create_connection();
            spdlog::info("Recreated connection after timeout, pool now {}/{}", new_size, pool_size_);
            return new_conn;
        } catch (const std::exception& e) {
            spdlog::error("Failed to create connection on timeout: {}", e.what());
            lock.lock();
            --current_size_;
            throw StoreError(timeout_message, "08006");
        }
    }

    auto conn = std::move(available_connections_.front());
    available_connections_.pop();

    if (!conn->is_valid()) {
        spdlog::warn("Invalid connection found in pool, replacing it");
        --current_size_;

        lock.unlock();
        std::unique_ptr<DatabaseConnection> new_conn;
        try {
            new_conn = create_connection();
        } catch (const std::exception& e) {
            spdlog::error("Exception creating replacement connection: {}", e.what());
            throw;
        }
        lock.lock();

        ++current_size_;
        return new_conn;
    }

    return conn;
}

void DatabasePool::return_connection(std::unique_ptr<DatabaseConnection> conn) {
    if (!conn) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (conn->is_valid()) {
        available_connections_.push(std::move(conn));

        // Refill after an outage shrank the pool
        if (current_size_ < pool_size_) {
            size_t to_create = pool_size_ - current_size_;
            spdlog::info("Pool below target ({}/{}), attempting to create {} connections",
                         current_size_, pool_size_, to_create);

            for (size_t i = 0; i < to_create; ++i) {
                try {
                    auto new_conn = create_connection();
                    available_connections_.push(std::move(new_conn));
                    ++current_size_;
                } catch (const std::exception& e) {
                    spdlog::debug("Failed to refill pool: {}", e.what());
                    break;
                }
            }
        }
        condition_.notify_all();
    } else {
        spdlog::warn("Returned invalid connection to pool, attempting to create replacement");
        --current_size_;

        try {
            auto new_conn = create_connection();
            available_connections_.push(std::move(new_conn));
            ++current_size_;
            spdlog::info("Successfully replaced invalid connection, pool at {}/{}", current_size_, pool_size_);
        } catch (const std::exception& e) {
            spdlog::error("Exception creating replacement connection: {} - pool size now {}/{}",
                          e.what(), current_size_, pool_size_);
        }
        condition_.notify_one();
    }
}

PGresult* DatabasePool::query(const std::string& sql) {
    ScopedConnection conn(this);
    return conn->exec(sql);
}

PGresult* DatabasePool::query_params(const std::string& sql, const std::vector<std::string>& params) {
    ScopedConnection conn(this);
    return conn->exec_params(sql, params);
}

size_t DatabasePool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_size_;
}

size_t DatabasePool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_connections_.size();
}

// ScopedConnection Implementation
ScopedConnection::ScopedConnection(DatabasePool* pool) : pool_(pool) {
    if (!pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
    conn_ = pool_->get_connection();
}

ScopedConnection::~ScopedConnection() {
    if (pool_ && conn_) {
        pool_->return_connection(std::move(conn_));
    }
}

// Transaction Implementation
Transaction::Transaction(DatabaseConnection* conn) : conn_(conn), active_(false) {
    if (!conn_ || !conn_->begin_transaction()) {
        throw StoreError("Failed to begin transaction: " +
                         (conn_ ? conn_->last_error() : std::string("no connection")));
    }
    active_ = true;
}

Transaction::~Transaction() {
    if (active_ && conn_) {
        if (!conn_->rollback_transaction()) {
            spdlog::warn("Rollback failed: {}", conn_->last_error());
        }
    }
}

void Transaction::commit() {
    if (!active_) return;
    active_ = false;
    if (!conn_->commit_transaction()) {
        throw StoreError("Failed to commit transaction: " + conn_->last_error());
    }
}

void Transaction::rollback() {
    if (!active_) return;
    active_ = false;
    if (!conn_->rollback_transaction()) {
        throw StoreError("Failed to roll back transaction: " + conn_->last_error());
    }
}

// QueryResult Implementation
int64_t QueryResult::get_int64(int row, const std::string& field_name, int64_t default_value) const {
    if (is_null(row, field_name)) return default_value;
    std::string value = get_value(row, field_name);
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        throw StoreError("Column '" + field_name + "' is not an integer: " + value);
    }
}

bool QueryResult::get_bool(int row, const std::string& field_name) const {
    std::string value = get_value(row, field_name);
    return value == "t" || value == "true";
}

std::string QueryResult::sqlstate() const {
    if (!result_) return "";
    const char* state = PQresultErrorField(result_, PG_DIAG_SQLSTATE);
    return state ? std::string(state) : "";
}

void QueryResult::throw_if_failed(const std::string& what) const {
    if (is_success()) return;
    throw StoreError(what + ": " + error_message(), sqlstate());
}

} // namespace resq
