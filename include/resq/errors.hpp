#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace resq {

// Failure talking to PostgreSQL (connectivity, contention, timeouts).
// Propagated to the caller of the operation; the claim loop retries with backoff.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message, std::string sqlstate = "")
        : std::runtime_error(message), sqlstate_(std::move(sqlstate)) {}

    const std::string& sqlstate() const { return sqlstate_; }

    // 57014 query_canceled: statement_timeout or PQcancel
    bool is_cancellation() const { return sqlstate_ == "57014"; }

    // 55P03 lock_not_available, 40001 serialization_failure, 40P01 deadlock_detected
    bool is_contention() const {
        return sqlstate_ == "55P03" || sqlstate_ == "40001" || sqlstate_ == "40P01";
    }

private:
    std::string sqlstate_;
};

// A job row was observed in a shape the atomic transitions cannot produce.
// Programming error, not recoverable.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& message)
        : std::logic_error(message) {}
};

} // namespace resq
