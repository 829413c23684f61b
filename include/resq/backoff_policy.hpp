#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace resq {

enum class BackoffFunction {
    Constant,
    Linear,
    Exponential
};

bool try_parse_backoff_function(const std::string& name, BackoffFunction& out);

// Throws std::invalid_argument for unknown names
BackoffFunction parse_backoff_function(const std::string& name);

const char* to_string(BackoffFunction fn);

/**
 * Delay imposed on a failed job before it becomes claimable again.
 *
 * delay(attempt) is monotonically non-decreasing in attempt and never exceeds
 * max_delay:
 *   constant:    base
 *   linear:      base * attempt
 *   exponential: base * 2^(attempt - 1)
 */
class BackoffPolicy {
public:
    BackoffPolicy(BackoffFunction function,
                  std::chrono::milliseconds base_delay,
                  std::chrono::milliseconds max_delay);

    // attempt is the 1-based failure count; values below 1 are treated as 1
    std::chrono::milliseconds delay(int attempt) const;

    // Delays for attempts 1..attempts, in milliseconds. Passed to the database
    // so the retry transition stays a single statement.
    std::vector<int64_t> delay_table(int attempts) const;

    BackoffFunction function() const { return function_; }
    std::chrono::milliseconds base_delay() const { return base_delay_; }
    std::chrono::milliseconds max_delay() const { return max_delay_; }

private:
    BackoffFunction function_;
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
};

} // namespace resq
