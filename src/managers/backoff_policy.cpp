#include "resq/backoff_policy.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace resq {

bool try_parse_backoff_function(const std::string& name, BackoffFunction& out) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "exponential") {
        out = BackoffFunction::Exponential;
    } else if (lowered == "linear") {
        out = BackoffFunction::Linear;
    } else if (lowered == "constant") {
        out = BackoffFunction::Constant;
    } else {
        return false;
    }
    return true;
}

BackoffFunction parse_backoff_function(const std::string& name) {
    BackoffFunction fn;
    if (!try_parse_backoff_function(name, fn)) {
        throw std::invalid_argument("Unknown backoff function: " + name);
    }
    return fn;
}

const char* to_string(BackoffFunction fn) {
    switch (fn) {
        case BackoffFunction::Constant: return "constant";
        case BackoffFunction::Linear: return "linear";
        case BackoffFunction::Exponential: return "exponential";
    }
    return "unknown";
}

BackoffPolicy::BackoffPolicy(BackoffFunction function,
                             std::chrono::milliseconds base_delay,
                             std::chrono::milliseconds max_delay)
    : function_(function), base_delay_(base_delay), max_delay_(max_delay) {
    if (base_delay_.count() < 0) {
        throw std::invalid_argument("Backoff base delay must not be negative");
    }
    if (max_delay_ < base_delay_) {
        throw std::invalid_argument("Backoff max delay must be >= base delay");
    }
}

std::chrono::milliseconds BackoffPolicy::delay(int attempt) const {
    if (attempt < 1) attempt = 1;

    const int64_t base = base_delay_.count();
    const int64_t cap = max_delay_.count();
    int64_t value = base;

    switch (function_) {
        case BackoffFunction::Constant:
            break;
        case BackoffFunction::Linear:
            // Overflow check before multiplying
            if (base != 0 && attempt > cap / base) {
                value = cap;
            } else {
                value = base * attempt;
            }
            break;
        case BackoffFunction::Exponential:
            for (int i = 1; i < attempt && value < cap; ++i) {
                value *= 2;
            }
            if (base == 0) value = 0;
            break;
    }

    return std::chrono::milliseconds(std::min(value, cap));
}

std::vector<int64_t> BackoffPolicy::delay_table(int attempts) const {
    std::vector<int64_t> table;
    if (attempts <= 0) return table;

    table.reserve(static_cast<size_t>(attempts));
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        table.push_back(delay(attempt).count());
    }
    return table;
}

} // namespace resq
