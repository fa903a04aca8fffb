// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "pubbatch/retry_policy.hpp"
#include "pubbatch/errors.hpp"

#include <algorithm>
#include <cmath>

namespace pubbatch {

std::chrono::milliseconds RetryPolicy::backoff_for(uint32_t attempt) const {
    if (attempt < 1) {
        attempt = 1;
    }

    double delay = static_cast<double>(initial_backoff.count()) *
                   std::pow(backoff_multiplier, static_cast<double>(attempt - 1));
    double ceiling = static_cast<double>(max_backoff.count());
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, ceiling)));
}

std::chrono::milliseconds RetryPolicy::total_backoff() const {
    std::chrono::milliseconds total{0};
    for (uint32_t attempt = 1; attempt < max_attempts; ++attempt) {
        total += backoff_for(attempt);
    }
    return total;
}

void RetryPolicy::validate() const {
    if (max_attempts < 1) {
        throw ConfigError("retry max_attempts must be >= 1");
    }
    if (initial_backoff.count() < 0 || max_backoff.count() < 0) {
        throw ConfigError("retry backoff must not be negative");
    }
    if (max_backoff < initial_backoff) {
        throw ConfigError("retry max_backoff must be >= initial_backoff");
    }
    if (backoff_multiplier < 1.0) {
        throw ConfigError("retry backoff_multiplier must be >= 1.0");
    }
}

}  // namespace pubbatch
