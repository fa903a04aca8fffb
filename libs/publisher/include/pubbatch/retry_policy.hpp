// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file retry_policy.hpp
/// @brief Bounded exponential backoff for retryable send failures

#include <chrono>
#include <cstdint>

namespace pubbatch {

/// Retry budget for a single batch.
///
/// Attempt 1 is the initial send. After a retryable failure of attempt n
/// (n < max_attempts) the batch is re-sent after backoff_for(n). A batch
/// failing attempt max_attempts is dropped.
struct RetryPolicy {
    /// Total send attempts per batch, including the first
    uint32_t max_attempts = 5;

    /// Delay before the second attempt
    std::chrono::milliseconds initial_backoff{100};

    /// Backoff ceiling
    std::chrono::milliseconds max_backoff{5000};

    /// Growth factor between consecutive backoffs
    double backoff_multiplier = 2.0;

    /// Delay after failed attempt `attempt` (1-based) before the next one
    std::chrono::milliseconds backoff_for(uint32_t attempt) const;

    /// Sum of every backoff a batch can wait through
    std::chrono::milliseconds total_backoff() const;

    /// @throws ConfigError on a zero budget, negative delays or multiplier < 1
    void validate() const;
};

}  // namespace pubbatch
