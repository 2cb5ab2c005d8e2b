#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <core/clock.hpp>
#include "connection_manager.hpp"
#include "transfer_engine.hpp"

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{30000};
    double jitter = 0.2;
    std::chrono::seconds attempt_timeout{0};   // 0 = none

    static RetryPolicy from_settings(const RunSettings& settings);
};

// Retryable: ConnectionLost, non-permanent IOError, SizeMismatch,
// ChecksumMismatch, Timeout. Everything else ends the job.
bool is_retryable(ErrorKind kind, bool permanent);

// Runs one job's attempts: acquire -> transfer -> release/invalidate, with
// jittered exponential backoff between attempts. Shared by all workers.
class RetryCoordinator {
public:
    RetryCoordinator(ConnectionManager& connections, TransferEngine& engine,
                     const RunSettings& settings, Clock& clock = SystemClock::instance(),
                     uint64_t seed = std::random_device{}());

    // Always returns a final result; `job.attempts` is updated in place.
    TransferResult execute(TransferJob& job, const CancelToken& run_token);

    // Delay before attempt `attempt + 1`:
    // min(max, base * 2^(attempt-1)) scaled by a random factor in [1-jitter, 1+jitter].
    std::chrono::milliseconds backoff_delay(int attempt);

    const RetryPolicy& policy() const { return policy_; }

private:
    ConnectionManager& connections_;
    TransferEngine& engine_;
    RetryPolicy policy_;
    Clock& clock_;
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;

    TransferResult attempt_once(TransferJob& job, const CancelToken& attempt_token);
    void cleanup_after_failure(const TransferJob& job, TransferResult& result);
};
