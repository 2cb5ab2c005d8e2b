#include "retry_coordinator.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

using steady = std::chrono::steady_clock;

RetryPolicy RetryPolicy::from_settings(const RunSettings& settings) {
    RetryPolicy p;
    p.max_attempts = std::max(1, settings.max_attempts);
    p.base_delay = settings.backoff_base;
    p.max_delay = settings.backoff_max;
    p.jitter = std::clamp(settings.backoff_jitter, 0.0, 1.0);
    p.attempt_timeout = settings.job_timeout;
    return p;
}

bool is_retryable(ErrorKind kind, bool permanent) {
    switch (kind) {
        case ErrorKind::ConnectionLost:
        case ErrorKind::SizeMismatch:
        case ErrorKind::ChecksumMismatch:
        case ErrorKind::Timeout:
            return true;
        case ErrorKind::IOError:
            return !permanent;
        default:
            return false;
    }
}

static TransferResult failed_result(const TransferJob& job, ErrorKind kind, const std::string& error,
                                    bool permanent = false) {
    TransferResult r;
    r.job_id = job.job_id;
    r.status = TransferStatus::Failed;
    r.error_kind = kind;
    r.error = error;
    r.permanent = permanent;
    r.attempts = job.attempts;
    return r;
}

RetryCoordinator::RetryCoordinator(ConnectionManager& connections, TransferEngine& engine,
                                   const RunSettings& settings, Clock& clock, uint64_t seed)
    : connections_(connections), engine_(engine), policy_(RetryPolicy::from_settings(settings)),
      clock_(clock), rng_(seed) {
}

std::chrono::milliseconds RetryCoordinator::backoff_delay(int attempt) {
    double base = static_cast<double>(policy_.base_delay.count());
    double cap = static_cast<double>(policy_.max_delay.count());
    double delay = std::min(cap, base * std::pow(2.0, std::max(0, attempt - 1)));

    if (policy_.jitter > 0.0) {
        std::uniform_real_distribution<double> dist(1.0 - policy_.jitter, 1.0 + policy_.jitter);
        std::lock_guard<std::mutex> lock(rng_mutex_);
        delay *= dist(rng_);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::max(0.0, delay)));
}

TransferResult RetryCoordinator::attempt_once(TransferJob& job, const CancelToken& attempt_token) {
    auto pre = engine_.precheck(job);
    if (pre.is_err()) return failed_result(job, pre.kind, pre.error);

    auto acquired = connections_.acquire(job.dest_host_id, attempt_token);
    if (acquired.is_err()) {
        TransferResult r = failed_result(job, acquired.kind, acquired.error, acquired.permanent);
        if (acquired.kind == ErrorKind::AuthenticationError) {
            r.status = TransferStatus::Skipped;
        }
        return r;
    }

    PooledSession* pooled = acquired.value;
    TransferResult r = engine_.transfer(job, pooled->remote(), attempt_token);

    bool suspect = r.error_kind == ErrorKind::ConnectionLost ||
                   r.error_kind == ErrorKind::Timeout ||
                   r.error_kind == ErrorKind::Cancelled ||
                   !pooled->remote().is_alive();
    if (suspect) {
        connections_.invalidate(pooled);
    } else {
        connections_.release(pooled);
    }
    return r;
}

void RetryCoordinator::cleanup_after_failure(const TransferJob& job, TransferResult& result) {
    CancelToken cleanup(nullptr, steady::now() + std::chrono::seconds(CLEANUP_TIMEOUT_SECS));
    auto acquired = connections_.acquire(job.dest_host_id, cleanup);
    if (acquired.is_err()) {
        plexmover_log(fmt::format("[{}] no session for staging cleanup: {}", job.job_id, acquired.error));
        return;
    }

    PooledSession* pooled = acquired.value;
    auto removed = engine_.cleanup_staging(job, pooled->remote(), cleanup);
    if (removed.is_ok()) {
        result.staging_left = false;
        connections_.release(pooled);
    } else {
        connections_.invalidate(pooled);
    }
}

TransferResult RetryCoordinator::execute(TransferJob& job, const CancelToken& run_token) {
    auto start = steady::now();
    TransferResult last;

    while (true) {
        if (run_token.interrupted()) {
            ErrorKind kind = run_token.interruption();
            std::string why = kind == ErrorKind::Cancelled ? "Run cancelled" : "Run time budget exhausted";
            if (job.attempts > 0) why += " after: " + last.error;
            bool staging_left = last.staging_left;
            last = failed_result(job, kind, why);
            last.staging_left = staging_left;
            break;
        }

        job.attempts++;
        std::optional<CancelToken::time_point> deadline;
        if (policy_.attempt_timeout.count() > 0) deadline = steady::now() + policy_.attempt_timeout;
        CancelToken attempt_token(&run_token, deadline);

        last = attempt_once(job, attempt_token);
        last.attempts = job.attempts;

        if (last.ok() || last.status == TransferStatus::Skipped) break;
        if (!is_retryable(last.error_kind, last.permanent)) break;
        if (last.error_kind == ErrorKind::Timeout && run_token.interrupted()) break;
        if (job.attempts >= policy_.max_attempts) break;

        auto delay = backoff_delay(job.attempts);
        plexmover_log(fmt::format("[{}] attempt {}/{} failed ({}), retrying in {}", job.job_id,
                                  job.attempts, policy_.max_attempts,
                                  error_kind_name(last.error_kind), format_elapsed(delay)));

        if (!clock_.sleep_for(delay, run_token)) {
            ErrorKind kind = run_token.interruption();
            bool staging_left = last.staging_left;
            last = failed_result(job, kind == ErrorKind::None ? ErrorKind::Cancelled : kind,
                                 "Interrupted during backoff after: " + last.error);
            last.staging_left = staging_left;
            break;
        }
    }

    // Cleanup runs on its own token, so a cancelled run still removes its staging file
    if (!last.ok() && last.staging_left) {
        cleanup_after_failure(job, last);
    }

    last.job_id = job.job_id;
    last.attempts = job.attempts;
    last.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(steady::now() - start);
    return last;
}
