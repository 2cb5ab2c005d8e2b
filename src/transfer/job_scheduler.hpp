#pragma once

#include <atomic>
#include <mutex>
#include <vector>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include "connection_manager.hpp"
#include "retry_coordinator.hpp"

// Success if every result succeeded (or there are none), Failed if none
// did, PartialFailure otherwise.
RunStatus compute_overall_status(const std::vector<TransferResult>& results);

// Give every job a unique id: missing ids become "job-<n>" (1-based
// submission position), repeats get "#<n>" appended.
void assign_job_ids(std::vector<TransferJob>& jobs);

// Runs a batch over a bounded pool of worker threads. Each worker takes the
// next unstarted job and runs its whole retry sequence before taking
// another. Results are stored by submission index, so the report is in
// submission order regardless of completion order.
//
// run() never throws: N jobs in, N results out.
class JobScheduler {
public:
    JobScheduler(ConnectionManager& connections, RetryCoordinator& coordinator,
                 const RunSettings& settings, StatusCallback callback = nullptr);

    RunReport run(std::vector<TransferJob> jobs);

    // Copy of the most recent finished run's report.
    RunReport last_report() const;

    // Cancel the run in progress (or the next one, if none is running).
    // Safe to call from any thread.
    void cancel();

private:
    ConnectionManager& connections_;
    RetryCoordinator& coordinator_;
    RunSettings settings_;
    StatusCallback callback_;

    mutable std::mutex mutex_;
    CancelToken* active_token_ = nullptr;
    bool cancel_requested_ = false;
    RunReport last_report_;

    void worker_loop(std::vector<TransferJob>& jobs, std::vector<TransferResult>& results,
                     std::atomic<size_t>& next, const CancelToken& run_token,
                     const std::string& run_id);

    void status(const std::string& msg) const;
};
