#include "job_scheduler.hpp"
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <set>
#include <thread>

using steady = std::chrono::steady_clock;

RunStatus compute_overall_status(const std::vector<TransferResult>& results) {
    size_t ok = 0;
    for (const auto& r : results) {
        if (r.ok()) ok++;
    }
    if (ok == results.size()) return RunStatus::Success;
    if (ok == 0) return RunStatus::Failed;
    return RunStatus::PartialFailure;
}

void assign_job_ids(std::vector<TransferJob>& jobs) {
    std::set<std::string> seen;
    for (size_t i = 0; i < jobs.size(); i++) {
        auto& id = jobs[i].job_id;
        if (id.empty()) id = fmt::format("job-{}", i + 1);
        if (!seen.insert(id).second) {
            std::string unique = fmt::format("{}#{}", id, i + 1);
            while (!seen.insert(unique).second) unique += "'";
            id = unique;
        }
    }
}

static TransferResult not_run_result(const TransferJob& job, TransferStatus status, ErrorKind kind,
                                     const std::string& error) {
    TransferResult r;
    r.job_id = job.job_id;
    r.status = status;
    r.error_kind = kind;
    r.error = error;
    r.attempts = job.attempts;
    return r;
}

JobScheduler::JobScheduler(ConnectionManager& connections, RetryCoordinator& coordinator,
                           const RunSettings& settings, StatusCallback callback)
    : connections_(connections), coordinator_(coordinator), settings_(settings),
      callback_(std::move(callback)) {
}

void JobScheduler::status(const std::string& msg) const {
    if (callback_) callback_(msg);
}

void JobScheduler::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_requested_ = true;
    if (active_token_) active_token_->cancel();
}

RunReport JobScheduler::last_report() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_report_;
}

void JobScheduler::worker_loop(std::vector<TransferJob>& jobs, std::vector<TransferResult>& results,
                               std::atomic<size_t>& next, const CancelToken& run_token,
                               const std::string& run_id) {
    while (true) {
        size_t i = next.fetch_add(1);
        if (i >= jobs.size()) return;
        TransferJob& job = jobs[i];

        if (run_token.interrupted()) {
            ErrorKind kind = run_token.interruption();
            results[i] = not_run_result(job, TransferStatus::Failed, kind,
                                        kind == ErrorKind::Cancelled ? "Cancelled before start"
                                                                     : "Run time budget exhausted before start");
            append_run_log(run_id, fmt::format("{} not started ({})", job.job_id, error_kind_name(kind)));
            continue;
        }

        if (connections_.host_unusable(job.dest_host_id)) {
            results[i] = not_run_result(job, TransferStatus::Skipped, ErrorKind::AuthenticationError,
                                        fmt::format("Host {} is unusable: {}", job.dest_host_id,
                                                    connections_.host_failure(job.dest_host_id)));
            append_run_log(run_id, fmt::format("{} skipped (host {} failed authentication)",
                                               job.job_id, job.dest_host_id));
            status(fmt::format("{} skipped: host {} failed authentication", job.job_id, job.dest_host_id));
            continue;
        }

        results[i].status = TransferStatus::InFlight;
        append_run_log(run_id, fmt::format("{} start {} -> {}:{}", job.job_id, job.source_path,
                                           job.dest_host_id, job.dest_path));
        status(fmt::format("{} -> {}:{}", job.job_id, job.dest_host_id, job.dest_path));

        try {
            results[i] = coordinator_.execute(job, run_token);
        } catch (const std::exception& e) {
            results[i] = not_run_result(job, TransferStatus::Failed, ErrorKind::IOError,
                                        std::string("Internal error: ") + e.what());
        }

        const auto& r = results[i];
        if (r.ok()) {
            append_run_log(run_id, fmt::format("{} {} {} in {} ({} attempt{})", job.job_id,
                                               r.reused ? "reused" : "done",
                                               format_bytes(r.bytes_transferred),
                                               format_elapsed(r.elapsed), r.attempts,
                                               r.attempts == 1 ? "" : "s"));
        } else {
            append_run_log(run_id, fmt::format("{} {} ({}) after {} attempt(s): {}", job.job_id,
                                               transfer_status_name(r.status),
                                               error_kind_name(r.error_kind), r.attempts, r.error));
        }
        status(fmt::format("{} {}", job.job_id, r.ok() ? (r.reused ? "already in place" : "done")
                                                       : transfer_status_name(r.status)));
    }
}

RunReport JobScheduler::run(std::vector<TransferJob> jobs) {
    auto start = steady::now();

    RunReport report;
    report.run_id = generate_run_id();
    report.started_at = now_iso();

    assign_job_ids(jobs);
    std::vector<TransferResult> results(jobs.size());
    for (size_t i = 0; i < jobs.size(); i++) {
        results[i].job_id = jobs[i].job_id;
    }

    CancelToken run_token;
    if (settings_.run_timeout.count() > 0) {
        run_token.set_deadline(steady::now() + settings_.run_timeout);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_token_ = &run_token;
        if (cancel_requested_) run_token.cancel();
    }

    append_run_log(report.run_id, fmt::format("run start: {} job(s), {} worker(s)", jobs.size(),
                                              std::max(1, settings_.scheduler_concurrency)));

    size_t worker_count = std::min<size_t>(static_cast<size_t>(std::max(1, settings_.scheduler_concurrency)),
                                           jobs.size());
    std::atomic<size_t> next{0};
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t w = 0; w < worker_count; w++) {
        workers.emplace_back([&] { worker_loop(jobs, results, next, run_token, report.run_id); });
    }
    for (auto& t : workers) t.join();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_token_ = nullptr;
        cancel_requested_ = false;
    }

    report.jobs = std::move(jobs);
    report.results = std::move(results);
    report.finished_at = now_iso();
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(steady::now() - start);
    report.overall_status = compute_overall_status(report.results);

    append_run_log(report.run_id,
                   fmt::format("run finished: {} ({} ok, {} failed, {} skipped, {}) in {}",
                               run_status_name(report.overall_status),
                               report.count(TransferStatus::Success),
                               report.count(TransferStatus::Failed),
                               report.count(TransferStatus::Skipped),
                               format_bytes(report.total_bytes()), format_elapsed(report.elapsed)));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_report_ = report;
    }
    return report;
}
