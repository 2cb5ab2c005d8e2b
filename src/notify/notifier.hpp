#pragma once

#include <string>
#include <core/types.hpp>

namespace Json { class Value; }

// Delivers a finished run's report somewhere outside the process.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual Result<void> notify(const RunReport& report) = 0;
};

// POSTs the report as JSON to an HTTP(S) endpoint.
class WebhookNotifier : public Notifier {
public:
    explicit WebhookNotifier(const NotifySettings& settings);

    Result<void> notify(const RunReport& report) override;

private:
    NotifySettings settings_;
};

// Whether a report should be delivered under the configured policy.
// Failure means "anything other than overall Success".
bool should_notify(NotifyWhen when, const RunReport& report);

// Wire shape:
// {run_id, started_at, finished_at, elapsed_ms, overall_status,
//  totals{jobs, succeeded, failed, skipped, bytes},
//  results[{job_id, source, host, dest, status, bytes, elapsed_ms, attempts,
//           reused, error_kind?, error?}]}
Json::Value report_to_json(const RunReport& report);
std::string report_to_json_string(const RunReport& report);
