#include "report_view.hpp"
#include "theme.hpp"
#include <core/time_utils.hpp>
#include <fmt/format.h>

std::string render_report(const RunReport& report) {
    std::string out = theme::section("Results");

    for (size_t i = 0; i < report.results.size(); i++) {
        const auto& r = report.results[i];
        std::string target = i < report.jobs.size()
            ? report.jobs[i].dest_host_id + ":" + report.jobs[i].dest_path
            : "";

        switch (r.status) {
            case TransferStatus::Success:
                out += theme::ok(fmt::format("{}  {}  {}{}", r.job_id, target,
                                             theme::dim(format_bytes(r.bytes_transferred) + " in " +
                                                        format_elapsed(r.elapsed)),
                                             r.reused ? theme::dim("  (already in place)") : ""));
                break;
            case TransferStatus::Skipped:
                out += theme::skip(fmt::format("{}  {}  {}", r.job_id, target, theme::dim(r.error)));
                break;
            default:
                out += theme::fail(fmt::format("{}  {}  {} after {} attempt{}: {}", r.job_id, target,
                                               error_kind_name(r.error_kind), r.attempts,
                                               r.attempts == 1 ? "" : "s", r.error));
                if (r.staging_left) {
                    out += theme::step("staging file left at " + target + ".partial");
                }
                break;
        }
    }

    out += "\n";
    out += theme::kv("Run", report.run_id);
    out += theme::kv("Status", theme::run_status(report.overall_status));
    out += theme::kv("Jobs", fmt::format("{} ok, {} failed, {} skipped",
                                         report.count(TransferStatus::Success),
                                         report.count(TransferStatus::Failed),
                                         report.count(TransferStatus::Skipped)));
    out += theme::kv("Moved", format_bytes(report.total_bytes()) + "  " +
                              theme::dim(format_rate(report.total_bytes(), report.elapsed)));
    out += theme::kv("Elapsed", format_elapsed(report.elapsed));
    return out;
}

std::string render_hosts(const HostCredentialStore& hosts, int default_limit) {
    std::string out = theme::section("Hosts");
    if (hosts.empty()) {
        out += theme::info("No hosts configured");
        return out;
    }

    for (const auto& id : hosts.host_ids()) {
        const HostCredential* h = hosts.find(id);
        std::string auth = h->ssh_key_path ? "key " + *h->ssh_key_path
                         : (h->password.empty() ? "none" : "password");
        out += theme::kv(id, fmt::format("{}  {}  sessions={}  {}", describe_host(*h),
                                         h->remote_base.empty() ? "-" : h->remote_base,
                                         hosts.session_limit(id, default_limit),
                                         theme::dim(auth)));
    }
    return out;
}

int exit_code_for(RunStatus status) {
    switch (status) {
        case RunStatus::Success:        return 0;
        case RunStatus::PartialFailure: return 2;
        case RunStatus::Failed:         return 1;
    }
    return 1;
}
