#include "plexmover_cli.hpp"
#include "report_view.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <notify/notifier.hpp>
#include <platform/platform.hpp>
#include <ssh/session.hpp>
#include <transfer/connection_manager.hpp>
#include <transfer/job_scheduler.hpp>
#include <transfer/retry_coordinator.hpp>
#include <transfer/transfer_engine.hpp>
#include <fmt/format.h>
#include <iostream>
#include <mutex>

// ── Interrupt plumbing ─────────────────────────────────────

// Status lines arrive from worker threads and the interrupt watcher
static std::mutex g_output_mutex;

static std::mutex g_scheduler_mutex;
static JobScheduler* g_active_scheduler = nullptr;
static std::function<void(const std::string&)> g_announce;

ActiveRunGuard::ActiveRunGuard(JobScheduler& scheduler, std::function<void(const std::string&)> announce) {
    std::lock_guard<std::mutex> lock(g_scheduler_mutex);
    g_active_scheduler = &scheduler;
    g_announce = std::move(announce);
}

ActiveRunGuard::~ActiveRunGuard() {
    std::lock_guard<std::mutex> lock(g_scheduler_mutex);
    g_active_scheduler = nullptr;
    g_announce = nullptr;
}

bool cancel_active_run() {
    std::lock_guard<std::mutex> lock(g_scheduler_mutex);
    if (!g_active_scheduler) return false;
    if (g_announce) g_announce("\n" + theme::info("Interrupted, cancelling transfers..."));
    g_active_scheduler->cancel();
    return true;
}

// ── PlexmoverCLI ───────────────────────────────────────────

void PlexmoverCLI::print(const std::string& text) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << text << std::flush;
}

bool PlexmoverCLI::require_config() {
    if (config_) return true;

    auto result = Config::load();
    if (result.is_err()) {
        print(theme::fail(result.error));
        if (!config_exists()) {
            print(theme::step("Run 'plexmover init' to create " + get_config_path().string()));
        }
        return false;
    }
    config_ = result.value;
    return true;
}

int PlexmoverCLI::run_batch(const std::string& batch_path) {
    print(theme::banner());
    if (!require_config()) return 1;

    auto jobs = load_batch_file(batch_path, *config_);
    if (jobs.is_err()) {
        print(theme::fail(jobs.error));
        return 1;
    }
    if (jobs.value.empty()) {
        print(theme::info("Batch has no jobs"));
    }
    return execute(std::move(jobs.value));
}

int PlexmoverCLI::run_send(const std::string& host_id, const std::vector<std::string>& files) {
    print(theme::banner());
    if (files.empty()) {
        print(theme::fail("No files given."));
        print(theme::step("Usage: plexmover send [--host <id>] <file>..."));
        return 1;
    }
    if (!require_config()) return 1;

    std::vector<TransferJob> jobs;
    for (const auto& f : files) {
        jobs.push_back(job_for_file(f, host_id, *config_));
    }
    return execute(std::move(jobs));
}

int PlexmoverCLI::run_hosts() {
    if (!require_config()) return 1;
    print(render_hosts(config_->hosts(), config_->run().per_host_concurrency));
    print("\n");
    return 0;
}

int PlexmoverCLI::run_init() {
    if (config_exists()) {
        print(theme::info("Config already exists: " + get_config_path().string()));
        return 0;
    }
    auto result = create_default_config();
    if (result.is_err()) {
        print(theme::fail(result.error));
        return 1;
    }
    print(theme::ok("Wrote " + get_config_path().string()));
    print(theme::step("Add your hosts, then run 'plexmover hosts' to check them"));
    return 0;
}

int PlexmoverCLI::execute(std::vector<TransferJob> jobs) {
    const RunSettings& settings = config_->run();

    print(theme::section("Transfers"));
    print(theme::kv("Jobs", std::to_string(jobs.size())));
    print(theme::kv("Workers", std::to_string(settings.scheduler_concurrency)));
    print(theme::kv("Attempts", std::to_string(settings.max_attempts)));
    print("\n");

    auto status = [this](const std::string& msg) { print(theme::log(msg)); };

    SshSessionFactory factory([](const std::string& msg) { plexmover_log(msg); });
    ConnectionManager connections(config_->hosts(), settings, factory);
    TransferEngine engine(settings, status);
    RetryCoordinator coordinator(connections, engine, settings);
    JobScheduler scheduler(connections, coordinator, settings, status);

    RunReport report;
    {
        ActiveRunGuard guard(scheduler, [this](const std::string& text) { print(text); });
        report = scheduler.run(std::move(jobs));
    }
    connections.close_all();

    print(render_report(report));
    print(theme::kv("Log", run_log_path(report.run_id)));

    deliver_report(report);
    print("\n");
    return exit_code_for(report.overall_status);
}

void PlexmoverCLI::deliver_report(const RunReport& report) {
    const NotifySettings& notify = config_->notify();
    if (notify.webhook_url.empty() || !should_notify(notify.when, report)) return;

    WebhookNotifier notifier(notify);
    auto result = notifier.notify(report);
    if (result.is_err()) {
        // Delivery problems never change the run's outcome
        print(theme::fail("Webhook: " + result.error));
        append_run_log(report.run_id, "webhook failed: " + result.error);
    } else {
        print(theme::ok("Webhook delivered"));
    }
}

// Installed once from main(); the handler only reaches the scheduler that
// is running at the time.
void install_interrupt_handler() {
    platform::on_interrupt([] { cancel_active_run(); });
}
