#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>

// Thin front end over the orchestrator. Each run_* returns the process exit
// code.
class PlexmoverCLI {
public:
    PlexmoverCLI() = default;

    int run_batch(const std::string& batch_path);
    int run_send(const std::string& host_id, const std::vector<std::string>& files);
    int run_hosts();
    int run_init();

private:
    std::optional<Config> config_;

    bool require_config();
    int execute(std::vector<TransferJob> jobs);
    void deliver_report(const RunReport& report);
    void print(const std::string& text);
};

class JobScheduler;

// Registers a scheduler as the interrupt target for its lifetime. `announce`
// prints the cancellation notice through the caller's output path.
class ActiveRunGuard {
public:
    ActiveRunGuard(JobScheduler& scheduler, std::function<void(const std::string&)> announce);
    ~ActiveRunGuard();

    ActiveRunGuard(const ActiveRunGuard&) = delete;
    ActiveRunGuard& operator=(const ActiveRunGuard&) = delete;
};

// Cancel the registered run, if any. Returns false when nothing is running.
bool cancel_active_run();

// SIGINT/SIGTERM cancel the run in progress.
void install_interrupt_handler();
