#pragma once

#include <string>
#include <core/types.hpp>
#include <core/credentials.hpp>

// Per-job lines plus a totals block for a finished run.
std::string render_report(const RunReport& report);

// One line per configured host; secrets are never shown.
std::string render_hosts(const HostCredentialStore& hosts, int default_limit);

// Process exit code for a run: 0 Success, 2 PartialFailure, 1 Failed.
int exit_code_for(RunStatus status);
