#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "credentials.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from $PLEXMOVER_CONFIG or ~/.plexmover/config.yaml, then apply the
    // environment overlay (.env file + REMOTE_* variables). A missing file is
    // fine as long as the environment defines at least one host.
    static Result<Config> load(const fs::path& env_file = ".env");

    // Load a specific YAML file (no environment overlay)
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (no environment overlay)
    static Result<Config> parse(const std::string& yaml_text);

    // Overlay REMOTE_* / PLEXMOVER_* environment variables onto this config.
    void apply_environment();

    // Check ranges and required fields.
    Result<void> validate() const;

    // Accessors
    const HostCredentialStore& hosts() const { return hosts_; }
    const RunSettings& run() const { return run_; }
    const NotifySettings& notify() const { return notify_; }
    const fs::path& source_path() const { return source_path_; }

    // Mutators used by the CLI and tests
    HostCredentialStore& mutable_hosts() { return hosts_; }
    RunSettings& mutable_run() { return run_; }
    NotifySettings& mutable_notify() { return notify_; }

public:
    Config() = default;

private:
    HostCredentialStore hosts_;
    RunSettings run_;
    NotifySettings notify_;
    fs::path source_path_;
};

// Get paths
fs::path get_config_dir();
fs::path get_config_path();
bool config_exists();

// Create default config (does not overwrite an existing one)
Result<void> create_default_config();

// Load KEY=VALUE lines from a dotenv file into the process environment
// without overriding variables that are already set. Returns the number of
// variables set; a missing file sets none.
int load_env_file(const fs::path& path);

// Parse a batch file:
//   jobs:
//     - source: "Movie.2024.mkv"
//       host: seedbox            # optional, defaults to "default"
//       dest: "films/Movie.2024.mkv"
//       expected_size: 1234
//       sha256: "ab12..."
//       id: "movie"
// Relative destinations are joined to the host's remote_base.
Result<std::vector<TransferJob>> load_batch_file(const fs::path& path, const Config& config);
Result<std::vector<TransferJob>> parse_batch(const std::string& yaml_text, const Config& config);

// One job for `source`, landing as <remote_base>/<filename> on `host_id`.
TransferJob job_for_file(const std::string& source, const std::string& host_id, const Config& config);

NotifyWhen parse_notify_when(const std::string& value);
