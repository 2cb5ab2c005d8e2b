#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <cstdlib>
#include <set>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    return platform::home_dir() / ".plexmover";
}

fs::path get_config_path() {
    const char* override_path = std::getenv("PLEXMOVER_CONFIG");
    if (override_path && *override_path) {
        return fs::path(override_path);
    }
    return get_config_dir() / "config.yaml";
}

bool config_exists() {
    return fs::exists(get_config_path());
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# plexmover configuration
# Hosts that files can be sent to. REMOTE_HOST / REMOTE_USERNAME / REMOTE_PASSWORD /
# REMOTE_PORT / REMOTE_PATH_BASE in the environment (or .env) define a host named "default".

# Uncomment and fill in to add a host:
hosts:
#  seedbox:
#    address: "seedbox.example.net"
#    port: 22
#    user: "media"
#    password: ""                # or key_path below
#    key_path: "~/.ssh/id_ed25519"
#    key_passphrase: ""
#    max_sessions: 2             # overrides run.per_host_concurrency for this host
#    remote_base: "/home/media/watch"
#    timeout: 30

run:
  max_attempts: 3
  per_host_concurrency: 2
  scheduler_concurrency: 4
  session_idle_ttl: 60           # seconds
  job_timeout: 1800              # seconds per attempt, 0 = none
  run_timeout: 0                 # seconds for the whole run, 0 = none
  backoff_base_ms: 500
  backoff_max_ms: 30000
  backoff_jitter: 0.2
  verify_checksum: true
  skip_identical: true

notify:
  webhook_url: ""
  when: "always"                 # always | failure | never
  timeout: 10
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

NotifyWhen parse_notify_when(const std::string& value) {
    if (value == "failure" || value == "on_failure") return NotifyWhen::Failure;
    if (value == "never" || value == "off") return NotifyWhen::Never;
    return NotifyWhen::Always;
}

static HostCredential parse_host_config(const std::string& host_id, const YAML::Node& node) {
    HostCredential host;
    host.host_id = host_id;
    host.address = node["address"].as<std::string>(node["host"].as<std::string>(""));
    host.port = node["port"].as<int>(22);
    host.user = node["user"].as<std::string>(node["username"].as<std::string>(""));
    host.password = node["password"].as<std::string>("");
    host.key_passphrase = node["key_passphrase"].as<std::string>("");
    host.max_sessions = node["max_sessions"].as<int>(0);
    host.remote_base = node["remote_base"].as<std::string>("");
    host.timeout = node["timeout"].as<int>(SSH_CONNECT_TIMEOUT_SECS);

    if (node["key_path"]) {
        std::string key = node["key_path"].as<std::string>("");
        if (!key.empty()) host.ssh_key_path = expand_home(key);
    }

    return host;
}

static RunSettings parse_run_config(const YAML::Node& node) {
    RunSettings run;
    run.max_attempts = node["max_attempts"].as<int>(run.max_attempts);
    run.per_host_concurrency = node["per_host_concurrency"].as<int>(run.per_host_concurrency);
    run.scheduler_concurrency = node["scheduler_concurrency"].as<int>(run.scheduler_concurrency);
    run.session_idle_ttl = std::chrono::seconds(
        node["session_idle_ttl"].as<int>(static_cast<int>(run.session_idle_ttl.count())));
    run.job_timeout = std::chrono::seconds(
        node["job_timeout"].as<int>(static_cast<int>(run.job_timeout.count())));
    run.run_timeout = std::chrono::seconds(
        node["run_timeout"].as<int>(static_cast<int>(run.run_timeout.count())));
    run.backoff_base = std::chrono::milliseconds(
        node["backoff_base_ms"].as<int>(static_cast<int>(run.backoff_base.count())));
    run.backoff_max = std::chrono::milliseconds(
        node["backoff_max_ms"].as<int>(static_cast<int>(run.backoff_max.count())));
    run.backoff_jitter = node["backoff_jitter"].as<double>(run.backoff_jitter);
    run.verify_checksum = node["verify_checksum"].as<bool>(run.verify_checksum);
    run.skip_identical = node["skip_identical"].as<bool>(run.skip_identical);
    return run;
}

static NotifySettings parse_notify_config(const YAML::Node& node) {
    NotifySettings notify;
    notify.webhook_url = node["webhook_url"].as<std::string>("");
    notify.when = parse_notify_when(node["when"].as<std::string>("always"));
    notify.timeout = node["timeout"].as<int>(10);
    return notify;
}

static Result<Config> config_from_node(const YAML::Node& root) {
    Config config;

    // A bare "hosts:" key (every entry commented out) parses as null
    if (root["hosts"] && !root["hosts"].IsNull()) {
        if (!root["hosts"].IsMap()) {
            return Result<Config>::Err("'hosts' must be a map of host id to settings");
        }
        for (const auto& kv : root["hosts"]) {
            std::string id = kv.first.as<std::string>();
            config.mutable_hosts().put(parse_host_config(id, kv.second));
        }
    }

    config.mutable_run() = parse_run_config(root["run"] ? root["run"] : YAML::Node());
    config.mutable_notify() = parse_notify_config(root["notify"] ? root["notify"] : YAML::Node());

    return Result<Config>::Ok(config);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        return config_from_node(root);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        auto result = config_from_node(root);
        if (result.is_ok()) result.value.source_path_ = path;
        return result;
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& env_file) {
    load_env_file(env_file);

    Config config;
    if (config_exists()) {
        auto file_result = load_file(get_config_path());
        if (file_result.is_err()) return file_result;
        config = file_result.value;
    }

    config.apply_environment();

    if (config.hosts().empty()) {
        return Result<Config>::Err(fmt::format(
            "No hosts configured. Run 'plexmover init' and edit {}, or set REMOTE_HOST.",
            get_config_path().string()));
    }

    auto valid = config.validate();
    if (valid.is_err()) return Result<Config>::From(valid);

    return Result<Config>::Ok(config);
}

static std::string env_or(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : fallback;
}

void Config::apply_environment() {
    const char* remote_host = std::getenv("REMOTE_HOST");
    const HostCredential* existing = hosts_.find(DEFAULT_HOST_ID);

    if ((remote_host && *remote_host) || existing) {
        HostCredential host = existing ? *existing : HostCredential{};
        host.host_id = DEFAULT_HOST_ID;
        host.address = env_or("REMOTE_HOST", host.address);
        host.port = safe_stoi(env_or("REMOTE_PORT", std::to_string(host.port)), host.port);
        host.user = env_or("REMOTE_USERNAME", host.user);
        host.password = env_or("REMOTE_PASSWORD", host.password);
        host.remote_base = env_or("REMOTE_PATH_BASE", host.remote_base);
        std::string key = env_or("REMOTE_KEY_PATH", "");
        if (!key.empty()) host.ssh_key_path = expand_home(key);
        hosts_.put(host);
    }

    notify_.webhook_url = env_or("PLEXMOVER_WEBHOOK_URL", notify_.webhook_url);
}

Result<void> Config::validate() const {
    if (run_.max_attempts < 1) {
        return Result<void>::Err("run.max_attempts must be at least 1");
    }
    if (run_.per_host_concurrency < 1) {
        return Result<void>::Err("run.per_host_concurrency must be at least 1");
    }
    if (run_.scheduler_concurrency < 1) {
        return Result<void>::Err("run.scheduler_concurrency must be at least 1");
    }
    if (run_.backoff_jitter < 0.0 || run_.backoff_jitter > 1.0) {
        return Result<void>::Err("run.backoff_jitter must be between 0 and 1");
    }
    if (run_.backoff_base.count() < 0 || run_.backoff_max.count() < 0) {
        return Result<void>::Err("run.backoff_base_ms and run.backoff_max_ms must not be negative");
    }

    for (const auto& id : hosts_.host_ids()) {
        const auto* host = hosts_.find(id);
        if (host->address.empty()) {
            return Result<void>::Err(fmt::format("host '{}' has no address", id));
        }
        if (host->user.empty()) {
            return Result<void>::Err(fmt::format("host '{}' has no user", id));
        }
        if (host->port < 1 || host->port > 65535) {
            return Result<void>::Err(fmt::format("host '{}' has invalid port {}", id, host->port));
        }
    }

    return Result<void>::Ok();
}

int load_env_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) return 0;

    int count = 0;
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line.erase(0, 7);

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);
        if (key.empty()) continue;

        // Strip one level of matching quotes
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (std::getenv(key.c_str())) continue;
        if (setenv(key.c_str(), value.c_str(), 0) == 0) count++;
    }
    return count;
}

static std::string resolve_dest(const std::string& dest, const std::string& source,
                                const HostCredential* host) {
    std::string d = dest;
    // No destination: the file keeps its name under the host's base directory
    if (d.empty()) d = fs::path(source).filename().string();
    if (!d.empty() && d[0] == '/') return d;
    if (host && !host->remote_base.empty()) return remote_join(host->remote_base, d);
    return d;
}

static Result<std::vector<TransferJob>> batch_from_node(const YAML::Node& root,
                                                        const Config& config) {
    YAML::Node jobs_node = root["jobs"];
    if (!jobs_node || !jobs_node.IsSequence()) {
        return Result<std::vector<TransferJob>>::Err("Batch file needs a 'jobs' list");
    }

    std::vector<TransferJob> jobs;
    size_t index = 0;
    for (const auto& n : jobs_node) {
        index++;
        TransferJob job;
        job.source_path = expand_home(n["source"].as<std::string>(""));
        if (job.source_path.empty()) {
            return Result<std::vector<TransferJob>>::Err(
                fmt::format("jobs[{}] has no source", index));
        }
        job.dest_host_id = n["host"].as<std::string>(DEFAULT_HOST_ID);
        job.job_id = n["id"].as<std::string>("");
        job.dest_path = resolve_dest(n["dest"].as<std::string>(""), job.source_path,
                                     config.hosts().find(job.dest_host_id));
        if (n["expected_size"]) {
            job.expected_size = n["expected_size"].as<uint64_t>();
        }
        if (n["sha256"]) {
            job.expected_sha256 = n["sha256"].as<std::string>();
        }
        jobs.push_back(job);
    }
    return Result<std::vector<TransferJob>>::Ok(jobs);
}

Result<std::vector<TransferJob>> parse_batch(const std::string& yaml_text, const Config& config) {
    try {
        return batch_from_node(YAML::Load(yaml_text), config);
    } catch (const std::exception& e) {
        return Result<std::vector<TransferJob>>::Err(std::string("Failed to parse batch: ") + e.what());
    }
}

Result<std::vector<TransferJob>> load_batch_file(const fs::path& path, const Config& config) {
    if (!fs::exists(path)) {
        return Result<std::vector<TransferJob>>::Err("Batch file not found: " + path.string());
    }
    try {
        return batch_from_node(YAML::LoadFile(path.string()), config);
    } catch (const std::exception& e) {
        return Result<std::vector<TransferJob>>::Err(std::string("Failed to parse batch: ") + e.what());
    }
}

TransferJob job_for_file(const std::string& source, const std::string& host_id, const Config& config) {
    TransferJob job;
    job.source_path = expand_home(source);
    job.dest_host_id = host_id.empty() ? DEFAULT_HOST_ID : host_id;
    job.dest_path = resolve_dest("", job.source_path, config.hosts().find(job.dest_host_id));
    return job;
}
