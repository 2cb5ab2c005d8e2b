#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <chrono>
#include <cstdint>

// How a transfer (or any step of one) went wrong.
enum class ErrorKind {
    None,
    AuthenticationError,   // host-scoped, terminal
    ConnectionLost,        // retryable
    IOError,               // retryable unless permanent
    SizeMismatch,          // retryable
    ChecksumMismatch,      // retryable
    Timeout,               // retryable while the run budget remains
    Cancelled,             // terminal
    LocalSourceMissing,    // job-scoped, terminal
    InvalidDestination,    // job-scoped, terminal
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    bool permanent = false;   // IOError the remote will keep reporting (disk full)

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None, false};
    }

    static Result<T> Err(const std::string& err, ErrorKind kind = ErrorKind::IOError,
                         bool permanent = false) {
        return {false, T{}, err, kind, permanent};
    }

    // Re-type a failure from another Result without losing its classification
    template <typename U>
    static Result<T> From(const Result<U>& other) {
        return {false, T{}, other.error, other.kind, other.permanent};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    bool permanent = false;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None, false};
    }

    static Result<void> Err(const std::string& err, ErrorKind kind = ErrorKind::IOError,
                            bool permanent = false) {
        return {false, err, kind, permanent};
    }

    template <typename U>
    static Result<void> From(const Result<U>& other) {
        return {false, other.error, other.kind, other.permanent};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// ── Configuration structures ───────────────────────────────

struct HostCredential {
    std::string host_id;
    std::string address;
    int port = 22;
    std::string user;
    std::string password;
    std::optional<std::string> ssh_key_path;
    std::string key_passphrase;
    int max_sessions = 0;            // 0 = use run.per_host_concurrency
    std::string remote_base;         // default destination directory
    int timeout = 30;                // connect/handshake timeout, seconds
};

struct RunSettings {
    int max_attempts = 3;
    int per_host_concurrency = 2;
    int scheduler_concurrency = 4;
    std::chrono::seconds session_idle_ttl{60};
    std::chrono::seconds job_timeout{1800};     // per attempt, 0 = none
    std::chrono::seconds run_timeout{0};        // whole run, 0 = none
    std::chrono::milliseconds backoff_base{500};
    std::chrono::milliseconds backoff_max{30000};
    double backoff_jitter = 0.2;
    bool verify_checksum = true;
    bool skip_identical = true;
};

enum class NotifyWhen { Always, Failure, Never };

struct NotifySettings {
    std::string webhook_url;
    NotifyWhen when = NotifyWhen::Always;
    int timeout = 10;
};

// ── Transfers ──────────────────────────────────────────────

struct TransferJob {
    std::string job_id;
    std::string source_path;
    std::string dest_host_id;
    std::string dest_path;
    std::optional<uint64_t> expected_size;
    std::optional<std::string> expected_sha256;
    int attempts = 0;
};

enum class TransferStatus { Pending, InFlight, Success, Failed, Skipped };

const char* transfer_status_name(TransferStatus status);

struct TransferResult {
    std::string job_id;
    TransferStatus status = TransferStatus::Pending;
    uint64_t bytes_transferred = 0;
    std::chrono::milliseconds elapsed{0};
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    int attempts = 0;
    bool reused = false;           // destination already held identical content
    bool permanent = false;        // IOError flagged as not worth retrying
    bool staging_left = false;     // <dest>.partial could not be removed

    bool ok() const { return status == TransferStatus::Success; }
};

enum class RunStatus { Success, PartialFailure, Failed };

const char* run_status_name(RunStatus status);

struct RunReport {
    std::string run_id;
    std::vector<TransferJob> jobs;          // as submitted (ids assigned)
    std::vector<TransferResult> results;    // submission order
    std::string started_at;                 // ISO timestamp
    std::string finished_at;
    std::chrono::milliseconds elapsed{0};
    RunStatus overall_status = RunStatus::Success;

    size_t count(TransferStatus status) const;
    uint64_t total_bytes() const;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

// Progress callback: bytes sent so far, total bytes
using ProgressCallback = std::function<void(uint64_t, uint64_t)>;
