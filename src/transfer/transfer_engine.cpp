#include "transfer_engine.hpp"
#include "checksum.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using steady = std::chrono::steady_clock;

std::string staging_path(const std::string& dest) {
    return dest + STAGING_SUFFIX;
}

std::string check_dest_path(const std::string& dest) {
    if (dest.empty()) return "destination path is empty";
    if (dest[0] != '/') return "destination path is not absolute: " + dest;
    if (dest.back() == '/') return "destination path names a directory: " + dest;

    for (char c : dest) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) return "destination path contains control characters";
    }

    // Split into components; reject "..", and a trailing "."
    size_t start = 1;
    while (start <= dest.size()) {
        size_t end = dest.find('/', start);
        if (end == std::string::npos) end = dest.size();
        std::string part = dest.substr(start, end - start);
        if (part == "..") return "destination path contains '..': " + dest;
        if (end == dest.size() && part == ".") return "destination path names a directory: " + dest;
        start = end + 1;
    }
    return "";
}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

TransferEngine::TransferEngine(const RunSettings& settings, StatusCallback callback)
    : settings_(settings), callback_(std::move(callback)) {
}

Result<uint64_t> TransferEngine::precheck(const TransferJob& job) const {
    std::error_code ec;
    fs::file_status st = fs::status(job.source_path, ec);
    if (ec || !fs::exists(st)) {
        return Result<uint64_t>::Err("Local source not found: " + job.source_path,
                                     ErrorKind::LocalSourceMissing);
    }
    if (!fs::is_regular_file(st)) {
        return Result<uint64_t>::Err("Local source is not a regular file: " + job.source_path,
                                     ErrorKind::LocalSourceMissing);
    }

    uint64_t size = fs::file_size(job.source_path, ec);
    if (ec) {
        return Result<uint64_t>::Err("Cannot stat " + job.source_path + ": " + ec.message(),
                                     ErrorKind::LocalSourceMissing);
    }

    std::string dest_error = check_dest_path(job.dest_path);
    if (!dest_error.empty()) {
        return Result<uint64_t>::Err(dest_error, ErrorKind::InvalidDestination);
    }

    if (job.expected_size && *job.expected_size != size) {
        return Result<uint64_t>::Err(
            fmt::format("Local size {} does not match expected size {}", size, *job.expected_size),
            ErrorKind::SizeMismatch);
    }

    return Result<uint64_t>::Ok(size);
}

Result<bool> TransferEngine::destination_identical(const TransferJob& job, uint64_t local_size,
                                                   RemoteSession& session, const CancelToken& token) {
    auto remote = session.remote_size(job.dest_path, token);
    if (remote.is_err()) return Result<bool>::From(remote);
    if (remote.value < 0 || static_cast<uint64_t>(remote.value) != local_size) {
        return Result<bool>::Ok(false);
    }

    if (!settings_.verify_checksum && !job.expected_sha256) {
        return Result<bool>::Ok(true);
    }

    auto local_hash = sha256_file(job.source_path, token);
    if (local_hash.is_err()) return Result<bool>::From(local_hash);
    if (job.expected_sha256 && lowercase(*job.expected_sha256) != local_hash.value) {
        return Result<bool>::Ok(false);
    }

    auto remote_hash = session.remote_sha256(job.dest_path, token);
    if (remote_hash.is_err()) return Result<bool>::From(remote_hash);
    return Result<bool>::Ok(remote_hash.value == local_hash.value);
}

Result<void> TransferEngine::cleanup_staging(const TransferJob& job, RemoteSession& session,
                                             const CancelToken& token) {
    auto r = session.remove(staging_path(job.dest_path), token);
    if (r.is_err()) {
        plexmover_log(fmt::format("[{}] staging cleanup failed: {}", job.job_id, r.error));
    }
    return r;
}

TransferResult TransferEngine::transfer(const TransferJob& job, RemoteSession& session,
                                        const CancelToken& token) {
    auto start = steady::now();
    TransferResult result;
    result.job_id = job.job_id;
    result.attempts = job.attempts;
    result.status = TransferStatus::InFlight;

    bool staging_started = false;

    auto finish = [&](TransferStatus status) {
        result.status = status;
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(steady::now() - start);
        return result;
    };

    auto fail = [&](ErrorKind kind, const std::string& error, bool permanent = false) {
        result.error_kind = kind;
        result.error = error;
        result.permanent = permanent;

        if (staging_started) {
            // The interrupted token cannot be reused for cleanup
            CancelToken cleanup(nullptr, steady::now() + std::chrono::seconds(CLEANUP_TIMEOUT_SECS));
            if (!session.is_alive() || cleanup_staging(job, session, cleanup).is_err()) {
                result.staging_left = true;
            }
        }
        plexmover_log(fmt::format("[{}] attempt {} failed ({}): {}{}", job.job_id, job.attempts,
                                  error_kind_name(kind), error,
                                  result.staging_left ? " [staging left]" : ""));
        return finish(TransferStatus::Failed);
    };

    // ── Local checks ──────────────────────────────────────────
    auto pre = precheck(job);
    if (pre.is_err()) return fail(pre.kind, pre.error);
    uint64_t local_size = pre.value;

    if (token.interrupted()) return fail(token.interruption(), "Interrupted before transfer");

    // ── Identical destination ─────────────────────────────────
    if (settings_.skip_identical) {
        auto same = destination_identical(job, local_size, session, token);
        if (same.is_err()) return fail(same.kind, same.error, same.permanent);
        if (same.value) {
            result.reused = true;
            result.bytes_transferred = local_size;
            plexmover_log(fmt::format("[{}] {} already in place, skipping upload",
                                      job.job_id, job.dest_path));
            return finish(TransferStatus::Success);
        }
    }

    // ── Upload to staging ─────────────────────────────────────
    std::string dest = job.dest_path;
    std::string staging = staging_path(dest);

    auto mk = session.make_dirs(remote_parent(dest), token);
    if (mk.is_err()) return fail(mk.kind, mk.error, mk.permanent);

    std::ifstream in(job.source_path, std::ios::binary);
    if (!in) return fail(ErrorKind::LocalSourceMissing, "Cannot read file: " + job.source_path);

    Sha256Hasher hasher;
    ChunkReader reader = [&](char* buf, size_t cap) -> long long {
        in.read(buf, static_cast<std::streamsize>(cap));
        std::streamsize n = in.gcount();
        if (in.bad()) return -1;
        if (n > 0) hasher.update(buf, static_cast<size_t>(n));
        return static_cast<long long>(n);
    };

    uint64_t next_report = PROGRESS_REPORT_BYTES;
    ProgressCallback progress = [&](uint64_t sent, uint64_t total) {
        if (callback_ && sent >= next_report && sent < total) {
            callback_(fmt::format("{}: {} / {}", job.job_id, format_bytes(sent), format_bytes(total)));
            next_report = sent + PROGRESS_REPORT_BYTES;
        }
    };

    staging_started = true;
    plexmover_log(fmt::format("[{}] upload {} -> {}:{} ({})", job.job_id, job.source_path,
                              session.host_id(), staging, format_bytes(local_size)));

    auto up = session.upload(staging, local_size, REMOTE_FILE_MODE, reader, token, progress);
    if (up.is_err()) return fail(up.kind, up.error, up.permanent);
    result.bytes_transferred = up.value;

    // ── Verify ────────────────────────────────────────────────
    if (up.value != local_size) {
        return fail(ErrorKind::SizeMismatch,
                    fmt::format("Sent {} bytes, expected {}", up.value, local_size));
    }

    std::string local_hash = hasher.hex_digest();
    if (job.expected_sha256 && lowercase(*job.expected_sha256) != local_hash) {
        return fail(ErrorKind::ChecksumMismatch,
                    fmt::format("Local SHA-256 {} does not match expected {}", local_hash,
                                *job.expected_sha256));
    }

    auto staged_size = session.remote_size(staging, token);
    if (staged_size.is_err()) return fail(staged_size.kind, staged_size.error, staged_size.permanent);
    if (staged_size.value < 0 || static_cast<uint64_t>(staged_size.value) != local_size) {
        return fail(ErrorKind::SizeMismatch,
                    fmt::format("Remote staged size {} does not match local size {}",
                                staged_size.value, local_size));
    }

    if (settings_.verify_checksum) {
        auto remote_hash = session.remote_sha256(staging, token);
        if (remote_hash.is_err()) return fail(remote_hash.kind, remote_hash.error, remote_hash.permanent);
        if (remote_hash.value != local_hash) {
            return fail(ErrorKind::ChecksumMismatch,
                        fmt::format("Remote SHA-256 {} does not match local {}", remote_hash.value,
                                    local_hash));
        }
    }

    // ── Commit ────────────────────────────────────────────────
    auto mv = session.rename(staging, dest, token);
    if (mv.is_err()) return fail(mv.kind, mv.error, mv.permanent);

    plexmover_log(fmt::format("[{}] committed {}:{} ({})", job.job_id, session.host_id(), dest,
                              format_bytes(local_size)));
    return finish(TransferStatus::Success);
}
