#pragma once

#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <ssh/remote_session.hpp>

// Staging path for a destination: "<dest>.partial"
std::string staging_path(const std::string& dest);

// Check a remote destination path. Returns an empty string when usable,
// otherwise the reason it is rejected (empty, relative, directory-like,
// ".." component, control characters).
std::string check_dest_path(const std::string& dest);

// Drives one verified transfer of a local file over an already-acquired
// session:
//
//   1. local checks (exists, regular file, expected size)
//   2. destination already identical?  -> Success, reused
//   3. mkdir -p, upload to <dest>.partial while hashing the local bytes
//   4. verify sent bytes, remote size and (optionally) remote SHA-256
//   5. mv -f <dest>.partial <dest>
//
// A failure after the upload started removes the staging file, or sets
// TransferResult::staging_left when the session can no longer do it.
// The previous destination file is never modified by a failed transfer.
class TransferEngine {
public:
    explicit TransferEngine(const RunSettings& settings, StatusCallback callback = nullptr);

    // Local-only checks that need no session. Returns the local file size.
    Result<uint64_t> precheck(const TransferJob& job) const;

    TransferResult transfer(const TransferJob& job, RemoteSession& session, const CancelToken& token);

    // Best-effort removal of <dest>.partial.
    Result<void> cleanup_staging(const TransferJob& job, RemoteSession& session,
                                 const CancelToken& token);

private:
    RunSettings settings_;
    StatusCallback callback_;

    // Same destination content already in place?
    Result<bool> destination_identical(const TransferJob& job, uint64_t local_size,
                                       RemoteSession& session, const CancelToken& token);
};
