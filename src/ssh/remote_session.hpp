#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>

// Reads up to `cap` bytes into `buf`. Returns the count read, 0 at end of
// input, or a negative value on a local read error.
using ChunkReader = std::function<long long(char* buf, size_t cap)>;

// One authenticated connection to a remote host, able to receive files over
// SCP and run the handful of remote commands a verified transfer needs.
//
// Implementations are not thread-safe: the Connection Manager guarantees a
// session is used by at most one transfer at a time. Every call takes the
// caller's cancellation token and returns ErrorKind::Cancelled/Timeout when
// interrupted; ErrorKind::ConnectionLost means the session is unusable.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    virtual const std::string& host_id() const = 0;

    // Stream exactly `size` bytes from `reader` into `remote_path` (created
    // or truncated with `mode`). Returns the bytes the remote accepted.
    virtual Result<uint64_t> upload(const std::string& remote_path, uint64_t size, int mode,
                                    const ChunkReader& reader, const CancelToken& token,
                                    const ProgressCallback& progress) = 0;

    // Size of a remote file; -1 if it does not exist.
    virtual Result<int64_t> remote_size(const std::string& remote_path,
                                        const CancelToken& token) = 0;

    // Lowercase hex SHA-256 of a remote file.
    virtual Result<std::string> remote_sha256(const std::string& remote_path,
                                              const CancelToken& token) = 0;

    // mkdir -p
    virtual Result<void> make_dirs(const std::string& remote_dir, const CancelToken& token) = 0;

    // Atomic replace (mv -f)
    virtual Result<void> rename(const std::string& from, const std::string& to,
                                const CancelToken& token) = 0;

    // rm -f (absent is not an error)
    virtual Result<void> remove(const std::string& remote_path, const CancelToken& token) = 0;

    // Cheap liveness probe (keepalive + socket check)
    virtual bool is_alive() = 0;

    virtual void close() = 0;
};

// Opens authenticated sessions. Authentication failures are reported with
// ErrorKind::AuthenticationError, unreachable hosts with ConnectionLost.
class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    virtual Result<std::unique_ptr<RemoteSession>> open(const HostCredential& host,
                                                        const CancelToken& token) = 0;
};
