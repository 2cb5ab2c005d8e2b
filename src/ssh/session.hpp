#pragma once

#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <platform/socket_util.hpp>
#include "remote_session.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// One SSH connection to a transfer host. The socket and libssh2 session are
// non-blocking; every wait goes through wait_socket() so a cancelled or
// expired token interrupts within CANCEL_POLL_MS.
//
// Any failure that leaves the protocol state unknown (interrupted mid-write,
// socket error) marks the session inactive; the Connection Manager then
// discards it instead of returning it to the pool.
class SshSession : public RemoteSession {
public:
    explicit SshSession(const HostCredential& host);
    ~SshSession() override;

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    Result<void> establish(const CancelToken& token, StatusCallback callback = nullptr);

    const std::string& host_id() const override { return host_.host_id; }

    Result<uint64_t> upload(const std::string& remote_path, uint64_t size, int mode,
                            const ChunkReader& reader, const CancelToken& token,
                            const ProgressCallback& progress) override;

    Result<int64_t> remote_size(const std::string& remote_path,
                                const CancelToken& token) override;
    Result<std::string> remote_sha256(const std::string& remote_path,
                                      const CancelToken& token) override;
    Result<void> make_dirs(const std::string& remote_dir, const CancelToken& token) override;
    Result<void> rename(const std::string& from, const std::string& to,
                        const CancelToken& token) override;
    Result<void> remove(const std::string& remote_path, const CancelToken& token) override;

    bool is_alive() override;
    void close() override;

    bool is_active() const { return active_; }
    const std::string& get_target() const { return target_str_; }

    // Run a command on a fresh exec channel (no PTY). The exit code, stdout
    // and stderr come back in SSHResult; transport failures and interruption
    // come back as a failed Result.
    Result<SSHResult> exec(const std::string& command, const CancelToken& token,
                           int timeout_secs = 0);

private:
    HostCredential host_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    bool active_;
    std::string target_str_;

    Result<void> ssh_userauth(const CancelToken& token, StatusCallback callback);

    // Wait until the socket is ready in the direction libssh2 is blocked on.
    // Returns Cancelled/Timeout if the token fires, ConnectionLost on a
    // socket error, None otherwise.
    ErrorKind wait_socket(const CancelToken& token);

    // Repeat `op` while it reports LIBSSH2_ERROR_EAGAIN. `interrupted` is set
    // when the loop gave up because of the token or a dead socket.
    long long drive(const std::function<long long()>& op, const CancelToken& token,
                    ErrorKind& interrupted);

    std::string last_error() const;

    // Session state is unknown after this; it must not be reused.
    void abandon(const std::string& why);

    void release_handles();
};

// SessionFactory that opens SshSessions.
class SshSessionFactory : public SessionFactory {
public:
    explicit SshSessionFactory(StatusCallback callback = nullptr);

    Result<std::unique_ptr<RemoteSession>> open(const HostCredential& host,
                                                const CancelToken& token) override;

private:
    StatusCallback callback_;
};
