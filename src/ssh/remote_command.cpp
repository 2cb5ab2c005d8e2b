#include "session.hpp"
#include "remote_errors.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>

Result<SSHResult> SshSession::exec(const std::string& command, const CancelToken& token,
                                   int timeout_secs) {
    if (!active_ || !session_) {
        return Result<SSHResult>::Err("SSH session is not connected", ErrorKind::ConnectionLost);
    }

    int effective_timeout = (timeout_secs > 0) ? timeout_secs : REMOTE_CMD_TIMEOUT_SECS;
    CancelToken cmd_token(&token, std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout));
    ErrorKind interrupted;

    // The channel is left mid-protocol; the session cannot be reused
    auto fail_interrupted = [&](const char* step) {
        abandon(fmt::format("{} interrupted: {}", step, command));
        if (interrupted == ErrorKind::ConnectionLost) {
            return Result<SSHResult>::Err(fmt::format("Connection lost during remote command ({})", step),
                                          ErrorKind::ConnectionLost);
        }
        if (interrupted == ErrorKind::Cancelled) {
            return Result<SSHResult>::Err("Cancelled during remote command", ErrorKind::Cancelled);
        }
        return Result<SSHResult>::Err(fmt::format("Remote command timed out ({})", step),
                                      ErrorKind::Timeout);
    };

    // Open a new exec channel (no PTY, binary-clean)
    LIBSSH2_CHANNEL* exec_ch = nullptr;
    drive([&]() -> long long {
              exec_ch = libssh2_channel_open_session(session_);
              return exec_ch ? 0 : libssh2_session_last_errno(session_);
          },
          cmd_token, interrupted);
    if (interrupted != ErrorKind::None) return fail_interrupted("open channel");
    if (!exec_ch) {
        std::string why = "Failed to open exec channel: " + last_error();
        abandon(why);
        return Result<SSHResult>::Err(why, ErrorKind::ConnectionLost);
    }

    long long rc = drive([&] { return static_cast<long long>(libssh2_channel_exec(exec_ch, command.c_str())); },
                         cmd_token, interrupted);
    if (interrupted != ErrorKind::None) return fail_interrupted("exec");
    if (rc != 0) {
        std::string why = "Failed to exec command on channel: " + last_error();
        abandon(why);
        return Result<SSHResult>::Err(why, ErrorKind::ConnectionLost);
    }

    // Nothing goes to stdin
    drive([&] { return static_cast<long long>(libssh2_channel_send_eof(exec_ch)); },
          cmd_token, interrupted);
    if (interrupted != ErrorKind::None) return fail_interrupted("send eof");

    // Read stdout and stderr until the channel reaches EOF
    std::string output;
    std::string stderr_data;
    char buf[SSH_READ_BUF_SIZE];

    while (true) {
        ssize_t n = libssh2_channel_read(exec_ch, buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
            continue;
        }
        ssize_t en = libssh2_channel_read_stderr(exec_ch, buf, sizeof(buf));
        if (en > 0) {
            stderr_data.append(buf, static_cast<size_t>(en));
            continue;
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            std::string why = "SSH channel read error: " + last_error();
            abandon(why);
            return Result<SSHResult>::Err(why, ErrorKind::ConnectionLost);
        }
        if (libssh2_channel_eof(exec_ch)) break;

        interrupted = wait_socket(cmd_token);
        if (interrupted != ErrorKind::None) return fail_interrupted("read");
    }

    rc = drive([&] { return static_cast<long long>(libssh2_channel_close(exec_ch)); },
               cmd_token, interrupted);
    if (interrupted != ErrorKind::None) return fail_interrupted("close channel");

    int exit_status = -1;
    if (rc == 0) {
        drive([&] { return static_cast<long long>(libssh2_channel_wait_closed(exec_ch)); },
              cmd_token, interrupted);
        if (interrupted != ErrorKind::None) return fail_interrupted("wait closed");
        exit_status = libssh2_channel_get_exit_status(exec_ch);
    }
    libssh2_channel_free(exec_ch);

    SSHResult result{exit_status, output, stderr_data};
    plexmover_log_remote("EXEC " + host_.host_id, command, result);
    return Result<SSHResult>::Ok(std::move(result));
}

// Turn a failed remote command into a classified error
static std::string command_error(const char* what, const std::string& path, const SSHResult& r) {
    std::string detail = r.stderr_data.empty() ? r.stdout_data : r.stderr_data;
    trim(detail);
    if (detail.empty()) detail = fmt::format("exit {}", r.exit_code);
    return fmt::format("{} {} failed: {}", what, path, detail);
}

template <typename T>
static Result<T> classified(const char* what, const std::string& path, const SSHResult& r) {
    bool permanent = false;
    ErrorKind kind = classify_remote_error(r.stderr_data + r.stdout_data, permanent);
    return Result<T>::Err(command_error(what, path, r), kind, permanent);
}

Result<int64_t> SshSession::remote_size(const std::string& remote_path, const CancelToken& token) {
    std::string p = shell_quote(remote_path);
    std::string cmd = fmt::format(
        "if [ -e {0} ]; then stat -c %s -- {0} 2>/dev/null || wc -c < {0}; else echo -1; fi", p);

    auto r = exec(cmd, token);
    if (r.is_err()) return Result<int64_t>::From(r);
    if (r.value.failed()) return classified<int64_t>("stat", remote_path, r.value);

    int64_t size = -1;
    if (!parse_int_from_output(r.value.stdout_data, size)) {
        return Result<int64_t>::Err("Unexpected stat output for " + remote_path + ": " +
                                    r.value.stdout_data);
    }
    return Result<int64_t>::Ok(size);
}

Result<std::string> SshSession::remote_sha256(const std::string& remote_path,
                                              const CancelToken& token) {
    std::string p = shell_quote(remote_path);
    std::string cmd = fmt::format("sha256sum -- {0} 2>/dev/null || shasum -a 256 {0}", p);

    // Hashing a large file takes as long as reading it; no fixed command cap
    auto remaining = token.remaining();
    int timeout_secs = remaining
        ? static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(*remaining).count()) + 1
        : 24 * 3600;

    auto r = exec(cmd, token, timeout_secs);
    if (r.is_err()) return Result<std::string>::From(r);
    if (r.value.failed()) return classified<std::string>("sha256sum", remote_path, r.value);

    std::string hex = parse_sha256_from_output(r.value.stdout_data);
    if (hex.empty()) {
        return Result<std::string>::Err("Unexpected sha256sum output for " + remote_path);
    }
    return Result<std::string>::Ok(hex);
}

Result<void> SshSession::make_dirs(const std::string& remote_dir, const CancelToken& token) {
    std::string cmd = "mkdir -p -- " + shell_quote(remote_dir);
    auto r = exec(cmd, token);
    if (r.is_err()) return Result<void>::From(r);
    if (r.value.failed()) return classified<void>("mkdir", remote_dir, r.value);
    return Result<void>::Ok();
}

Result<void> SshSession::rename(const std::string& from, const std::string& to,
                                const CancelToken& token) {
    std::string cmd = "mv -f -- " + shell_quote(from) + " " + shell_quote(to);
    auto r = exec(cmd, token);
    if (r.is_err()) return Result<void>::From(r);
    if (r.value.failed()) {
        // A rename that fails on an existing staging file is not a bad path
        bool permanent = false;
        ErrorKind kind = classify_remote_error(r.value.stderr_data, permanent);
        if (kind == ErrorKind::InvalidDestination) kind = ErrorKind::IOError;
        return Result<void>::Err(command_error("mv", to, r.value), kind, permanent);
    }
    return Result<void>::Ok();
}

Result<void> SshSession::remove(const std::string& remote_path, const CancelToken& token) {
    std::string cmd = "rm -f -- " + shell_quote(remote_path);
    auto r = exec(cmd, token);
    if (r.is_err()) return Result<void>::From(r);
    if (r.value.failed()) return classified<void>("rm", remote_path, r.value);
    return Result<void>::Ok();
}
