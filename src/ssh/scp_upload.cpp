#include "session.hpp"
#include "remote_errors.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <algorithm>
#include <vector>

// Drain whatever the remote scp wrote to stderr (its error message, if any)
static std::string read_channel_stderr(LIBSSH2_CHANNEL* ch) {
    std::string out;
    char buf[SSH_READ_BUF_SIZE];
    for (int i = 0; i < 64; i++) {
        ssize_t n = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

Result<uint64_t> SshSession::upload(const std::string& remote_path, uint64_t size, int mode,
                                    const ChunkReader& reader, const CancelToken& token,
                                    const ProgressCallback& progress) {
    if (!active_ || !session_) {
        return Result<uint64_t>::Err("SSH session is not connected", ErrorKind::ConnectionLost);
    }

    ErrorKind interrupted;
    auto fail_interrupted = [&](const char* step, uint64_t sent) {
        abandon(fmt::format("scp {} interrupted at {} bytes ({})", remote_path, sent, step));
        if (interrupted == ErrorKind::ConnectionLost) {
            return Result<uint64_t>::Err(
                fmt::format("Connection lost after {} of {} bytes", sent, size), ErrorKind::ConnectionLost);
        }
        if (interrupted == ErrorKind::Cancelled) {
            return Result<uint64_t>::Err("Upload cancelled", ErrorKind::Cancelled);
        }
        return Result<uint64_t>::Err(
            fmt::format("Upload timed out after {} of {} bytes", sent, size), ErrorKind::Timeout);
    };

    LIBSSH2_CHANNEL* ch = nullptr;
    drive([&]() -> long long {
              ch = libssh2_scp_send64(session_, remote_path.c_str(), mode & 0777,
                                      static_cast<libssh2_int64_t>(size), 0, 0);
              return ch ? 0 : libssh2_session_last_errno(session_);
          },
          token, interrupted);
    if (interrupted != ErrorKind::None) return fail_interrupted("open", 0);

    if (!ch) {
        int err = libssh2_session_last_errno(session_);
        std::string msg = last_error();
        if (err == LIBSSH2_ERROR_SCP_PROTOCOL) {
            // The remote scp refused the path; the session itself is fine
            bool permanent = false;
            ErrorKind kind = classify_remote_error(msg, permanent);
            return Result<uint64_t>::Err("scp to " + remote_path + " refused: " + msg, kind, permanent);
        }
        abandon("scp open failed: " + msg);
        return Result<uint64_t>::Err("Failed to open scp channel: " + msg, ErrorKind::ConnectionLost);
    }

    std::vector<char> buf(SCP_CHUNK_SIZE);
    uint64_t sent = 0;

    while (sent < size) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(buf.size(), size - sent));
        long long n = reader(buf.data(), want);
        if (n < 0) {
            // The remote is waiting for bytes we will never send
            abandon("local read failed mid-upload");
            return Result<uint64_t>::Err("Failed reading local source", ErrorKind::IOError);
        }
        if (n == 0) {
            abandon("local source ended early");
            return Result<uint64_t>::Err(
                fmt::format("Local source ended after {} of {} bytes", sent, size), ErrorKind::SizeMismatch);
        }

        size_t off = 0;
        while (off < static_cast<size_t>(n)) {
            ssize_t w = libssh2_channel_write(ch, buf.data() + off, static_cast<size_t>(n) - off);
            if (w == LIBSSH2_ERROR_EAGAIN) {
                interrupted = wait_socket(token);
                if (interrupted != ErrorKind::None) return fail_interrupted("write", sent);
                continue;
            }
            if (w < 0) {
                std::string remote_msg = read_channel_stderr(ch);
                std::string msg = remote_msg.empty() ? last_error() : remote_msg;
                abandon("scp write failed: " + msg);
                if (!remote_msg.empty()) {
                    bool permanent = false;
                    ErrorKind kind = classify_remote_error(remote_msg, permanent);
                    return Result<uint64_t>::Err("scp " + remote_path + ": " + remote_msg, kind, permanent);
                }
                return Result<uint64_t>::Err(
                    fmt::format("Connection lost after {} of {} bytes: {}", sent, size, msg),
                    ErrorKind::ConnectionLost);
            }
            off += static_cast<size_t>(w);
            sent += static_cast<uint64_t>(w);
        }

        if (progress) progress(sent, size);
    }

    drive([&] { return static_cast<long long>(libssh2_channel_send_eof(ch)); }, token, interrupted);
    if (interrupted != ErrorKind::None) return fail_interrupted("send eof", sent);
    drive([&] { return static_cast<long long>(libssh2_channel_wait_eof(ch)); }, token, interrupted);
    if (interrupted != ErrorKind::None) return fail_interrupted("wait eof", sent);
    drive([&] { return static_cast<long long>(libssh2_channel_close(ch)); }, token, interrupted);
    if (interrupted != ErrorKind::None) return fail_interrupted("close", sent);
    drive([&] { return static_cast<long long>(libssh2_channel_wait_closed(ch)); }, token, interrupted);
    if (interrupted != ErrorKind::None) return fail_interrupted("wait closed", sent);

    int exit_status = libssh2_channel_get_exit_status(ch);
    std::string remote_msg = read_channel_stderr(ch);
    libssh2_channel_free(ch);

    if (exit_status != 0) {
        bool permanent = false;
        ErrorKind kind = classify_remote_error(remote_msg, permanent);
        if (kind == ErrorKind::InvalidDestination) kind = ErrorKind::IOError;
        plexmover_log(fmt::format("scp {} exit={} stderr={}", remote_path, exit_status, remote_msg));
        return Result<uint64_t>::Err(
            fmt::format("Remote scp exited with {}: {}", exit_status, remote_msg), kind, permanent);
    }

    return Result<uint64_t>::Ok(sent);
}
