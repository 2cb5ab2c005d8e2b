#include "session.hpp"
#include <core/constants.hpp>
#include <core/credentials.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>
#include <cstring>
#include <mutex>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback: every prompt gets the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                          const char* /*instruction*/, int /*instruction_len*/,
                          int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        std::string prompt_text(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        plexmover_log(fmt::format("kbd-interactive prompt {}: {}", data->prompt_round, prompt_text));
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

// libssh2_init is process-wide and not thread-safe
static int libssh2_init_once() {
    static std::once_flag flag;
    static int rc = 0;
    std::call_once(flag, [] { rc = libssh2_init(0); });
    return rc;
}

// Errors that mean the transport itself failed, as opposed to the server
// refusing credentials.
static bool is_transport_error(long long rc) {
    switch (rc) {
        case LIBSSH2_ERROR_SOCKET_NONE:
        case LIBSSH2_ERROR_BANNER_RECV:
        case LIBSSH2_ERROR_BANNER_SEND:
        case LIBSSH2_ERROR_SOCKET_SEND:
        case LIBSSH2_ERROR_SOCKET_RECV:
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_SOCKET_TIMEOUT:
        case LIBSSH2_ERROR_TIMEOUT:
        case LIBSSH2_ERROR_KEX_FAILURE:
            return true;
        default:
            return false;
    }
}

SshSession::SshSession(const HostCredential& host)
    : host_(host), session_(nullptr), sock_(PLEXMOVER_INVALID_SOCKET), active_(false),
      target_str_(describe_host(host)) {
}

SshSession::~SshSession() {
    close();
}

ErrorKind SshSession::wait_socket(const CancelToken& token) {
    ErrorKind interrupted = token.interruption();
    if (interrupted != ErrorKind::None) return interrupted;

    short events = 0;
    int dir = session_ ? libssh2_session_block_directions(session_) : 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;

    int revents = platform::poll_socket(sock_, events, CANCEL_POLL_MS);
    if (revents & (POLLERR | POLLNVAL)) return ErrorKind::ConnectionLost;

    return token.interruption();
}

long long SshSession::drive(const std::function<long long()>& op, const CancelToken& token,
                            ErrorKind& interrupted) {
    interrupted = ErrorKind::None;
    while (true) {
        long long rc = op();
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        interrupted = wait_socket(token);
        if (interrupted != ErrorKind::None) return rc;
    }
}

std::string SshSession::last_error() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : "unknown error";
}

void SshSession::abandon(const std::string& why) {
    if (active_) {
        plexmover_log(fmt::format("SSH {} abandoned: {}", target_str_, why));
    }
    active_ = false;
}

Result<void> SshSession::establish(const CancelToken& token, StatusCallback callback) {
    if (callback) {
        callback("Connecting to " + target_str_ + "...");
    }

    if (libssh2_init_once() != 0) {
        return Result<void>::Err("Failed to initialize libssh2", ErrorKind::ConnectionLost);
    }

    int timeout_secs = host_.timeout > 0 ? host_.timeout : SSH_CONNECT_TIMEOUT_SECS;
    std::string connect_error;
    sock_ = platform::connect_tcp(host_.address, host_.port, timeout_secs * 1000, connect_error);
    if (sock_ == PLEXMOVER_INVALID_SOCKET) {
        return Result<void>::Err(connect_error, ErrorKind::ConnectionLost);
    }

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        release_handles();
        return Result<void>::Err("Failed to create SSH session", ErrorKind::ConnectionLost);
    }

    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange), bounded by the connect timeout
    auto handshake_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);
    CancelToken handshake_token(&token, handshake_deadline);
    ErrorKind interrupted;
    long long ret = drive([&] { return static_cast<long long>(libssh2_session_handshake(session_, sock_)); },
                          handshake_token, interrupted);
    if (interrupted != ErrorKind::None || ret != 0) {
        std::string why;
        ErrorKind kind = ErrorKind::ConnectionLost;
        if (token.interrupted()) {
            kind = token.interruption();
            why = "Interrupted during SSH handshake";
        } else if (interrupted == ErrorKind::Timeout) {
            why = fmt::format("SSH handshake timed out after {}s", timeout_secs);
        } else {
            why = "SSH handshake failed: " + last_error();
        }
        release_handles();
        return Result<void>::Err(why, kind);
    }

    platform::enable_keepalive(sock_);
    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(token, callback);
    if (auth_result.is_err()) {
        release_handles();
        return auth_result;
    }

    active_ = true;
    plexmover_log(fmt::format("SSH connected: {}", target_str_));
    if (callback) {
        callback("Connected to " + target_str_);
    }
    return Result<void>::Ok();
}

Result<void> SshSession::ssh_userauth(const CancelToken& token, StatusCallback callback) {
    ErrorKind interrupted;

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    drive([&]() -> long long {
              auth_list = libssh2_userauth_list(session_, host_.user.c_str(),
                                                static_cast<unsigned int>(host_.user.length()));
              return auth_list ? 0 : libssh2_session_last_errno(session_);
          },
          token, interrupted);
    if (interrupted != ErrorKind::None) {
        return Result<void>::Err("Interrupted during authentication", interrupted);
    }

    // "none" authentication was accepted
    if (!auth_list && libssh2_userauth_authenticated(session_)) {
        return Result<void>::Ok();
    }

    std::string methods = auth_list ? auth_list : "";
    plexmover_log(fmt::format("SSH {} auth methods: {}", target_str_, methods));

    long long ret = LIBSSH2_ERROR_AUTHENTICATION_FAILED;

    auto transport_failure = [&]() {
        return Result<void>::Err("Connection lost during authentication: " + last_error(),
                                 ErrorKind::ConnectionLost);
    };

    // Public key first, when configured
    if (host_.ssh_key_path && (methods.empty() || methods.find("publickey") != std::string::npos)) {
        std::string key_path = expand_home(*host_.ssh_key_path);
        if (callback) callback("Using public key " + key_path + "...");

        ret = drive([&] {
                        return static_cast<long long>(libssh2_userauth_publickey_fromfile(
                            session_, host_.user.c_str(), nullptr, key_path.c_str(),
                            host_.key_passphrase.c_str()));
                    },
                    token, interrupted);
        if (interrupted != ErrorKind::None) {
            return Result<void>::Err("Interrupted during authentication", interrupted);
        }
        if (ret == 0) return Result<void>::Ok();
        if (is_transport_error(ret)) return transport_failure();
        plexmover_log(fmt::format("SSH {} publickey failed: {}", target_str_, last_error()));
    }

    if (!host_.password.empty() && methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data;
        kbd_data.password = host_.password;
        kbd_data.prompt_round = 0;
        *libssh2_session_abstract(session_) = &kbd_data;

        ret = drive([&] {
                        return static_cast<long long>(libssh2_userauth_keyboard_interactive(
                            session_, host_.user.c_str(), kbd_callback));
                    },
                    token, interrupted);
        *libssh2_session_abstract(session_) = nullptr;
        if (interrupted != ErrorKind::None) {
            return Result<void>::Err("Interrupted during authentication", interrupted);
        }
        if (ret == 0) return Result<void>::Ok();
        if (is_transport_error(ret)) return transport_failure();
    }

    if (!host_.password.empty() && (methods.empty() || methods.find("password") != std::string::npos)) {
        if (callback) callback("Using password auth...");

        ret = drive([&] {
                        return static_cast<long long>(libssh2_userauth_password(
                            session_, host_.user.c_str(), host_.password.c_str()));
                    },
                    token, interrupted);
        if (interrupted != ErrorKind::None) {
            return Result<void>::Err("Interrupted during authentication", interrupted);
        }
        if (ret == 0) return Result<void>::Ok();
        if (is_transport_error(ret)) return transport_failure();
    }

    return Result<void>::Err(
        fmt::format("Authentication failed for {} (check user, password or key)", target_str_),
        ErrorKind::AuthenticationError);
}

void SshSession::release_handles() {
    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != PLEXMOVER_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = PLEXMOVER_INVALID_SOCKET;
    }
}

void SshSession::close() {
    bool was_active = active_;
    active_ = false;

    if (session_) {
        // Disconnect is best effort on a non-blocking session; a short
        // blocking window lets the message go out on a healthy link.
        libssh2_session_set_timeout(session_, 2000);
        libssh2_session_set_blocking(session_, 1);
    }
    release_handles();

    if (was_active) plexmover_log(fmt::format("SSH closed: {}", target_str_));
}

bool SshSession::is_alive() {
    if (!active_ || !session_ || sock_ == PLEXMOVER_INVALID_SOCKET) return false;

    // Send SSH keepalive and check if connection is still up
    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(session_, &seconds_to_next);
    if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) {
        abandon("keepalive failed");
        return false;
    }

    // Also check if the socket is still valid
    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        abandon("socket closed by peer");
        return false;
    }

    return true;
}

// ── SshSessionFactory ──────────────────────────────────────

SshSessionFactory::SshSessionFactory(StatusCallback callback)
    : callback_(std::move(callback)) {
}

Result<std::unique_ptr<RemoteSession>> SshSessionFactory::open(const HostCredential& host,
                                                               const CancelToken& token) {
    auto session = std::make_unique<SshSession>(host);
    auto result = session->establish(token, callback_);
    if (result.is_err()) {
        plexmover_log(fmt::format("SSH open {} failed ({}): {}", describe_host(host),
                                  error_kind_name(result.kind), result.error));
        return Result<std::unique_ptr<RemoteSession>>::From(result);
    }
    return Result<std::unique_ptr<RemoteSession>>::Ok(std::move(session));
}
