#pragma once

// In-memory stand-ins for the SSH seams (RemoteSession / SessionFactory)
// and the backoff clock, shared by the orchestrator tests.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/clock.hpp>
#include <core/types.hpp>
#include <ssh/remote_session.hpp>
#include <transfer/checksum.hpp>
#include <unistd.h>

using steady = std::chrono::steady_clock;

// One simulated remote host: a flat map of path -> contents plus scripted
// failures. Thread-safe; sessions for the host share it.
class FakeRemoteHost {
public:
    struct UploadSpan {
        std::string path;
        steady::time_point start;
        steady::time_point end;
    };

    explicit FakeRemoteHost(std::string host_id) : host_id_(std::move(host_id)) {}

    const std::string& host_id() const { return host_id_; }

    // ── Scripting ──────────────────────────────────────────
    void set_fail_auth(bool fail) { std::lock_guard<std::mutex> l(mtx_); fail_auth_ = fail; }
    void fail_next_opens(int n) { std::lock_guard<std::mutex> l(mtx_); open_failures_ = n; }

    // The next upload drops the connection after `fraction` of its bytes
    void interrupt_next_upload(double fraction) {
        std::lock_guard<std::mutex> l(mtx_);
        interruptions_.push_back(fraction);
    }

    // The next `n` uploads store one flipped byte
    void corrupt_next_uploads(int n) { std::lock_guard<std::mutex> l(mtx_); corruptions_ = n; }

    void set_disk_full(bool full) { std::lock_guard<std::mutex> l(mtx_); disk_full_ = full; }

    // Per-chunk delay; applies to the next `uploads` uploads (-1 = all)
    void set_chunk_delay(std::chrono::milliseconds delay, int uploads = -1) {
        std::lock_guard<std::mutex> l(mtx_);
        chunk_delay_ = delay;
        slow_uploads_ = uploads;
    }

    // Closing a session blocks for `delay` (a slow SSH disconnect)
    void set_close_delay(std::chrono::milliseconds delay) { close_delay_ms_ = static_cast<int>(delay.count()); }

    // Every open session stops answering (liveness probes fail)
    void drop_all_sessions() { generation_++; }

    // ── Files ──────────────────────────────────────────────
    void put_file(const std::string& path, const std::string& content) {
        std::lock_guard<std::mutex> l(mtx_);
        files_[path] = content;
    }
    bool has_file(const std::string& path) const {
        std::lock_guard<std::mutex> l(mtx_);
        return files_.count(path) > 0;
    }
    std::string file(const std::string& path) const {
        std::lock_guard<std::mutex> l(mtx_);
        auto it = files_.find(path);
        return it == files_.end() ? "" : it->second;
    }
    std::vector<std::string> paths_with_suffix(const std::string& suffix) const {
        std::lock_guard<std::mutex> l(mtx_);
        std::vector<std::string> out;
        for (const auto& [p, c] : files_) {
            if (p.size() >= suffix.size() && p.compare(p.size() - suffix.size(), suffix.size(), suffix) == 0)
                out.push_back(p);
        }
        return out;
    }

    // ── Instrumentation ────────────────────────────────────
    int live_sessions() const { return live_; }
    int peak_sessions() const { return peak_; }
    int open_attempts() const { return open_attempts_; }
    int upload_count() const { std::lock_guard<std::mutex> l(mtx_); return static_cast<int>(spans_.size()); }
    std::vector<UploadSpan> uploads() const { std::lock_guard<std::mutex> l(mtx_); return spans_; }

private:
    friend class FakeRemoteSession;
    friend class FakeSessionFactory;

    std::string host_id_;
    mutable std::mutex mtx_;
    std::map<std::string, std::string> files_;
    std::vector<UploadSpan> spans_;
    std::deque<double> interruptions_;
    bool fail_auth_ = false;
    int open_failures_ = 0;
    int corruptions_ = 0;
    bool disk_full_ = false;
    std::chrono::milliseconds chunk_delay_{0};
    int slow_uploads_ = -1;
    std::atomic<int> generation_{0};
    std::atomic<int> live_{0};
    std::atomic<int> peak_{0};
    std::atomic<int> open_attempts_{0};
    std::atomic<int> close_delay_ms_{0};

    void session_opened() {
        int now = ++live_;
        int prev = peak_.load();
        while (now > prev && !peak_.compare_exchange_weak(prev, now)) {}
    }
    void session_closed() { --live_; }
};

class FakeRemoteSession : public RemoteSession {
public:
    static constexpr size_t kChunk = 4096;

    explicit FakeRemoteSession(FakeRemoteHost& host)
        : host_(host), generation_(host.generation_.load()) {
        host_.session_opened();
    }
    ~FakeRemoteSession() override { close(); }

    const std::string& host_id() const override { return host_.host_id(); }

    Result<uint64_t> upload(const std::string& remote_path, uint64_t size, int /*mode*/,
                            const ChunkReader& reader, const CancelToken& token,
                            const ProgressCallback& progress) override {
        if (!usable()) return Result<uint64_t>::Err("session closed", ErrorKind::ConnectionLost);

        double interrupt_at = -1.0;
        std::chrono::milliseconds delay{0};
        bool corrupt = false;
        {
            std::lock_guard<std::mutex> l(host_.mtx_);
            if (host_.disk_full_) {
                return Result<uint64_t>::Err("scp: " + remote_path + ": No space left on device",
                                             ErrorKind::IOError, true);
            }
            if (!host_.interruptions_.empty()) {
                interrupt_at = host_.interruptions_.front();
                host_.interruptions_.pop_front();
            }
            if (host_.slow_uploads_ != 0) {
                delay = host_.chunk_delay_;
                if (host_.slow_uploads_ > 0) host_.slow_uploads_--;
            }
            if (host_.corruptions_ > 0) {
                corrupt = true;
                host_.corruptions_--;
            }
            host_.files_[remote_path].clear();
        }

        FakeRemoteHost::UploadSpan span{remote_path, steady::now(), steady::now()};
        std::string data;
        std::vector<char> buf(kChunk);
        uint64_t sent = 0;

        auto record_span = [&]() {
            span.end = steady::now();
            std::lock_guard<std::mutex> l(host_.mtx_);
            host_.files_[remote_path] = data;
            host_.spans_.push_back(span);
        };

        while (sent < size) {
            if (interrupt_at >= 0.0 && static_cast<double>(sent) >= interrupt_at * static_cast<double>(size)) {
                record_span();
                dead_ = true;
                return Result<uint64_t>::Err("Connection reset by peer", ErrorKind::ConnectionLost);
            }
            if (!wait(delay, token)) {
                record_span();
                dead_ = true;
                return Result<uint64_t>::Err("upload interrupted", token.interruption());
            }

            size_t want = static_cast<size_t>(std::min<uint64_t>(kChunk, size - sent));
            long long n = reader(buf.data(), want);
            if (n < 0) {
                record_span();
                dead_ = true;
                return Result<uint64_t>::Err("local read failed", ErrorKind::IOError);
            }
            if (n == 0) {
                record_span();
                dead_ = true;
                return Result<uint64_t>::Err("local source ended early", ErrorKind::SizeMismatch);
            }
            data.append(buf.data(), static_cast<size_t>(n));
            sent += static_cast<uint64_t>(n);
            if (progress) progress(sent, size);
        }

        if (corrupt && !data.empty()) data[data.size() / 2] ^= 0x5a;
        record_span();
        return Result<uint64_t>::Ok(sent);
    }

    Result<int64_t> remote_size(const std::string& remote_path, const CancelToken& token) override {
        if (auto err = check(token)) return Result<int64_t>::Err("stat failed", *err);
        std::lock_guard<std::mutex> l(host_.mtx_);
        auto it = host_.files_.find(remote_path);
        return Result<int64_t>::Ok(it == host_.files_.end() ? -1 : static_cast<int64_t>(it->second.size()));
    }

    Result<std::string> remote_sha256(const std::string& remote_path, const CancelToken& token) override {
        if (auto err = check(token)) return Result<std::string>::Err("sha256sum failed", *err);
        std::lock_guard<std::mutex> l(host_.mtx_);
        auto it = host_.files_.find(remote_path);
        if (it == host_.files_.end()) {
            return Result<std::string>::Err(remote_path + ": No such file or directory",
                                            ErrorKind::IOError);
        }
        return Result<std::string>::Ok(sha256_hex(it->second));
    }

    Result<void> make_dirs(const std::string& /*remote_dir*/, const CancelToken& token) override {
        if (auto err = check(token)) return Result<void>::Err("mkdir failed", *err);
        return Result<void>::Ok();
    }

    Result<void> rename(const std::string& from, const std::string& to, const CancelToken& token) override {
        if (auto err = check(token)) return Result<void>::Err("mv failed", *err);
        std::lock_guard<std::mutex> l(host_.mtx_);
        auto it = host_.files_.find(from);
        if (it == host_.files_.end()) {
            return Result<void>::Err("mv: cannot stat " + from, ErrorKind::IOError);
        }
        host_.files_[to] = it->second;
        host_.files_.erase(from);
        return Result<void>::Ok();
    }

    Result<void> remove(const std::string& remote_path, const CancelToken& token) override {
        if (auto err = check(token)) return Result<void>::Err("rm failed", *err);
        std::lock_guard<std::mutex> l(host_.mtx_);
        host_.files_.erase(remote_path);
        return Result<void>::Ok();
    }

    bool is_alive() override { return usable(); }

    void close() override {
        if (!closed_) {
            closed_ = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(host_.close_delay_ms_.load()));
            host_.session_closed();
        }
    }

private:
    FakeRemoteHost& host_;
    int generation_;
    bool dead_ = false;
    bool closed_ = false;

    bool usable() const { return !dead_ && !closed_ && generation_ == host_.generation_.load(); }

    std::optional<ErrorKind> check(const CancelToken& token) {
        if (token.interrupted()) {
            dead_ = true;
            return token.interruption();
        }
        if (!usable()) return ErrorKind::ConnectionLost;
        return std::nullopt;
    }

    // Sleep in 1 ms slices; false if the token fired
    static bool wait(std::chrono::milliseconds delay, const CancelToken& token) {
        auto until = steady::now() + delay;
        while (true) {
            if (token.interrupted()) return false;
            if (steady::now() >= until) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
};

class FakeSessionFactory : public SessionFactory {
public:
    void add_host(FakeRemoteHost& host) { hosts_[host.host_id()] = &host; }

    Result<std::unique_ptr<RemoteSession>> open(const HostCredential& cred,
                                                const CancelToken& token) override {
        using R = Result<std::unique_ptr<RemoteSession>>;
        if (token.interrupted()) return R::Err("interrupted while connecting", token.interruption());

        auto it = hosts_.find(cred.host_id);
        if (it == hosts_.end()) return R::Err("no route to " + cred.address, ErrorKind::ConnectionLost);

        FakeRemoteHost& host = *it->second;
        host.open_attempts_++;
        {
            std::lock_guard<std::mutex> l(host.mtx_);
            if (host.fail_auth_) {
                return R::Err("Authentication failed for " + cred.user, ErrorKind::AuthenticationError);
            }
            if (host.open_failures_ > 0) {
                host.open_failures_--;
                return R::Err("Connection refused", ErrorKind::ConnectionLost);
            }
        }
        return R::Ok(std::make_unique<FakeRemoteSession>(host));
    }

private:
    std::map<std::string, FakeRemoteHost*> hosts_;
};

// Records backoff delays instead of sleeping. An optional hook runs on
// every sleep (tests use it to cancel mid-backoff).
class FakeClock : public Clock {
public:
    bool sleep_for(std::chrono::milliseconds duration, const CancelToken& token) override {
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> l(mtx_);
            sleeps_.push_back(duration);
            hook = on_sleep_;
        }
        if (hook) hook();
        return !token.interrupted();
    }

    void on_sleep(std::function<void()> hook) {
        std::lock_guard<std::mutex> l(mtx_);
        on_sleep_ = std::move(hook);
    }

    std::vector<std::chrono::milliseconds> sleeps() const {
        std::lock_guard<std::mutex> l(mtx_);
        return sleeps_;
    }

private:
    mutable std::mutex mtx_;
    std::vector<std::chrono::milliseconds> sleeps_;
    std::function<void()> on_sleep_;
};

// ── Helpers ────────────────────────────────────────────────

inline HostCredential fake_host_credential(const std::string& id, int max_sessions = 0) {
    HostCredential h;
    h.host_id = id;
    h.address = id + ".example.net";
    h.user = "media";
    h.password = "secret";
    h.max_sessions = max_sessions;
    h.remote_base = "/srv/media";
    return h;
}

inline RunSettings fast_settings() {
    RunSettings s;
    s.backoff_base = std::chrono::milliseconds(1);
    s.backoff_max = std::chrono::milliseconds(5);
    s.backoff_jitter = 0.0;
    s.job_timeout = std::chrono::seconds(0);
    return s;
}

// Scratch directory for local source files, removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("plexmover_test_" + std::to_string(getpid()) + "_" + std::to_string(++counter));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    // Write `content` to <dir>/<name> and return the full path
    std::string write(const std::string& name, const std::string& content) const {
        auto p = path_ / name;
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p.string();
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Deterministic pseudo-random payload of `size` bytes
inline std::string payload(size_t size, unsigned seed = 1) {
    std::string s(size, '\0');
    unsigned x = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; i++) {
        x = x * 1103515245u + 12345u;
        s[i] = static_cast<char>((x >> 16) & 0xff);
    }
    return s;
}

inline TransferJob make_job(const std::string& id, const std::string& source,
                            const std::string& host, const std::string& dest) {
    TransferJob j;
    j.job_id = id;
    j.source_path = source;
    j.dest_host_id = host;
    j.dest_path = dest;
    return j;
}
