#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <core/credentials.hpp>
#include <ssh/remote_session.hpp>

// A session handed out by ConnectionManager::acquire(). The manager owns it;
// callers hold the pointer only between acquire() and release()/invalidate().
struct PooledSession {
    std::string host_id;
    std::unique_ptr<RemoteSession> session;
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_used_at;
    bool busy = false;

    RemoteSession& remote() { return *session; }
};

struct PoolStats {
    int open = 0;          // sessions currently open (busy + idle)
    int peak_open = 0;     // high-water mark of open + opening
    int opened = 0;        // sessions successfully opened
    int reused = 0;        // acquires served by an idle session
};

// Pool of authenticated sessions keyed by host id.
//
// Each host has its own mutex and condition variable. A slot is reserved
// under the host lock before a session is opened, so open + opening + closing
// never exceeds the host's limit. Opening, closing and liveness probes all
// happen outside the lock.
//
// After an AuthenticationError the host is marked unusable for the lifetime
// of the manager (one run); every later acquire fails immediately.
class ConnectionManager {
public:
    ConnectionManager(const HostCredentialStore& hosts, const RunSettings& settings,
                      SessionFactory& factory);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Block until an idle session is available or a slot frees up. Waits are
    // sliced so cancellation and deadlines are observed promptly.
    Result<PooledSession*> acquire(const std::string& host_id, const CancelToken& token);

    // Return a healthy session to the idle pool.
    void release(PooledSession* session);

    // Close and discard a session whose state is unknown.
    void invalidate(PooledSession* session);

    bool host_unusable(const std::string& host_id) const;
    std::string host_failure(const std::string& host_id) const;

    PoolStats stats(const std::string& host_id) const;

    // Close every pooled session. Only call when no session is checked out.
    void close_all();

private:
    struct HostPool {
        HostCredential credential;
        int limit = 1;
        mutable std::mutex mtx;
        std::condition_variable cv;
        std::vector<std::unique_ptr<PooledSession>> sessions;
        int opening = 0;
        int closing = 0;    // detached sessions still being closed
        bool auth_failed = false;
        std::string auth_error;
        PoolStats stats;
    };

    const HostCredentialStore& hosts_;
    RunSettings settings_;
    SessionFactory& factory_;
    std::map<std::string, std::unique_ptr<HostPool>> pools_;   // fixed after construction

    HostPool* pool_for(const std::string& host_id) const;

    using Detached = std::vector<std::unique_ptr<PooledSession>>;

    // Caller holds pool.mtx. Detached sessions keep their slot (pool.closing)
    // until close_detached() has run.
    Detached detach_locked(HostPool& pool, PooledSession* session);
    Detached detach_stale_locked(HostPool& pool);
    PooledSession* first_idle_locked(HostPool& pool);

    // Caller must NOT hold pool.mtx
    void close_detached(HostPool& pool, Detached detached, const char* reason);
};
