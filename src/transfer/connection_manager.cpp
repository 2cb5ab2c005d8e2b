#include "connection_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

using steady = std::chrono::steady_clock;

ConnectionManager::ConnectionManager(const HostCredentialStore& hosts, const RunSettings& settings,
                                     SessionFactory& factory)
    : hosts_(hosts), settings_(settings), factory_(factory) {
    for (const auto& id : hosts_.host_ids()) {
        auto pool = std::make_unique<HostPool>();
        pool->credential = *hosts_.find(id);
        pool->limit = hosts_.session_limit(id, settings_.per_host_concurrency);
        pools_[id] = std::move(pool);
    }
}

ConnectionManager::~ConnectionManager() {
    close_all();
}

ConnectionManager::HostPool* ConnectionManager::pool_for(const std::string& host_id) const {
    auto it = pools_.find(host_id);
    return it == pools_.end() ? nullptr : it->second.get();
}

ConnectionManager::Detached ConnectionManager::detach_locked(HostPool& pool, PooledSession* session) {
    Detached out;
    auto it = std::find_if(pool.sessions.begin(), pool.sessions.end(),
                           [session](const std::unique_ptr<PooledSession>& s) { return s.get() == session; });
    if (it == pool.sessions.end()) return out;

    out.push_back(std::move(*it));
    pool.sessions.erase(it);
    pool.closing++;
    pool.stats.open = static_cast<int>(pool.sessions.size());
    return out;
}

ConnectionManager::Detached ConnectionManager::detach_stale_locked(HostPool& pool) {
    auto now = steady::now();
    Detached out;
    for (auto it = pool.sessions.begin(); it != pool.sessions.end();) {
        if (!(*it)->busy && now - (*it)->last_used_at > settings_.session_idle_ttl) {
            out.push_back(std::move(*it));
            it = pool.sessions.erase(it);
        } else {
            ++it;
        }
    }
    pool.closing += static_cast<int>(out.size());
    pool.stats.open = static_cast<int>(pool.sessions.size());
    return out;
}

PooledSession* ConnectionManager::first_idle_locked(HostPool& pool) {
    for (auto& s : pool.sessions) {
        if (!s->busy) return s.get();
    }
    return nullptr;
}

void ConnectionManager::close_detached(HostPool& pool, Detached detached, const char* reason) {
    if (detached.empty()) return;
    for (auto& s : detached) {
        plexmover_log(fmt::format("Pool {}: discarding session ({})", s->host_id, reason));
        s->session->close();
    }
    int count = static_cast<int>(detached.size());
    detached.clear();

    std::lock_guard<std::mutex> lock(pool.mtx);
    pool.closing -= count;
    pool.cv.notify_all();
}

Result<PooledSession*> ConnectionManager::acquire(const std::string& host_id, const CancelToken& token) {
    HostPool* pool = pool_for(host_id);
    if (!pool) {
        return Result<PooledSession*>::Err("Unknown host: " + host_id, ErrorKind::InvalidDestination);
    }

    std::unique_lock<std::mutex> lock(pool->mtx);
    while (true) {
        if (pool->auth_failed) {
            return Result<PooledSession*>::Err(pool->auth_error, ErrorKind::AuthenticationError);
        }
        if (token.interrupted()) {
            ErrorKind kind = token.interruption();
            return Result<PooledSession*>::Err(
                kind == ErrorKind::Cancelled ? "Cancelled while waiting for a session"
                                             : "Timed out waiting for a session",
                kind);
        }

        // Stale idle sessions are dropped before anything is reused
        auto stale = detach_stale_locked(*pool);
        if (!stale.empty()) {
            lock.unlock();
            close_detached(*pool, std::move(stale), "idle ttl exceeded");
            lock.lock();
            continue;
        }

        if (PooledSession* idle = first_idle_locked(*pool)) {
            // Claimed while probing so no other caller can take it
            idle->busy = true;
            lock.unlock();
            bool alive = idle->session->is_alive();
            lock.lock();

            if (alive) {
                idle->last_used_at = steady::now();
                pool->stats.reused++;
                return Result<PooledSession*>::Ok(idle);
            }
            auto dead = detach_locked(*pool, idle);
            lock.unlock();
            close_detached(*pool, std::move(dead), "liveness probe failed");
            lock.lock();
            continue;
        }

        int in_use = static_cast<int>(pool->sessions.size()) + pool->opening + pool->closing;
        if (in_use < pool->limit) {
            // Reserve the slot before dropping the lock
            pool->opening++;
            pool->stats.peak_open = std::max(pool->stats.peak_open, in_use + 1);
            lock.unlock();

            auto opened = factory_.open(pool->credential, token);

            lock.lock();
            pool->opening--;

            if (opened.is_err()) {
                if (opened.kind == ErrorKind::AuthenticationError) {
                    pool->auth_failed = true;
                    pool->auth_error = opened.error;
                    plexmover_log(fmt::format("Pool {}: authentication failed, host disabled: {}",
                                              host_id, opened.error));
                    pool->cv.notify_all();
                } else {
                    pool->cv.notify_one();
                }
                return Result<PooledSession*>::From(opened);
            }

            auto entry = std::make_unique<PooledSession>();
            entry->host_id = host_id;
            entry->session = std::move(opened.value);
            entry->created_at = steady::now();
            entry->last_used_at = entry->created_at;
            entry->busy = true;
            PooledSession* raw = entry.get();
            pool->sessions.push_back(std::move(entry));
            pool->stats.opened++;
            pool->stats.open = static_cast<int>(pool->sessions.size());
            return Result<PooledSession*>::Ok(raw);
        }

        pool->cv.wait_for(lock, std::chrono::milliseconds(ACQUIRE_WAIT_SLICE_MS));
    }
}

void ConnectionManager::release(PooledSession* session) {
    if (!session) return;
    HostPool* pool = pool_for(session->host_id);
    if (!pool) return;

    std::lock_guard<std::mutex> lock(pool->mtx);
    session->busy = false;
    session->last_used_at = steady::now();
    pool->cv.notify_one();
}

void ConnectionManager::invalidate(PooledSession* session) {
    if (!session) return;
    HostPool* pool = pool_for(session->host_id);
    if (!pool) return;

    Detached detached;
    {
        std::lock_guard<std::mutex> lock(pool->mtx);
        detached = detach_locked(*pool, session);
    }
    close_detached(*pool, std::move(detached), "invalidated");
}

bool ConnectionManager::host_unusable(const std::string& host_id) const {
    HostPool* pool = pool_for(host_id);
    if (!pool) return false;
    std::lock_guard<std::mutex> lock(pool->mtx);
    return pool->auth_failed;
}

std::string ConnectionManager::host_failure(const std::string& host_id) const {
    HostPool* pool = pool_for(host_id);
    if (!pool) return "";
    std::lock_guard<std::mutex> lock(pool->mtx);
    return pool->auth_error;
}

PoolStats ConnectionManager::stats(const std::string& host_id) const {
    HostPool* pool = pool_for(host_id);
    if (!pool) return PoolStats{};
    std::lock_guard<std::mutex> lock(pool->mtx);
    return pool->stats;
}

void ConnectionManager::close_all() {
    for (auto& [id, pool] : pools_) {
        Detached detached;
        {
            std::lock_guard<std::mutex> lock(pool->mtx);
            detached = std::move(pool->sessions);
            pool->sessions.clear();
            pool->closing += static_cast<int>(detached.size());
            pool->stats.open = 0;
        }
        close_detached(*pool, std::move(detached), "shutdown");
    }
}
