#pragma once

#include <string>
#include <vector>
#include <map>
#include "types.hpp"

// Per-host connection parameters, keyed by host id. Filled once at
// configuration load and read-only afterwards, so concurrent lookups
// need no locking.
class HostCredentialStore {
public:
    HostCredentialStore() = default;
    explicit HostCredentialStore(std::vector<HostCredential> hosts);

    // Insert or replace a host (used while loading configuration)
    void put(HostCredential host);

    Result<HostCredential> get(const std::string& host_id) const;
    const HostCredential* find(const std::string& host_id) const;
    bool contains(const std::string& host_id) const;

    // Host ids in sorted order
    std::vector<std::string> host_ids() const;
    size_t size() const { return hosts_.size(); }
    bool empty() const { return hosts_.empty(); }

    // Effective session limit: the host override if set, else the run default
    int session_limit(const std::string& host_id, int default_limit) const;

private:
    std::map<std::string, HostCredential> hosts_;
};

// "user@address:port" for log lines; never includes secrets.
std::string describe_host(const HostCredential& host);
