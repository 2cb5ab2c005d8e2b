#include "credentials.hpp"
#include <fmt/format.h>
#include <algorithm>

HostCredentialStore::HostCredentialStore(std::vector<HostCredential> hosts) {
    for (auto& h : hosts) {
        put(std::move(h));
    }
}

void HostCredentialStore::put(HostCredential host) {
    std::string id = host.host_id;
    hosts_[id] = std::move(host);
}

Result<HostCredential> HostCredentialStore::get(const std::string& host_id) const {
    auto it = hosts_.find(host_id);
    if (it == hosts_.end()) {
        return Result<HostCredential>::Err("Unknown host: " + host_id,
                                           ErrorKind::InvalidDestination);
    }
    return Result<HostCredential>::Ok(it->second);
}

const HostCredential* HostCredentialStore::find(const std::string& host_id) const {
    auto it = hosts_.find(host_id);
    return it == hosts_.end() ? nullptr : &it->second;
}

bool HostCredentialStore::contains(const std::string& host_id) const {
    return hosts_.count(host_id) > 0;
}

std::vector<std::string> HostCredentialStore::host_ids() const {
    std::vector<std::string> ids;
    ids.reserve(hosts_.size());
    for (const auto& [id, _] : hosts_) ids.push_back(id);
    return ids;
}

int HostCredentialStore::session_limit(const std::string& host_id, int default_limit) const {
    const auto* host = find(host_id);
    int limit = (host && host->max_sessions > 0) ? host->max_sessions : default_limit;
    return std::max(1, limit);
}

std::string describe_host(const HostCredential& host) {
    return fmt::format("{}@{}:{}", host.user, host.address, host.port);
}
