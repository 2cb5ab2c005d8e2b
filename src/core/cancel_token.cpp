#include "cancel_token.hpp"
#include <algorithm>

CancelToken::CancelToken(const CancelToken* parent, std::optional<time_point> deadline)
    : parent_(parent), deadline_(deadline) {}

void CancelToken::cancel() {
    cancelled_.store(true);
}

void CancelToken::set_deadline(time_point deadline) {
    deadline_ = deadline;
}

bool CancelToken::cancelled() const {
    if (cancelled_.load()) return true;
    return parent_ && parent_->cancelled();
}

bool CancelToken::expired() const {
    auto dl = deadline();
    return dl && clock::now() >= *dl;
}

ErrorKind CancelToken::interruption() const {
    if (cancelled()) return ErrorKind::Cancelled;
    if (expired()) return ErrorKind::Timeout;
    return ErrorKind::None;
}

std::optional<CancelToken::time_point> CancelToken::deadline() const {
    std::optional<time_point> inherited = parent_ ? parent_->deadline() : std::nullopt;
    if (!deadline_) return inherited;
    if (!inherited) return deadline_;
    return std::min(*deadline_, *inherited);
}

std::optional<std::chrono::milliseconds> CancelToken::remaining() const {
    auto dl = deadline();
    if (!dl) return std::nullopt;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*dl - clock::now());
    if (left.count() < 0) return std::chrono::milliseconds(0);
    return left;
}
