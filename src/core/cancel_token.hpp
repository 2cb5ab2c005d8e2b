#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include "types.hpp"

// Cancellation signal passed into every blocking call.
//
// A token is interrupted when it (or any ancestor) has been cancelled, or when
// its own (or any ancestor's) deadline has passed. Child tokens let an attempt
// carry its own deadline while still observing run-level cancellation:
//
//   CancelToken run;                                     // cancelled on SIGINT
//   CancelToken attempt(&run, now + job_timeout);        // per-attempt deadline
//   if (attempt.interrupted()) return attempt.interruption();
//
// The parent must outlive its children.
class CancelToken {
public:
    using clock = std::chrono::steady_clock;
    using time_point = clock::time_point;

    CancelToken() = default;
    explicit CancelToken(const CancelToken* parent,
                         std::optional<time_point> deadline = std::nullopt);

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel();
    void set_deadline(time_point deadline);

    bool cancelled() const;
    bool expired() const;
    bool interrupted() const { return cancelled() || expired(); }

    // ErrorKind::Cancelled takes precedence over ErrorKind::Timeout; None if not interrupted.
    ErrorKind interruption() const;

    // Earliest deadline along the ancestor chain.
    std::optional<time_point> deadline() const;

    // Time left before the earliest deadline (nullopt when there is none).
    std::optional<std::chrono::milliseconds> remaining() const;

private:
    const CancelToken* parent_ = nullptr;
    std::atomic<bool> cancelled_{false};
    std::optional<time_point> deadline_;
};
