#pragma once

#include <chrono>
#include "cancel_token.hpp"

// Sleep abstraction for retry backoff. Tests inject a clock that records
// the requested delays instead of waiting.
class Clock {
public:
    virtual ~Clock() = default;

    // Sleep for `duration`. Returns false if the token was interrupted first.
    virtual bool sleep_for(std::chrono::milliseconds duration, const CancelToken& token) = 0;
};

// Real sleep in short slices so cancellation is noticed promptly.
class SystemClock : public Clock {
public:
    static SystemClock& instance();

    bool sleep_for(std::chrono::milliseconds duration, const CancelToken& token) override;
};
