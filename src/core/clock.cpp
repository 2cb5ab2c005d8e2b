#include "clock.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <algorithm>

SystemClock& SystemClock::instance() {
    static SystemClock clock;
    return clock;
}

bool SystemClock::sleep_for(std::chrono::milliseconds duration, const CancelToken& token) {
    auto until = std::chrono::steady_clock::now() + duration;
    while (true) {
        if (token.interrupted()) return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            until - std::chrono::steady_clock::now()).count();
        if (left <= 0) return true;
        platform::sleep_ms(static_cast<int>(std::min<long long>(left, CANCEL_POLL_MS)));
    }
}
