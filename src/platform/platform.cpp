#include "platform.hpp"
#include <cstdlib>
#include <csignal>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
    usleep(static_cast<useconds_t>(ms) * 1000);
}

// ── Interrupt handling ─────────────────────────────────────

static volatile std::sig_atomic_t g_interrupted = 0;

static void interrupt_handler(int) {
    g_interrupted = 1;
}

void on_interrupt(void (*on_signal)()) {
    std::signal(SIGINT, interrupt_handler);
    std::signal(SIGTERM, interrupt_handler);

    std::thread([on_signal]() {
        while (!g_interrupted) {
            sleep_ms(50);
        }
        on_signal();
    }).detach();
}

} // namespace platform
