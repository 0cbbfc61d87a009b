#pragma once

/**
 * Shutdown signals for long-running economy tools
 *
 * The first SIGINT/SIGTERM clears the caller's running flag so a simulation
 * can stop between days and still write its snapshot. A second signal
 * exits immediately.
 */

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <unistd.h>

namespace econ {
namespace util {

namespace detail {
inline std::atomic<bool>* g_running_flag = nullptr;
inline std::atomic<int> g_signals_seen{0};

inline void write_stderr(const char* msg, size_t len) {
    // write(2) is async-signal-safe; iostreams are not
    ssize_t ignored = ::write(STDERR_FILENO, msg, len);
    (void)ignored;
}
} // namespace detail

inline void shutdown_signal_handler(int) {
    if (detail::g_signals_seen.fetch_add(1) > 0) {
        static const char msg[] = "\n[SHUTDOWN] second signal, exiting now\n";
        detail::write_stderr(msg, sizeof(msg) - 1);
        std::_Exit(130);
    }
    static const char msg[] = "\n[SHUTDOWN] finishing current day, signal again to abort\n";
    detail::write_stderr(msg, sizeof(msg) - 1);
    if (detail::g_running_flag) {
        detail::g_running_flag->store(false);
    }
}

inline void install_shutdown_handler(std::atomic<bool>& running) {
    detail::g_running_flag = &running;
    detail::g_signals_seen.store(0);
    std::signal(SIGINT, shutdown_signal_handler);
    std::signal(SIGTERM, shutdown_signal_handler);
}

inline bool shutdown_requested() { return detail::g_signals_seen.load() > 0; }

} // namespace util
} // namespace econ
