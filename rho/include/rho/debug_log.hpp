#ifndef RHO_DEBUG_LOG_HPP
#define RHO_DEBUG_LOG_HPP

#include <cstdio>
#include <thread>
#include <sstream>
#include <cstdarg>
#include <atomic>

/**
 * Debug tracing for the substitution engine.
 *
 * RHO_DEBUG_LOG compiles to nothing unless RHO_ENABLE_DEBUG_OUTPUT is
 * defined. When enabled, the substituter reports each illegal variable it
 * rejects and the batch substituter reports each rejected request, tagged
 * with the worker thread that hit it.
 */
namespace rho {
namespace debug {

// Receives one formatted line (no trailing newline). May be called from
// several batch workers at once.
using DebugCallback = void (*)(const char* message);

// When null, RHO_DEBUG_LOG writes to stdout
inline std::atomic<DebugCallback> g_debug_callback{nullptr};

// Send trace lines to the host's logger instead of stdout
inline void set_debug_callback(DebugCallback cb) {
    g_debug_callback.store(cb, std::memory_order_release);
}

inline void clear_debug_callback() {
    g_debug_callback.store(nullptr, std::memory_order_release);
}

// Formats one trace line; lines longer than the buffer are truncated
inline void debug_output(const char* fmt, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    std::ostringstream oss;
    oss << std::this_thread::get_id();

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[DEBUG][T%s] %s", oss.str().c_str(), buffer);

    DebugCallback cb = g_debug_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(full_message);
    } else {
        printf("%s\n", full_message);
        fflush(stdout);
    }
}

} // namespace debug
} // namespace rho

#ifdef RHO_ENABLE_DEBUG_OUTPUT
    #define RHO_DEBUG_LOG(fmt, ...) ::rho::debug::debug_output(fmt, ##__VA_ARGS__)
#else
    #define RHO_DEBUG_LOG(fmt, ...) ((void)0)
#endif

#endif // RHO_DEBUG_LOG_HPP
