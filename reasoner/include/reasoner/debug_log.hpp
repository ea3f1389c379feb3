#ifndef REASONER_DEBUG_LOG_HPP
#define REASONER_DEBUG_LOG_HPP

#include <cstdio>
#include <cstddef>
#include <thread>
#include <sstream>
#include <cstdarg>
#include <atomic>

namespace reasoner {
namespace debug {

// Receives one formatted trace line without trailing newline
using DebugCallback = void (*)(const char* message);

// Null routes DEBUG_LOG to printf
inline std::atomic<DebugCallback> g_debug_callback{nullptr};

inline void set_debug_callback(DebugCallback cb) {
    g_debug_callback.store(cb, std::memory_order_release);
}

// Fixpoint iteration of the resolution running on this thread, 0 outside one
inline thread_local std::size_t t_iteration = 0;

/**
 * Tags trace lines of the current thread with a resolution iteration
 * for the lifetime of the scope. Scopes nest.
 */
class IterationScope {
private:
    std::size_t previous_;

public:
    explicit IterationScope(std::size_t iteration) : previous_(t_iteration) {
        t_iteration = iteration;
    }

    ~IterationScope() { t_iteration = previous_; }

    IterationScope(const IterationScope&) = delete;
    IterationScope& operator=(const IterationScope&) = delete;
};

inline void debug_output(const char* fmt, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    std::ostringstream tag;
    tag << "[REASONER][T" << std::this_thread::get_id() << "]";
    if (t_iteration > 0) {
        tag << "[I" << t_iteration << "]";
    }

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "%s %s", tag.str().c_str(), buffer);

    DebugCallback cb = g_debug_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(full_message);
    } else {
        printf("%s\n", full_message);
        fflush(stdout);
    }
}

} // namespace debug
} // namespace reasoner

#ifdef ENABLE_DEBUG_OUTPUT
    #define DEBUG_LOG(fmt, ...) ::reasoner::debug::debug_output(fmt, ##__VA_ARGS__)
#else
    #define DEBUG_LOG(fmt, ...) ((void)0)
#endif

#endif // REASONER_DEBUG_LOG_HPP
