#pragma once

#include <atomic>
#include <format>
#include <print>
#include <utility>

// Debug lines go to stderr only when verbose logging is on.
// Warnings and errors are printed directly with a component prefix.
namespace logging {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline void set_verbose(bool verbose) {
    verbose_flag().store(verbose, std::memory_order_relaxed);
}

inline bool verbose() {
    return verbose_flag().load(std::memory_order_relaxed);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (!verbose()) return;
    std::println(stderr, "[speechgate] {}", std::format(fmt, std::forward<Args>(args)...));
}

} // namespace logging
