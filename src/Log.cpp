/**
 * @file Log.cpp
 * @brief Leveled diagnostics on stderr
 */

#include "strata/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace strata {

namespace {
    std::atomic<int> g_level{static_cast<int>(LogLevel::Warning)};
    std::mutex g_write_mutex;
}

void set_log_level(LogLevel level) noexcept {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warning: return "warning";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
    }
    return "unknown";
}

void log(LogLevel level, const char* component, const std::string& message) {
    if (!log_enabled(level)) return;

    // One line per call, even when independent folds log from several threads
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::clog << "strata: " << log_level_name(level) << ": [" << component << "] "
              << message << "\n";
}

} // namespace strata
