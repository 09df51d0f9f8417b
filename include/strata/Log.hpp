/**
 * @file Log.hpp
 * @brief Leveled diagnostics on stderr
 *
 * Messages go to std::clog as
 *   strata: <level>: [<component>] <message>
 * Only messages at or above the process-wide threshold are written. The
 * threshold defaults to Warning; the CLI raises or lowers it with -v/-q.
 */

#ifndef STRATA_LOG_HPP
#define STRATA_LOG_HPP

#include <sstream>
#include <string>

namespace strata {

enum class LogLevel {
    Error = 0,
    Warning = 1,
    Info = 2,
    Debug = 3
};

void set_log_level(LogLevel level) noexcept;
LogLevel log_level() noexcept;

inline bool log_enabled(LogLevel level) noexcept {
    return static_cast<int>(level) <= static_cast<int>(log_level());
}

const char* log_level_name(LogLevel level) noexcept;

/// Write one message if level passes the threshold
void log(LogLevel level, const char* component, const std::string& message);

} // namespace strata

// Stream-style helpers: the message expression is only evaluated when the
// level is enabled.
//   STRATA_LOG_DEBUG("fold", "applying layer " << i << ": " << name);
#define STRATA_LOG(level, component, expr)                              \
    do {                                                                \
        if (::strata::log_enabled(level)) {                             \
            std::ostringstream strata_log_oss_;                         \
            strata_log_oss_ << expr;                                    \
            ::strata::log(level, component, strata_log_oss_.str());     \
        }                                                               \
    } while (0)

#define STRATA_LOG_ERROR(component, expr) STRATA_LOG(::strata::LogLevel::Error, component, expr)
#define STRATA_LOG_WARNING(component, expr) STRATA_LOG(::strata::LogLevel::Warning, component, expr)
#define STRATA_LOG_INFO(component, expr) STRATA_LOG(::strata::LogLevel::Info, component, expr)
#define STRATA_LOG_DEBUG(component, expr) STRATA_LOG(::strata::LogLevel::Debug, component, expr)

#endif // STRATA_LOG_HPP
