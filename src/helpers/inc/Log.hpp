#ifndef MOUNTWATCH_HELPERS_LOG_HPP
#define MOUNTWATCH_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief Leveled, domain-tagged diagnostics formatted with fmt.
 * @note Thread-safe: The threshold is atomic and each message is written with
 *       a single fmt::print call, so worker threads may log freely.
 *
 * Output format (stderr):
 *   [warning] watch: nothing changed
 */

#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace mountwatch {
namespace helpers {
namespace logging {

/* ----------------------------- LogLevel ----------------------------- */

/**
 * @brief Message severity, in increasing order.
 */
enum class LogLevel : unsigned char {
  DEBUG = 0, ///< Developer detail (state transitions, registrations)
  INFO,      ///< Lifecycle milestones
  WARNING,   ///< Unexpected but recoverable
  ERROR,     ///< An operation could not complete; the watch stops
};

/**
 * @brief Lower-case level name ("debug", "info", ...).
 */
[[nodiscard]] const char* toString(LogLevel level) noexcept;

/* ----------------------------- LogDomain ----------------------------- */

/**
 * @brief Named message source. Declare once per component as a constexpr.
 */
class LogDomain {
public:
  constexpr explicit LogDomain(const char* name) noexcept : name_(name) {}

  LogDomain(const LogDomain&) = delete;
  LogDomain& operator=(const LogDomain&) = delete;

  [[nodiscard]] constexpr const char* name() const noexcept { return name_; }

private:
  const char* const name_;
};

/* ----------------------------- Threshold ----------------------------- */

/// @brief Messages below this level are discarded (default: WARNING).
void setLogThreshold(LogLevel level) noexcept;

[[nodiscard]] LogLevel getLogThreshold() noexcept;

[[nodiscard]] bool isLogEnabled(LogLevel level) noexcept;

/* ----------------------------- Output ----------------------------- */

/// @brief Write a preformatted message.
void log(LogLevel level, const LogDomain& domain, std::string_view msg) noexcept;

/// @brief Format and write; arguments are only formatted when the level is enabled.
void logVFmt(LogLevel level, const LogDomain& domain, fmt::string_view formatStr,
             fmt::format_args args) noexcept;

template <typename... Args>
inline void logFmt(LogLevel level, const LogDomain& domain, fmt::format_string<Args...> formatStr,
                   Args&&... args) noexcept {
  if (!isLogEnabled(level)) {
    return;
  }
  logVFmt(level, domain, formatStr, fmt::make_format_args(args...));
}

template <typename... Args>
inline void logDebug(const LogDomain& domain, fmt::format_string<Args...> formatStr,
                     Args&&... args) noexcept {
  logFmt(LogLevel::DEBUG, domain, formatStr, std::forward<Args>(args)...);
}

template <typename... Args>
inline void logInfo(const LogDomain& domain, fmt::format_string<Args...> formatStr,
                    Args&&... args) noexcept {
  logFmt(LogLevel::INFO, domain, formatStr, std::forward<Args>(args)...);
}

template <typename... Args>
inline void logWarning(const LogDomain& domain, fmt::format_string<Args...> formatStr,
                       Args&&... args) noexcept {
  logFmt(LogLevel::WARNING, domain, formatStr, std::forward<Args>(args)...);
}

template <typename... Args>
inline void logError(const LogDomain& domain, fmt::format_string<Args...> formatStr,
                     Args&&... args) noexcept {
  logFmt(LogLevel::ERROR, domain, formatStr, std::forward<Args>(args)...);
}

} // namespace logging
} // namespace helpers
} // namespace mountwatch

#endif // MOUNTWATCH_HELPERS_LOG_HPP
