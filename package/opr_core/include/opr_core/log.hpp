#pragma once

#include <string>
#include <utility>

#include <fmt/format.h>

namespace opr_core {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3, off = 4 };

// Process-wide threshold. Initialized from OPR_CORE_LOG
// (debug|info|warn|error|off) on first use, default warn.
LogLevel log_level();
void set_log_level(LogLevel level);
LogLevel parse_log_level(const std::string &name);

// Writes "[Tag] message" to stderr when level passes the threshold.
void log_line(LogLevel level, const std::string &message);

template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args &&...args) {
  if (log_level() <= LogLevel::debug)
    log_line(LogLevel::debug, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(fmt::format_string<Args...> f, Args &&...args) {
  if (log_level() <= LogLevel::info)
    log_line(LogLevel::info, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_warn(fmt::format_string<Args...> f, Args &&...args) {
  if (log_level() <= LogLevel::warn)
    log_line(LogLevel::warn, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_error(fmt::format_string<Args...> f, Args &&...args) {
  if (log_level() <= LogLevel::error)
    log_line(LogLevel::error, fmt::format(f, std::forward<Args>(args)...));
}

} // namespace opr_core
