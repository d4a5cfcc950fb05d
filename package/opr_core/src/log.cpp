#include "opr_core/log.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace opr_core {

namespace {

LogLevel level_from_env() {
  const char *env = std::getenv("OPR_CORE_LOG");
  if (env == nullptr)
    return LogLevel::warn;
  return parse_log_level(env);
}

std::atomic<int> &level_slot() {
  static std::atomic<int> slot{static_cast<int>(level_from_env())};
  return slot;
}

const char *tag_for(LogLevel level) {
  switch (level) {
  case LogLevel::debug:
    return "Debug";
  case LogLevel::info:
    return "Info";
  case LogLevel::warn:
    return "Warn";
  case LogLevel::error:
    return "Error";
  default:
    return "Log";
  }
}

} // namespace

LogLevel log_level() {
  return static_cast<LogLevel>(level_slot().load(std::memory_order_relaxed));
}

void set_log_level(LogLevel level) {
  level_slot().store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel parse_log_level(const std::string &name) {
  if (name == "debug")
    return LogLevel::debug;
  if (name == "info")
    return LogLevel::info;
  if (name == "warn")
    return LogLevel::warn;
  if (name == "error")
    return LogLevel::error;
  if (name == "off")
    return LogLevel::off;
  return LogLevel::warn;
}

void log_line(LogLevel level, const std::string &message) {
  if (level < log_level() || level == LogLevel::off)
    return;
  // Metrics may be computed concurrently; keep lines whole.
  static std::mutex mu;
  std::lock_guard<std::mutex> lock(mu);
  fmt::print(stderr, "[{}] {}\n", tag_for(level), message);
}

} // namespace opr_core
