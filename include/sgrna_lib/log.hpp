#pragma once

#include <chrono>
#include <sstream>
#include <string>

namespace sgrna_lib {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Threshold comes from SGRNA_LIB_LOG_LEVEL (debug|info|warn|error), default info.
LogLevel log_threshold();
void log_message(LogLevel level, const std::string &msg);

// True if SGRNA_LIB_TIMING is set and not "0".
bool timing_enabled();

struct ScopedTimer {
  const char *name;
  bool active;
  std::chrono::steady_clock::time_point start;
  ScopedTimer(const char *n, bool on) : name(n), active(on), start(std::chrono::steady_clock::now()) {}
  ~ScopedTimer();
};

namespace detail {

inline void append_all(std::ostringstream &) {}

template <typename T, typename... Rest>
void append_all(std::ostringstream &os, const T &v, const Rest &...rest) {
  os << v;
  append_all(os, rest...);
}

template <typename... Args>
void log_at(LogLevel level, const Args &...args) {
  if (level < log_threshold()) return;
  std::ostringstream os;
  append_all(os, args...);
  log_message(level, os.str());
}

} // namespace detail

template <typename... Args> void log_debug(const Args &...args) { detail::log_at(LogLevel::Debug, args...); }
template <typename... Args> void log_info(const Args &...args) { detail::log_at(LogLevel::Info, args...); }
template <typename... Args> void log_warn(const Args &...args) { detail::log_at(LogLevel::Warn, args...); }
template <typename... Args> void log_error(const Args &...args) { detail::log_at(LogLevel::Error, args...); }

} // namespace sgrna_lib
