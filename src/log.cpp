#include "sgrna_lib/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace sgrna_lib {

LogLevel log_threshold() {
  static int cached = -1;
  if (cached == -1) {
    cached = static_cast<int>(LogLevel::Info);
    const char *env = std::getenv("SGRNA_LIB_LOG_LEVEL");
    if (env) {
      std::string v(env);
      std::transform(v.begin(), v.end(), v.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      if (v == "debug") cached = static_cast<int>(LogLevel::Debug);
      if (v == "warn" || v == "warning") cached = static_cast<int>(LogLevel::Warn);
      if (v == "error") cached = static_cast<int>(LogLevel::Error);
    }
  }
  return static_cast<LogLevel>(cached);
}

void log_message(LogLevel level, const std::string &msg) {
  const char *tag = "info";
  switch (level) {
    case LogLevel::Debug: tag = "debug"; break;
    case LogLevel::Info: tag = "info"; break;
    case LogLevel::Warn: tag = "warn"; break;
    case LogLevel::Error: tag = "error"; break;
  }
  std::fprintf(stderr, "[%s] %s\n", tag, msg.c_str());
}

bool timing_enabled() {
  static int cached = -1;
  if (cached == -1) {
    const char *env = std::getenv("SGRNA_LIB_TIMING");
    cached = (env && env[0] != '0') ? 1 : 0;
  }
  return cached == 1;
}

ScopedTimer::~ScopedTimer() {
  if (!active) return;
  auto end = std::chrono::steady_clock::now();
  double ms = std::chrono::duration<double, std::milli>(end - start).count();
  std::fprintf(stderr, "[timing] %s: %.3f ms\n", name, ms);
}

} // namespace sgrna_lib
