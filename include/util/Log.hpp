#pragma once

#include <cstdio>

namespace vramclean::util {

// Prefixed stderr diagnostics. Constructed once in main and handed to each
// component; debug() output is gated on the verbose flag.
class Log {
public:
  explicit Log(bool verbose = false, std::FILE* sink = stderr) : verbose_(verbose), sink_(sink) {}

  void debug(const char* component, const char* fmt, ...) const __attribute__((format(printf, 3, 4)));
  void warn(const char* component, const char* fmt, ...) const __attribute__((format(printf, 3, 4)));
  void error(const char* component, const char* fmt, ...) const __attribute__((format(printf, 3, 4)));

private:
  bool verbose_;
  std::FILE* sink_;
};

} // namespace vramclean::util
