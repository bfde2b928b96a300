#include "util/Log.hpp"

#include <cstdarg>

namespace vramclean::util {

static void emit(std::FILE* sink, const char* level, const char* component, const char* fmt, va_list ap) {
  if (!sink) return;
  std::fprintf(sink, "vramclean: %s%s%s", component, component[0] ? ": " : "", level);
  std::vfprintf(sink, fmt, ap);
  std::fputc('\n', sink);
  std::fflush(sink);
}

void Log::debug(const char* component, const char* fmt, ...) const {
  if (!verbose_) return;
  va_list ap;
  va_start(ap, fmt);
  emit(sink_, "", component, fmt, ap);
  va_end(ap);
}

void Log::warn(const char* component, const char* fmt, ...) const {
  va_list ap;
  va_start(ap, fmt);
  emit(sink_, "warning: ", component, fmt, ap);
  va_end(ap);
}

void Log::error(const char* component, const char* fmt, ...) const {
  va_list ap;
  va_start(ap, fmt);
  emit(sink_, "error: ", component, fmt, ap);
  va_end(ap);
}

} // namespace vramclean::util
