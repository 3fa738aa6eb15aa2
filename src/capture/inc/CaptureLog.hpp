#ifndef PERFCAP_CAPTURELOG_HPP
#define PERFCAP_CAPTURELOG_HPP
/**
 * @file CaptureLog.hpp
 * @brief Prefixed printf-style diagnostics for the capture controller.
 *
 * Every line starts with "[perfcap]". Informational output goes to stdout,
 * warnings and errors to stderr. Debug lines are dropped unless verbose
 * logging was enabled (--verbose / PERFCAP_VERBOSE).
 */

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace perfcap {
namespace capture {

/* ----------------------------- Log State ----------------------------- */

namespace detail {

inline std::atomic<bool>& verboseFlag() noexcept {
  static std::atomic<bool> flag{false};
  return flag;
}

inline void vlog(std::FILE* out, const char* tag, const char* fmt, std::va_list ap) {
  std::fprintf(out, "[perfcap] %s", tag);
  std::vfprintf(out, fmt, ap);
  std::fputc('\n', out);
  std::fflush(out);
}

} // namespace detail

/* --------------------------------- API --------------------------------- */

/** @brief Enable or disable debug output. */
inline void setVerboseLogging(bool on) noexcept { detail::verboseFlag().store(on); }

inline bool verboseLogging() noexcept { return detail::verboseFlag().load(); }

__attribute__((format(printf, 1, 2))) inline void logInfo(const char* fmt, ...) {
  std::va_list ap;
  va_start(ap, fmt);
  detail::vlog(stdout, "", fmt, ap);
  va_end(ap);
}

__attribute__((format(printf, 1, 2))) inline void logDebug(const char* fmt, ...) {
  if (!verboseLogging()) {
    return;
  }
  std::va_list ap;
  va_start(ap, fmt);
  detail::vlog(stdout, "[debug] ", fmt, ap);
  va_end(ap);
}

__attribute__((format(printf, 1, 2))) inline void logWarn(const char* fmt, ...) {
  std::va_list ap;
  va_start(ap, fmt);
  detail::vlog(stderr, "Warning: ", fmt, ap);
  va_end(ap);
}

__attribute__((format(printf, 1, 2))) inline void logError(const char* fmt, ...) {
  std::va_list ap;
  va_start(ap, fmt);
  detail::vlog(stderr, "Error: ", fmt, ap);
  va_end(ap);
}

} // namespace capture
} // namespace perfcap

#endif // PERFCAP_CAPTURELOG_HPP
