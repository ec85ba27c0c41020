#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <sstream>
#include <thread>

namespace weave::debug {

// Sink for finished log lines; the line has no newline at the end
using log_callback = void (*)(const char* message);

// Installed sink, stdout when unset
inline std::atomic<log_callback> g_log_callback{nullptr};

inline void set_log_callback(log_callback cb) noexcept {
  g_log_callback.store(cb, std::memory_order_release);
}

inline void clear_log_callback() noexcept {
  g_log_callback.store(nullptr, std::memory_order_release);
}

// Formats like printf and tags the line with the weave prefix and the
// id of the thread that logged it
inline void log_output(const char* fmt, ...) {
  char    buffer[1024];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(buffer, sizeof(buffer), fmt, args);
  va_end(args);

  std::ostringstream tid;
  tid << std::this_thread::get_id();

  char message[1100];
  std::snprintf(message, sizeof(message), "[weave][T%s] %s", tid.str().c_str(), buffer);

  if (log_callback cb = g_log_callback.load(std::memory_order_acquire)) {
    cb(message);
  } else {
    std::printf("%s\n", message);
    std::fflush(stdout);
  }
}

}  // namespace weave::debug

#ifdef WEAVE_ENABLE_DEBUG_LOG
#define WEAVE_DEBUG_LOG(fmt, ...) ::weave::debug::log_output(fmt __VA_OPT__(, ) __VA_ARGS__)
#else
#define WEAVE_DEBUG_LOG(fmt, ...) ((void)0)
#endif
