#pragma once
#include <iostream>
#include <sstream>

// Simple logging macros
#define LOG(...)                                                               \
  do {                                                                         \
    std::ostringstream oss;                                                    \
    tabletimer::log_impl(oss, __VA_ARGS__);                                    \
    std::cout << oss.str() << std::endl;                                       \
  } while (0)

#define LOG_ERROR(...)                                                         \
  do {                                                                         \
    std::ostringstream oss;                                                    \
    oss << "[ERROR] ";                                                         \
    tabletimer::log_impl(oss, __VA_ARGS__);                                    \
    std::cerr << oss.str() << std::endl;                                       \
  } while (0)

// Per-tick tracing, compiled in with -DTABLETIMER_DEBUG_LOG
#ifdef TABLETIMER_DEBUG_LOG
#define LOG_DEBUG(...)                                                         \
  do {                                                                         \
    std::ostringstream oss;                                                    \
    oss << "[DEBUG] ";                                                         \
    tabletimer::log_impl(oss, __VA_ARGS__);                                    \
    std::cout << oss.str() << std::endl;                                       \
  } while (0)
#else
#define LOG_DEBUG(...)                                                         \
  do {                                                                         \
  } while (0)
#endif

namespace tabletimer {

// Helper function to handle variadic arguments
template <typename T> void log_impl(std::ostringstream &oss, T &&arg) {
  oss << arg;
}

template <typename T, typename... Args>
void log_impl(std::ostringstream &oss, T &&first, Args &&... args) {
  oss << first;
  log_impl(oss, args...);
}

} // namespace tabletimer
