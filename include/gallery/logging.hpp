/**
 * @file logging.hpp
 * @brief Leveled logging macros and build timing collection
 *
 * @details Provides:
 *          - LOG_DEBUG / LOG_INFO / LOG_WARN / LOG_ERROR, filtered at runtime
 *            by GALLERY_LOG_LEVEL and stamped with seconds since startup
 *
 *          - LOG_PHASE / LOG_SUCCESS banners (info level, colored)
 *
 *          - TIMER_START / TIMER_END feeding the TimingCollector
 *
 * @note Every line is written under log_mutex and flushed at once, so lines
 *       from concurrent workers never interleave mid-line.
 *
 */

#ifndef GALLERY_LOGGING_HPP
#define GALLERY_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace gallery {

// **----- COMPILE-TIME SWITCHES -----**

#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

// **----- LEVELS -----**

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Serializes all console output (defined in logging.cpp)
extern std::mutex log_mutex;

/**
 * @brief Lowest level that is printed.
 * @note Read once from GALLERY_LOG_LEVEL (debug, info, warn, error);
 *       unknown or missing values mean info.
 */
LogLevel log_threshold();

/// Parse a level name; returns fallback for anything unrecognized
LogLevel parse_log_level(const std::string &name, LogLevel fallback);

inline bool log_enabled(LogLevel level) {
  return static_cast<int>(level) >= static_cast<int>(log_threshold());
}

/// Seconds since the first log call of the process
double log_uptime();

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define GALLERY_LOG_AT(level, stream, style, tag, format_str, ...)            \
  do {                                                                         \
    if (gallery::log_enabled(level)) {                                         \
      std::lock_guard<std::mutex> gallery_log_lock(gallery::log_mutex);        \
      fmt::print(stream, style, "[{:8.3f}] " tag format_str "\n",              \
                 gallery::log_uptime(), ##__VA_ARGS__);                        \
      std::fflush(stream);                                                     \
    }                                                                          \
  } while (0)

#define LOG_DEBUG(format_str, ...)                                             \
  GALLERY_LOG_AT(gallery::LogLevel::Debug, stdout,                             \
                 fg(fmt::terminal_color::bright_black), "[DEBUG] ",            \
                 format_str, ##__VA_ARGS__)

#define LOG_INFO(format_str, ...)                                              \
  GALLERY_LOG_AT(gallery::LogLevel::Info, stdout, fmt::text_style(),           \
                 "[INFO] ", format_str, ##__VA_ARGS__)

#define LOG_WARN(format_str, ...)                                              \
  GALLERY_LOG_AT(gallery::LogLevel::Warn, stdout, fg(fmt::color::yellow),      \
                 "[WARN] ", format_str, ##__VA_ARGS__)

#define LOG_ERROR(format_str, ...)                                             \
  GALLERY_LOG_AT(gallery::LogLevel::Error, stderr, fg(fmt::color::red),        \
                 "[ERROR] ", format_str, ##__VA_ARGS__)

#define LOG_PHASE(format_str, ...)                                             \
  GALLERY_LOG_AT(gallery::LogLevel::Info, stdout, fg(fmt::color::cyan), "",    \
                 format_str, ##__VA_ARGS__)

#define LOG_SUCCESS(format_str, ...)                                           \
  GALLERY_LOG_AT(gallery::LogLevel::Info, stdout, fg(fmt::color::green), "",   \
                 format_str, ##__VA_ARGS__)
#else
#define LOG_DEBUG(...) ((void)0)
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @struct TimingEntry
 * @brief One recorded duration of a named build step.
 */
struct TimingEntry {
  std::string name;  //< Step name (read, decode, encode, scan, ...)
  long microseconds; //< Duration
};

/**
 * @class TimingCollector
 * @brief Process-wide record of build step durations.
 * @note record() is called from every worker; the summary folds repeated
 *       names (one per image) into a single row.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  static void record(const std::string &name, long us);

  /// Print the folded table (name, calls, total) once the build is over
  static void print_summary();

  /// Sum of every duration recorded under name (0 if none)
  static long total(const std::string &name);

  /// Number of durations recorded under name
  static size_t calls(const std::string &name);

  static void clear();
};

/// Microseconds elapsed since start
inline long elapsed_us(std::chrono::steady_clock::time_point start) {
  return static_cast<long>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now() - start)
          .count());
}

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  const auto gallery_timer_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  gallery::TimingCollector::record(#name,                                      \
                                   gallery::elapsed_us(gallery_timer_##name))
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace gallery

#endif // GALLERY_LOGGING_HPP
