/**
 * @file logging.cpp
 * @brief Log level selection, uptime stamp and TimingCollector
 */

#include "gallery/logging.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

#include "gallery/config.hpp"

namespace gallery {

// **----- LOG STATE -----**

std::mutex log_mutex;

namespace {
const std::chrono::steady_clock::time_point process_start =
    std::chrono::steady_clock::now();
} // namespace

LogLevel parse_log_level(const std::string &name, LogLevel fallback) {
  std::string lower;
  for (unsigned char c : name)
    lower += static_cast<char>(std::tolower(c));

  if (lower == "debug")
    return LogLevel::Debug;
  if (lower == "info")
    return LogLevel::Info;
  if (lower == "warn" || lower == "warning")
    return LogLevel::Warn;
  if (lower == "error")
    return LogLevel::Error;
  return fallback;
}

LogLevel log_threshold() {
  static const LogLevel level =
      parse_log_level(Config::log_level(), LogLevel::Info);
  return level;
}

double log_uptime() { return elapsed_us(process_start) / 1000000.0; }

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

long TimingCollector::total(const std::string &name) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  long sum = 0;
  for (const auto &e : entries) {
    if (e.name == name)
      sum += e.microseconds;
  }
  return sum;
}

size_t TimingCollector::calls(const std::string &name) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return static_cast<size_t>(
      std::count_if(entries.begin(), entries.end(),
                    [&](const TimingEntry &e) { return e.name == name; }));
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  /// Per-image entries (e.g. transcode) are folded into one row per name
  std::vector<std::pair<TimingEntry, int>> rows;
  for (const auto &e : entries) {
    auto it = std::find_if(rows.begin(), rows.end(), [&](const auto &row) {
      return row.first.name == e.name;
    });
    if (it == rows.end()) {
      rows.push_back({e, 1});
    } else {
      it->first.microseconds += e.microseconds;
      it->second++;
    }
  }

  std::lock_guard<std::mutex> log_lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<22} {:>6} {:>22}\n", "Phase", "Calls", "Time (us) [sec]");
  fmt::print("{:-<22} {:-<6} {:-<22}\n", "", "", "");

  for (const auto &row : rows) {
    double seconds = row.first.microseconds / 1000000.0;
    fmt::print("{:<22} {:>6} {:>12} [{:.2f}s]\n", row.first.name, row.second,
               row.first.microseconds, seconds);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace gallery
