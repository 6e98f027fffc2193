/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection
 *
 *          - Worker count calculation
 *
 *          - Byte size formatting
 */

#include "gallery/system.hpp"

#include <algorithm>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <thread>

#include <fmt/core.h>

namespace gallery {

// **---- Internal Helpers ----**

namespace {

/// Upper bound on workers; transcoding is memory heavy per thread
constexpr int MAX_WORKERS = 64;

/// Parse a non-negative integer, -1 on failure
long parse_long(const std::string &text) {
  if (text.empty())
    return -1;
  char *end = nullptr;
  long val = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || val < 0)
    return -1;
  return val;
}

/// Cgroup v2 "cpu.max" holds "<quota> <period>" or "max <period>"
int read_cgroup_v2_quota() {
  std::ifstream f("/sys/fs/cgroup/cpu.max");
  if (!f)
    return -1;
  std::string quota_str, period_str;
  f >> quota_str >> period_str;
  if (quota_str == "max")
    return -1;
  long quota = parse_long(quota_str);
  long period = parse_long(period_str);
  if (quota <= 0 || period <= 0)
    return -1;
  return static_cast<int>((quota + period - 1) / period);
}

int read_cgroup_v1_quota() {
  std::ifstream qf("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
  std::ifstream pf("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
  if (!qf || !pf)
    return -1;
  std::string quota_str, period_str;
  qf >> quota_str;
  pf >> period_str;
  long quota = parse_long(quota_str);
  long period = parse_long(period_str);
  if (quota <= 0 || period <= 0)
    return -1;
  return static_cast<int>((quota + period - 1) / period);
}

int read_cpuset_count() {
  for (const char *path : {"/sys/fs/cgroup/cpuset.cpus.effective",
                           "/sys/fs/cgroup/cpuset/cpuset.cpus"}) {
    std::ifstream f(path);
    if (!f)
      continue;
    std::string line;
    std::getline(f, line);
    int count = count_cpuset_list(line);
    if (count > 0)
      return count;
  }
  return -1;
}

} // anonymous namespace

// **---- CPU Detection ----**

int count_cpuset_list(const std::string &line) {
  int count = 0;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t end = line.find(',', pos);
    if (end == std::string::npos)
      end = line.size();
    std::string item = line.substr(pos, end - pos);
    pos = end + 1;

    /// Trailing newline or blanks
    item.erase(std::remove_if(item.begin(), item.end(),
                              [](unsigned char c) { return std::isspace(c); }),
               item.end());
    if (item.empty())
      continue;

    size_t dash = item.find('-');
    if (dash == std::string::npos) {
      if (parse_long(item) < 0)
        return -1;
      count++;
    } else {
      long first = parse_long(item.substr(0, dash));
      long last = parse_long(item.substr(dash + 1));
      if (first < 0 || last < first)
        return -1;
      count += static_cast<int>(last - first + 1);
    }
  }
  return count > 0 ? count : -1;
}

int detect_cpu_limit() {
  int limit = read_cgroup_v2_quota();
  if (limit <= 0)
    limit = read_cgroup_v1_quota();

  /// A cpuset narrower than the quota is the real limit
  int cpuset = read_cpuset_count();
  if (cpuset > 0 && (limit <= 0 || cpuset < limit))
    limit = cpuset;

  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());
  if (limit <= 0)
    limit = 4;
  return std::min(limit, MAX_WORKERS);
}

int calculate_worker_count(int configured, size_t jobs) {
  int workers = configured > 0 ? std::min(configured, MAX_WORKERS)
                               : detect_cpu_limit();
  if (jobs < static_cast<size_t>(workers))
    workers = static_cast<int>(jobs);
  return std::max(1, workers);
}

// **---- Utilities ----**

std::string format_size(size_t bytes) {
  if (bytes < 1024)
    return fmt::format("{} B", bytes);
  double value = static_cast<double>(bytes) / 1024.0;
  if (value < 1024.0)
    return fmt::format("{:.1f} KiB", value);
  value /= 1024.0;
  if (value < 1024.0)
    return fmt::format("{:.1f} MiB", value);
  return fmt::format("{:.2f} GiB", value / 1024.0);
}

std::string signal_name(int sig) {
  switch (sig) {
  case SIGINT:
    return "SIGINT";
  case SIGTERM:
    return "SIGTERM";
  case SIGHUP:
    return "SIGHUP";
  case SIGQUIT:
    return "SIGQUIT";
  default:
    return fmt::format("signal {}", sig);
  }
}

} // namespace gallery
