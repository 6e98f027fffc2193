/**
 * @file system.hpp
 * @brief System utilities: CPU detection and formatting helpers
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for containers
 *
 *          - Worker count calculation for the transcode pool
 *
 *          - Byte size formatting for log output
 *
 * @note In containers, std::thread::hardware_concurrency() reports the host's
 *       cores. The pool is sized from the cgroup limit instead.
 */

#ifndef GALLERY_SYSTEM_HPP
#define GALLERY_SYSTEM_HPP

#include <cstddef>
#include <string>

namespace gallery {

// **---- CPU Detection ----**

/**
 * @brief Detect the number of CPUs available to this process.
 *
 * @note Checked in order:
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cpuset: `cpuset.cpus.effective` / `cpuset.cpus`
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

/**
 * @brief Number of transcode workers to start.
 *
 * @param configured Requested worker count (0 = auto)
 * @param jobs Number of images to transcode
 * @return min(workers, jobs), at least 1
 */
int calculate_worker_count(int configured, size_t jobs);

/**
 * @brief Parse a cpuset list such as "0-3,8,10-11".
 * @return Number of CPUs in the list, or -1 if empty or malformed
 */
int count_cpuset_list(const std::string &line);

// **---- Utilities ----**

/**
 * @brief Format a byte count for humans ("512 B", "1.4 MiB").
 */
std::string format_size(size_t bytes);

/**
 * @brief Name of a shutdown signal ("SIGINT", "SIGTERM", "signal 10").
 * @note Returns fixed strings; callable from any thread.
 */
std::string signal_name(int sig);

} // namespace gallery

#endif // GALLERY_SYSTEM_HPP
