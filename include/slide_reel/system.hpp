/**
 * @file system.hpp
 * @brief System utilities: CPU detection, worker sizing, time formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Run worker count derived from the CPU limit
 *
 *          - Time formatting utilities
 *
 * @note For Docker containers, CPU discovery respects cgroup limits set by
 *       docker-compose or docker run --cpus flags.
 */

#ifndef SLIDE_REEL_SYSTEM_HPP
#define SLIDE_REEL_SYSTEM_HPP

#include <string>

namespace slide_reel {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cpuset: `/sys/fs/cgroup/cpuset/cpuset.cpus` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

/**
 * @brief Calculate the number of runs to process concurrently.
 *
 * @note Every run keeps one encoder process busy and the encoder is itself
 *       multi-threaded, so auto mode uses half the CPUs.
 *       RUN_WORKERS > 0 is honored but capped at the CPU limit.
 *
 * @return Number of run workers (at least 1)
 */
int calculate_run_workers();

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Format seconds with millisecond precision for ffmpeg arguments.
 * @note Fixed notation, trailing zeros removed ("61.5", "0.2", "60").
 */
std::string format_seconds(double seconds);

} // namespace slide_reel

#endif // SLIDE_REEL_SYSTEM_HPP
