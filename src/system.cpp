/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Run worker sizing
 *
 *          - Time formatting utilities
 */

#include "slide_reel/system.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <string>
#include <thread>

#include <fmt/core.h>

#include "slide_reel/config.hpp"

namespace slide_reel {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// Quota/period rounded up to whole CPUs, or -1 when unlimited
int cpus_from_quota(long quota, long period) {
  if (quota <= 0 || period <= 0)
    return -1;
  return static_cast<int>((quota + period - 1) / period);
}

/// Count CPUs in a cpuset list such as "0-3,6,8-9"
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);

  int count = 0;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t comma = line.find(',', pos);
    std::string item =
        line.substr(pos, comma == std::string::npos ? std::string::npos
                                                    : comma - pos);
    size_t dash = item.find('-');
    int first = std::atoi(item.c_str());
    int last = (dash == std::string::npos) ? first
                                           : std::atoi(item.c_str() + dash + 1);
    if (last >= first)
      count += last - first + 1;
    if (comma == std::string::npos)
      break;
    pos = comma + 1;
  }
  return count > 0 ? count : -1;
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Cgroup v2: "max 100000" or "200000 100000"
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    std::string quota_str;
    long period = 0;
    if (f >> quota_str >> period && quota_str != "max") {
      limit = cpus_from_quota(std::atol(quota_str.c_str()), period);
    }
  }

  /// Cgroup v1 CPU quota
  if (limit <= 0) {
    limit = cpus_from_quota(
        read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us"),
        read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us"));
  }

  /// Cpuset (v2 then v1)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0)
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
  }

  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  return std::min(limit, 64);
}

int calculate_run_workers() {
  int available = detect_cpu_limit();
  int configured = Config::run_workers();

  /// Auto-detect: half the CPUs, the encoder threads itself
  if (configured <= 0) {
    return std::max(1, available / 2);
  }

  /// User configured: take minimum of configured and available
  return std::max(1, std::min(configured, available));
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_seconds(double seconds) {
  std::string out = fmt::format("{:.3f}", seconds);
  while (!out.empty() && out.back() == '0')
    out.pop_back();
  if (!out.empty() && out.back() == '.')
    out.pop_back();
  return out;
}

} // namespace slide_reel
