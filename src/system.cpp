/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Encoder thread budgeting across concurrent jobs
 *
 *          - Time formatting utilities
 */

#include "smart_cut/system.hpp"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <fmt/core.h>

#include "smart_cut/config.hpp"

namespace smart_cut {

// **---- Internal Helpers ----**

namespace {

/// Read a single number from a cgroup file (-1 when absent or unreadable)
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// Count CPUs in a cpuset list such as "0-3,8,10-11"
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  if (line.empty())
    return -1;

  int count = 0;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t comma = line.find(',', pos);
    if (comma == std::string::npos)
      comma = line.size();
    std::string item = line.substr(pos, comma - pos);

    size_t dash = item.find('-');
    try {
      if (dash == std::string::npos) {
        std::stoi(item);
        ++count;
      } else {
        int lo = std::stoi(item.substr(0, dash));
        int hi = std::stoi(item.substr(dash + 1));
        count += (hi >= lo) ? hi - lo + 1 : 0;
      }
    } catch (const std::exception &) {
      return -1;
    }
    pos = comma + 1;
  }
  return count > 0 ? count : -1;
}

/// Ceiling of quota / period, or -1
int quota_cpus(long quota, long period) {
  if (quota <= 0 || period <= 0)
    return -1;
  return static_cast<int>((quota + period - 1) / period);
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Cgroup v2 (unified hierarchy): "max 100000" or "200000 100000"
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !period_str.empty()) {
        try {
          limit = quota_cpus(std::stol(quota_str), std::stol(period_str));
        } catch (const std::exception &) {
          limit = -1;
        }
      }
    }
  }

  /// Cgroup v1 CFS quota
  if (limit <= 0) {
    limit = quota_cpus(
        read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us"),
        read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us"));
  }

  /// Cpuset (counts actual allowed cores)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0) {
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
    }
  }

  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  if (limit <= 0)
    limit = 4;
  return std::min(limit, 64);
}

int encode_threads_per_job(int max_jobs) {
  int configured = Config::encode_threads();
  if (configured > 0)
    return configured;

  return std::max(1, detect_cpu_limit() / std::max(1, max_jobs));
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  return fmt::format("{:04d}{:02d}{:02d}_{:02d}{:02d}{:02d}",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec);
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch())
                .count() %
            1000;
  if (ms < 0)
    ms += 1000;
  return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, static_cast<int>(ms));
}

} // namespace smart_cut
