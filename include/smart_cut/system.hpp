/**
 * @file system.hpp
 * @brief System utilities: CPU budget detection and time formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Per-job encoder thread budget
 *
 *          - Time formatting utilities for logs, file names and JSON
 */

#ifndef SMART_CUT_SYSTEM_HPP
#define SMART_CUT_SYSTEM_HPP

#include <chrono>
#include <string>

namespace smart_cut {

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
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cpuset: `cpuset.cpus.effective` / `cpuset.cpus`
 *
 * @return Detected CPU limit in [1, 64]
 */
int detect_cpu_limit();

/**
 * @brief Encoder threads to give each concurrently running job.
 *
 * @param max_jobs Concurrency ceiling of the orchestrator
 * @return ENCODE_THREADS when set, else max(1, cpu_limit / max_jobs)
 */
int encode_threads_per_job(int max_jobs);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Compact local timestamp for file names ("20240131_235959").
 */
std::string format_timestamp(std::chrono::system_clock::time_point tp);

/**
 * @brief UTC timestamp in ISO-8601 with millisecond precision
 *        ("2024-01-31T23:59:59.123Z").
 */
std::string format_iso8601(std::chrono::system_clock::time_point tp);

} // namespace smart_cut

#endif // SMART_CUT_SYSTEM_HPP
