/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for aggregating performance metrics
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so job progress is visible while encodes run.
 *       Job-scoped lines carry a "[Job xxxxxxxx]" prefix (see job_tag()).
 */

#ifndef SMART_CUT_LOGGING_HPP
#define SMART_CUT_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace smart_cut {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by SMART_CUT_ENABLE_LOGGING at compile time.
 * @note Log lines go to stderr; stdout is left to command output (summaries,
 *       --json).
 */
#ifndef SMART_CUT_ENABLE_LOGGING
#define SMART_CUT_ENABLE_LOGGING 1
#endif

#ifndef SMART_CUT_ENABLE_TIMING
#define SMART_CUT_ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if SMART_CUT_ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(smart_cut::log_mutex);                    \
    fmt::print(stderr, "[INFO] " format_str "\n", ##__VA_ARGS__);              \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(smart_cut::log_mutex);                    \
    fmt::print(stderr, fg(fmt::color::yellow), "[WARN] " format_str "\n",      \
               ##__VA_ARGS__);                                                 \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(smart_cut::log_mutex);                    \
    fmt::print(stderr, fg(fmt::color::red), "[ERROR] " format_str "\n",        \
               ##__VA_ARGS__);                                                 \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(smart_cut::log_mutex);                    \
    fmt::print(stderr, fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);  \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(smart_cut::log_mutex);                    \
    fmt::print(stderr, fg(fmt::color::green), format_str "\n", ##__VA_ARGS__); \
    std::fflush(stderr);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

/**
 * @brief Short log prefix for a job ("[Job 1a2b3c4d]").
 * @param job_id Full job identifier
 */
std::string job_tag(const std::string &job_id);

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingStat: Accumulated measurements of one phase.
 * @note Phases are the TIMER_* names (job_total, probe_input, encode,
 *       probe_output), so one entry exists per phase however many jobs run.
 */
struct TimingStat {
  std::string name;  //< Phase name
  long runs = 0;     //< Measurements folded in
  long total_us = 0; //< Sum of durations in microseconds
  long max_us = 0;   //< Slowest single measurement

  long mean_us() const { return runs > 0 ? total_us / runs : 0; }
};

/**
 * @class TimingCollector
 * @brief Thread-safe singleton aggregating timing measurements per phase.
 * @note Every job worker records its probe and encode timings here. Memory
 *       stays bounded by the number of distinct phases, not jobs.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingStat> phases;

public:
  /**
   * @brief Fold one measurement into its phase.
   * @param name Phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Print runs, total, mean and max per phase as a table.
   * @param out Destination stream (the CLI uses stderr with --json)
   */
  static void print_summary(std::FILE *out = stdout);

  /// Per-phase totals, in order of first measurement
  static std::vector<TimingStat> stats();

  static void clear();
};

// **----- TIMING MACROS -----**

#if SMART_CUT_ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    smart_cut::TimingCollector::record(#name, timer_duration_##name);          \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace smart_cut

#endif // SMART_CUT_LOGGING_HPP
