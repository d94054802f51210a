/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex
 *
 *          - TimingCollector static members and methods
 */

#include "smart_cut/logging.hpp"

#include <algorithm>

#include <fmt/color.h>
#include <fmt/core.h>

namespace smart_cut {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

std::string job_tag(const std::string &job_id) {
  return fmt::format("[Job {}]", job_id.substr(0, 8));
}

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingStat> TimingCollector::phases;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  auto it =
      std::find_if(phases.begin(), phases.end(),
                   [&name](const TimingStat &s) { return s.name == name; });
  if (it == phases.end()) {
    phases.push_back({name, 0, 0, 0});
    it = phases.end() - 1;
  }
  it->runs += 1;
  it->total_us += us;
  it->max_us = std::max(it->max_us, us);
}

void TimingCollector::print_summary(std::FILE *out) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (phases.empty())
    return;

  fmt::print(out, "\n");
  fmt::print(out, fg(fmt::color::cyan),
             "===================== TIMING SUMMARY =====================\n");
  fmt::print(out, "{:<16} {:>6} {:>12} {:>12} {:>12}\n", "Phase", "Runs",
             "Total [s]", "Mean [s]", "Max [s]");
  fmt::print(out, "{:-<16} {:-<6} {:-<12} {:-<12} {:-<12}\n", "", "", "", "",
             "");

  for (const auto &s : phases) {
    fmt::print(out, "{:<16} {:>6} {:>12.2f} {:>12.2f} {:>12.2f}\n", s.name,
               s.runs, s.total_us / 1e6, s.mean_us() / 1e6, s.max_us / 1e6);
  }
  fmt::print(out, fg(fmt::color::cyan),
             "==========================================================\n");
  std::fflush(out);
}

std::vector<TimingStat> TimingCollector::stats() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return phases;
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  phases.clear();
}

} // namespace smart_cut
