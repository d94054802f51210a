/**
 * @file job.hpp
 * @brief Job record and result types
 *
 * @details A job moves through
 *
 *          processing (progress 0..100) -> completed (result set)
 *                                       -> failed (error_message set)
 *
 *          and never leaves a terminal state.
 */

#ifndef SMART_CUT_JOB_HPP
#define SMART_CUT_JOB_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace smart_cut {

using Clock = std::chrono::system_clock;

enum class JobStatus { Processing, Completed, Failed };

/**
 * @struct JobResult
 * @brief What a completed job produced.
 */
struct JobResult {
  std::string output_path;
  std::vector<Segment> keep_segments;
  std::vector<Segment> delete_segments; //< As validated, before merging
  double original_duration = 0;
  double new_duration = 0;      //< Probed from the output file
  double compression_ratio = 0; //< new / original (0 when original is 0)
};

/**
 * @struct Job
 * @brief One cut request and its current state.
 * @note Records are replaced whole in the registry; readers hold copies.
 */
struct Job {
  std::string id;
  JobStatus status = JobStatus::Processing;
  int progress = 0;
  std::optional<JobResult> result;
  std::optional<std::string> error_message;
  std::string input_path;
  Clock::time_point created_at;
  Clock::time_point updated_at;

  bool is_terminal() const { return status != JobStatus::Processing; }
};

} // namespace smart_cut

#endif // SMART_CUT_JOB_HPP
