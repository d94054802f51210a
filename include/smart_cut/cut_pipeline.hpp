/**
 * @file cut_pipeline.hpp
 * @brief Per-job cut workflow
 *
 * @details The CutPipeline class runs one admitted job on a worker thread and
 *          reports a fixed progress milestone after each phase:
 *
 *          10. Input file resolved
 *
 *          20. Duration probed
 *
 *          30. Segments validated, keep set computed
 *
 *          40. Output path and encode invocation prepared
 *
 *          50. Encode dispatched (single segment), or
 *          60. Filter graph built + 70. Encode dispatched (several segments)
 *
 *          90. Encode finished
 *
 *          100. Output verified and probed; job completed
 *
 * @note All log messages are prefixed with [Job xxxxxxxx]. A failure freezes
 *       progress at the last milestone reached and records the message.
 *       Partial output files are left in place.
 */

#ifndef SMART_CUT_CUT_PIPELINE_HPP
#define SMART_CUT_CUT_PIPELINE_HPP

#include <chrono>
#include <cstdio>
#include <functional>
#include <string>
#include <vector>

#include "encode_command.hpp"
#include "job.hpp"
#include "types.hpp"

namespace smart_cut {

class EncodeRunner;
class JobRegistry;
class MediaProber;

/**
 * @struct PipelineSettings
 * @brief Per-orchestrator knobs the worker needs.
 */
struct PipelineSettings {
  double min_segment_duration = MIN_SEGMENT_DURATION;
  std::chrono::milliseconds probe_timeout{30000};
  std::chrono::milliseconds encode_timeout{1800000};
  std::string output_dir = "processed";
  EncodeProfile profile;
  std::string ffmpeg_program = "ffmpeg"; //< Only used to log the command line
};

// Progress milestones
constexpr int PROGRESS_FILE_RESOLVED = 10;
constexpr int PROGRESS_DURATION_PROBED = 20;
constexpr int PROGRESS_SEGMENTS_VALIDATED = 30;
constexpr int PROGRESS_ENCODE_PREPARED = 40;
constexpr int PROGRESS_SINGLE_DISPATCHED = 50;
constexpr int PROGRESS_GRAPH_BUILT = 60;
constexpr int PROGRESS_CONCAT_DISPATCHED = 70;
constexpr int PROGRESS_ENCODE_DONE = 90;
constexpr int PROGRESS_DONE = 100;

/**
 * @class CutPipeline
 * @brief Runs one job from its delete ranges to a verified output file.
 *
 * @attention The pipeline only talks to the outside world through the prober,
 *            the runner and the registry it is handed; it owns none of them.
 */
class CutPipeline {
public:
  using ClockFn = std::function<Clock::time_point()>;

  CutPipeline(std::string job_id, std::string input_path,
              std::vector<SegmentInput> deletes,
              const PipelineSettings &settings, MediaProber &prober,
              EncodeRunner &runner, JobRegistry &registry, ClockFn clock);

  /**
   * @brief Run every phase and leave the job terminal.
   * @note Never throws: every failure is recorded on the job.
   */
  void run();

private:
  /// The phases; throws on the first failure
  JobResult execute();

  void report(int progress);
  void complete(JobResult result);
  void fail(const std::string &message);

  void log_info(const std::string &msg);
  void log_phase(const std::string &msg);

  std::string job_id_;
  std::string input_path_;
  std::vector<SegmentInput> deletes_;
  const PipelineSettings &settings_;
  MediaProber &prober_;
  EncodeRunner &runner_;
  JobRegistry &registry_;
  ClockFn clock_;
};

/**
 * @brief Print summary of what was cut.
 * @param result Completed job result
 * @param out Destination stream
 * @param prefix Prepended to each line (e.g. a job tag)
 */
void print_cut_summary(const JobResult &result, std::FILE *out = stdout,
                       const std::string &prefix = "");

} // namespace smart_cut

#endif // SMART_CUT_CUT_PIPELINE_HPP
