/**
 * @file cut_pipeline.cpp
 * @brief Per-job cut workflow implementation
 */

#include "smart_cut/cut_pipeline.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

#include "smart_cut/errors.hpp"
#include "smart_cut/ffmpeg_executor.hpp"
#include "smart_cut/job_registry.hpp"
#include "smart_cut/logging.hpp"
#include "smart_cut/media_probe.hpp"
#include "smart_cut/segments.hpp"
#include "smart_cut/system.hpp"

namespace smart_cut {

namespace fs = std::filesystem;

// **---- Constructor ----**

CutPipeline::CutPipeline(std::string job_id, std::string input_path,
                         std::vector<SegmentInput> deletes,
                         const PipelineSettings &settings, MediaProber &prober,
                         EncodeRunner &runner, JobRegistry &registry,
                         ClockFn clock)
    : job_id_(std::move(job_id)), input_path_(std::move(input_path)),
      deletes_(std::move(deletes)), settings_(settings), prober_(prober),
      runner_(runner), registry_(registry), clock_(std::move(clock)) {}

// **---- Logging Helpers ----**

void CutPipeline::log_info(const std::string &msg) {
  LOG_INFO("{} {}", job_tag(job_id_), msg);
}

void CutPipeline::log_phase(const std::string &msg) {
  LOG_PHASE("{} {}", job_tag(job_id_), msg);
}

// **---- State Updates ----**

void CutPipeline::report(int progress) {
  const auto now = clock_();
  registry_.update(job_id_, [&](Job &job) {
    job.progress = std::max(job.progress, progress);
    job.updated_at = now;
  });
}

void CutPipeline::complete(JobResult result) {
  const auto now = clock_();
  registry_.update(job_id_, [&](Job &job) {
    job.status = JobStatus::Completed;
    job.progress = PROGRESS_DONE;
    job.result = std::move(result);
    job.updated_at = now;
  });
}

void CutPipeline::fail(const std::string &message) {
  LOG_ERROR("{} Failed: {}", job_tag(job_id_), message);
  const auto now = clock_();
  registry_.update(job_id_, [&](Job &job) {
    job.status = JobStatus::Failed;
    job.error_message = message;
    job.updated_at = now;
  });
}

// **---- Main Processing ----**

void CutPipeline::run() {
  TIMER_START(job_total);
  try {
    JobResult result = execute();
    log_info(fmt::format("Completed: {} ({:.1f}% of original)",
                         fs::path(result.output_path).filename().string(),
                         result.compression_ratio * 100.0));
    complete(std::move(result));
  } catch (const std::exception &e) {
    fail(e.what());
  } catch (...) {
    fail("Unknown error");
  }
  TIMER_END(job_total);
}

JobResult CutPipeline::execute() {
  // **----- PHASE 1: RESOLVE INPUT -----**

  if (!fs::is_regular_file(input_path_)) {
    throw FileNotFoundError(fmt::format("File not found: {}", input_path_));
  }
  report(PROGRESS_FILE_RESOLVED);

  // **----- PHASE 2: PROBE -----**

  log_phase("Probing...");
  TIMER_START(probe_input);
  const double duration =
      prober_.probe_duration(input_path_, settings_.probe_timeout);
  TIMER_END(probe_input);
  log_info(fmt::format("Duration: {} ({:.2f}s)", format_time(duration),
                       duration));
  report(PROGRESS_DURATION_PROBED);

  // **----- PHASE 3: SEGMENTS -----**

  std::vector<Segment> deletes = validate_segments(deletes_, duration);
  std::vector<Segment> keep =
      plan_keep_segments(deletes, duration, settings_.min_segment_duration);
  log_info(fmt::format("{} delete range(s) -> {} keep segment(s), {:.2f}s kept",
                       deletes.size(), keep.size(), total_length(keep)));
  report(PROGRESS_SEGMENTS_VALIDATED);

  // **----- PHASE 4: PREPARE ENCODE -----**

  const std::string output_path = make_output_path(
      input_path_, settings_.output_dir, job_id_, clock_());
  EncodeInvocation invocation = build_encode_invocation(
      input_path_, keep, output_path, settings_.profile);
  report(PROGRESS_ENCODE_PREPARED);

  if (invocation.mode == EncodeMode::Concat) {
    if (invocation.segments.size() < keep.size()) {
      LOG_WARN("{} Skipping {} segment(s) shorter than {}s", job_tag(job_id_),
               keep.size() - invocation.segments.size(),
               MIN_ENCODE_SEGMENT_DURATION);
    }
    log_info(fmt::format("Filter graph: {} trim stage(s), {} concat stage(s)",
                         invocation.graph.trims().size(),
                         invocation.graph.concats().size()));
    report(PROGRESS_GRAPH_BUILT);
    report(PROGRESS_CONCAT_DISPATCHED);
  } else {
    report(PROGRESS_SINGLE_DISPATCHED);
  }

  // **----- PHASE 5: ENCODE -----**

  log_phase("Cutting...");
  log_info(invocation.command_line(settings_.ffmpeg_program));
  TIMER_START(encode);
  execute_ffmpeg_cut(runner_, invocation, settings_.encode_timeout, job_id_);
  TIMER_END(encode);
  report(PROGRESS_ENCODE_DONE);

  // **----- PHASE 6: VERIFY -----**

  TIMER_START(probe_output);
  const double new_duration =
      prober_.probe_duration(output_path, settings_.probe_timeout);
  TIMER_END(probe_output);

  JobResult result;
  result.output_path = output_path;
  result.keep_segments = std::move(keep);
  result.delete_segments = std::move(deletes);
  result.original_duration = duration;
  result.new_duration = new_duration;
  result.compression_ratio = duration > 0 ? new_duration / duration : 0.0;
  return result;
}

// **---- Cut Summary ----**

void print_cut_summary(const JobResult &result, std::FILE *out,
                       const std::string &prefix) {
  const double removed =
      std::max(0.0, result.original_duration - result.new_duration);
  const double saved_pct = result.original_duration > 0
                               ? removed / result.original_duration * 100.0
                               : 0.0;

  fmt::print(out, "\n");
  fmt::print(out, fg(fmt::color::cyan),
             "{}=================== CUT SUMMARY ====================\n",
             prefix);
  fmt::print(out, "{}{:<20} {:>15}\n", prefix, "Original:",
             format_time(result.original_duration));
  fmt::print(out, "{}{:<20} {:>15}\n", prefix, "Output:",
             format_time(result.new_duration));
  fmt::print(out, "{}{:<20} {:>15}\n", prefix, "Removed:",
             format_time(removed));
  fmt::print(out, "{}{:<20} {:>14}%\n", prefix, "Saved:",
             static_cast<int>(saved_pct));
  fmt::print(out, "{}{:<20} {:>15}\n", prefix, "Segments kept:",
             result.keep_segments.size());
  fmt::print(out, "{}{:<20} {}\n", prefix, "File:", result.output_path);
  fmt::print(out, fg(fmt::color::cyan),
             "{}====================================================\n",
             prefix);
  std::fflush(out);
}

} // namespace smart_cut
