/**
 * @file job_orchestrator.cpp
 * @brief Job orchestration implementation
 *
 * @details Implements the JobOrchestrator:
 *
 *          - Synchronous request checks and atomic admission
 *
 *          - Dispatch of CutPipeline runs onto the worker pool
 *
 *          - Lazy and periodic expiry
 */

#include "smart_cut/job_orchestrator.hpp"

#include <filesystem>
#include <utility>

#include <fmt/core.h>

#include "smart_cut/config.hpp"
#include "smart_cut/errors.hpp"
#include "smart_cut/logging.hpp"
#include "smart_cut/segments.hpp"
#include "smart_cut/system.hpp"
#include "smart_cut/uuid.hpp"

namespace smart_cut {

namespace fs = std::filesystem;

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
  return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

} // anonymous namespace

OrchestratorOptions OrchestratorOptions::from_config() {
  OrchestratorOptions o;
  o.max_concurrent_jobs = Config::max_concurrent_jobs();
  if (o.max_concurrent_jobs < 1) {
    throw ConfigError(fmt::format("MAX_CONCURRENT_JOBS must be >= 1 (got {})",
                                  o.max_concurrent_jobs));
  }
  o.retention = seconds_to_ms(Config::job_retention_sec());
  o.sweep_interval = seconds_to_ms(Config::job_sweep_interval_sec());

  o.pipeline.min_segment_duration = Config::min_segment_duration();
  o.pipeline.probe_timeout = seconds_to_ms(Config::probe_timeout_sec());
  o.pipeline.encode_timeout = seconds_to_ms(Config::encode_timeout_sec());
  o.pipeline.output_dir = Config::output_dir();
  o.pipeline.ffmpeg_program = Config::ffmpeg_path();

  o.pipeline.profile.preset = Config::video_preset();
  o.pipeline.profile.crf = Config::video_crf();
  o.pipeline.profile.audio_bitrate = Config::audio_bitrate();
  o.pipeline.profile.threads = encode_threads_per_job(o.max_concurrent_jobs);
  return o;
}

// **---- Lifecycle ----**

JobOrchestrator::JobOrchestrator(OrchestratorOptions options,
                                 std::unique_ptr<MediaProber> prober,
                                 std::unique_ptr<EncodeRunner> runner,
                                 ClockFn clock)
    : options_(std::move(options)), prober_(std::move(prober)),
      runner_(std::move(runner)),
      clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })),
      pool_(static_cast<std::size_t>(
          options_.max_concurrent_jobs > 0 ? options_.max_concurrent_jobs
                                           : 1)) {
  LOG_INFO("Job orchestrator: {} worker(s), retention {}s",
           pool_.size(), options_.retention.count() / 1000);

  if (options_.sweep_interval.count() > 0) {
    LOG_INFO("Expiry sweep every {}ms", options_.sweep_interval.count());
    sweeper_ = std::thread(&JobOrchestrator::sweeper_loop, this);
  }
}

JobOrchestrator::~JobOrchestrator() {
  {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    stopping_ = true;
  }
  sweeper_cv_.notify_all();
  if (sweeper_.joinable())
    sweeper_.join();

  /// Admitted jobs run to a terminal state
  pool_.shutdown();
}

// **---- Submission ----**

std::string JobOrchestrator::submit(const std::string &input_path,
                                    const std::vector<SegmentInput> &deletes) {
  if (!fs::is_regular_file(input_path)) {
    throw FileNotFoundError(fmt::format("File not found: {}", input_path));
  }

  const double duration = prober_->probe_duration(
      input_path, options_.pipeline.probe_timeout);
  std::vector<Segment> validated = validate_segments(deletes, duration);
  plan_keep_segments(validated, duration,
                     options_.pipeline.min_segment_duration);

  Job job;
  job.id = generate_job_id();
  job.status = JobStatus::Processing;
  job.progress = 0;
  job.input_path = input_path;
  job.created_at = clock_();
  job.updated_at = job.created_at;

  const std::string id = job.id;
  registry_.admit(std::move(job), options_.max_concurrent_jobs);

  LOG_INFO("{} Accepted {} ({} delete range(s))", job_tag(id),
           fs::path(input_path).filename().string(), deletes.size());

  try {
    pool_.submit([this, id, input_path, deletes] {
      CutPipeline pipeline(id, input_path, deletes, options_.pipeline,
                           *prober_, *runner_, registry_, clock_);
      pipeline.run();
    });
  } catch (const std::exception &e) {
    const auto now = clock_();
    registry_.update(id, [&](Job &j) {
      j.status = JobStatus::Failed;
      j.error_message = e.what();
      j.updated_at = now;
    });
    throw;
  }
  return id;
}

// **---- Queries ----**

Job JobOrchestrator::get_status(const std::string &job_id) {
  return registry_.lookup(job_id, clock_(), options_.retention);
}

std::size_t JobOrchestrator::sweep_expired() {
  std::size_t evicted = registry_.sweep(clock_(), options_.retention);
  if (evicted > 0) {
    LOG_INFO("Evicted {} expired job(s)", evicted);
  }
  return evicted;
}

std::vector<Job> JobOrchestrator::active_jobs() const {
  return registry_.processing_jobs();
}

std::size_t JobOrchestrator::job_count() const { return registry_.size(); }

// **---- Sweeper ----**

void JobOrchestrator::sweeper_loop() {
  std::unique_lock<std::mutex> lock(sweeper_mutex_);
  while (!stopping_) {
    sweeper_cv_.wait_for(lock, options_.sweep_interval,
                         [this] { return stopping_; });
    if (stopping_)
      break;
    lock.unlock();
    sweep_expired();
    lock.lock();
  }
}

} // namespace smart_cut
