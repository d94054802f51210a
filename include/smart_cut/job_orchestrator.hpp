/**
 * @file job_orchestrator.hpp
 * @brief Asynchronous cut job orchestration
 *
 * @details The JobOrchestrator class accepts cut requests and runs them off
 *          the caller's thread:
 *
 *          - submit() checks the request synchronously (file, duration,
 *            segments), admits it under the concurrency ceiling and hands it
 *            to the worker pool
 *
 *          - get_status() returns a snapshot of a job, evicting it once it
 *            has been finished for longer than the retention window
 *
 *          - An optional sweeper thread evicts expired jobs without waiting
 *            for a query
 *
 * @note Configuration via environment variables (see config.hpp):
 *
 *       - MAX_CONCURRENT_JOBS: ceiling on processing jobs and pool size
 *
 *       - JOB_RETENTION_SEC: how long finished jobs stay queryable
 *
 *       - JOB_SWEEP_INTERVAL_SEC: sweeper period (0 = lazy expiry only)
 */

#ifndef SMART_CUT_JOB_ORCHESTRATOR_HPP
#define SMART_CUT_JOB_ORCHESTRATOR_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "cut_pipeline.hpp"
#include "ffmpeg_executor.hpp"
#include "job.hpp"
#include "job_registry.hpp"
#include "media_probe.hpp"
#include "types.hpp"
#include "worker_pool.hpp"

namespace smart_cut {

/**
 * @struct OrchestratorOptions
 * @brief Snapshot of the settings one orchestrator runs with.
 */
struct OrchestratorOptions {
  int max_concurrent_jobs = 2;
  std::chrono::milliseconds retention{3600 * 1000};
  std::chrono::milliseconds sweep_interval{0}; //< 0 = no sweeper thread
  PipelineSettings pipeline;

  /// Build from the Config:: environment values
  static OrchestratorOptions from_config();
};

/**
 * @class JobOrchestrator
 * @brief Admission, dispatch and status of cut jobs.
 *
 * @attention LIFETIME:
 *
 *   - The orchestrator owns its registry, pool, prober and runner
 *
 *   - Destruction stops the sweeper, then waits for every admitted job to
 *     reach a terminal state
 */
class JobOrchestrator {
public:
  using ClockFn = CutPipeline::ClockFn;

  /**
   * @param options Settings snapshot
   * @param prober Duration probe backend
   * @param runner Encoder process boundary
   * @param clock Time source for job timestamps and expiry (default: system)
   */
  JobOrchestrator(OrchestratorOptions options,
                  std::unique_ptr<MediaProber> prober,
                  std::unique_ptr<EncodeRunner> runner,
                  ClockFn clock = nullptr);
  ~JobOrchestrator();

  JobOrchestrator(const JobOrchestrator &) = delete;
  JobOrchestrator &operator=(const JobOrchestrator &) = delete;

  /**
   * @brief Check and admit a cut request, then start it in the background.
   *
   * @param input_path Media file to cut
   * @param deletes Ranges to remove
   * @return The new job's ID
   * @throws FileNotFoundError, ProbeError, ValidationError,
   *         NoRemainingContentError before admission
   * @throws TooManyJobsError when the ceiling is reached
   */
  std::string submit(const std::string &input_path,
                     const std::vector<SegmentInput> &deletes);

  /**
   * @brief Snapshot of a job.
   * @throws NotFoundError for an unknown ID
   * @throws ExpiredError for a job finished longer than retention ago (the
   *         job is evicted)
   */
  Job get_status(const std::string &job_id);

  /// Evict every expired job now; returns how many were evicted
  std::size_t sweep_expired();

  /// Jobs currently processing
  std::vector<Job> active_jobs() const;

  /// Jobs held in the registry, any state
  std::size_t job_count() const;

  const OrchestratorOptions &options() const { return options_; }

private:
  void sweeper_loop();

  OrchestratorOptions options_;
  std::unique_ptr<MediaProber> prober_;
  std::unique_ptr<EncodeRunner> runner_;
  ClockFn clock_;
  JobRegistry registry_;
  WorkerPool pool_; //< Declared after registry_: joined before it is destroyed

  std::mutex sweeper_mutex_;
  std::condition_variable sweeper_cv_;
  bool stopping_ = false;
  std::thread sweeper_;
};

} // namespace smart_cut

#endif // SMART_CUT_JOB_ORCHESTRATOR_HPP
