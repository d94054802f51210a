/**
 * @file job_registry.hpp
 * @brief Thread-safe job store with retention-based eviction
 *
 * @details The registry is the only shared mutable structure of the
 *          orchestrator. Every operation takes its mutex; updates copy the
 *          record, modify the copy and store it back, so a reader never sees
 *          a half-written job.
 */

#ifndef SMART_CUT_JOB_REGISTRY_HPP
#define SMART_CUT_JOB_REGISTRY_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "job.hpp"

namespace smart_cut {

class JobRegistry {
public:
  /**
   * @brief Admission check and registration in one critical section.
   *
   * @param job Freshly created record (processing, progress 0)
   * @param max_processing Concurrency ceiling
   * @throws TooManyJobsError when max_processing jobs are already processing
   */
  void admit(Job job, int max_processing);

  /**
   * @brief Replace a record with a modified copy.
   *
   * @param id Job ID
   * @param fn Mutation applied to the copy
   * @return false if the job is unknown or already terminal (no change made)
   */
  bool update(const std::string &id, const std::function<void(Job &)> &fn);

  /// Copy of a record, without expiry handling
  std::optional<Job> get(const std::string &id) const;

  /**
   * @brief Copy of a record, evicting it first if it expired.
   *
   * @throws NotFoundError when the ID is unknown
   * @throws ExpiredError when the job was terminal for longer than retention
   *         (the record is removed; the next lookup reports NotFoundError)
   */
  Job lookup(const std::string &id, Clock::time_point now,
             Clock::duration retention);

  /**
   * @brief Evict every expired terminal job.
   * @return Number of evicted jobs
   */
  std::size_t sweep(Clock::time_point now, Clock::duration retention);

  std::size_t count_processing() const;
  std::vector<Job> processing_jobs() const;
  std::size_t size() const;

  /// Terminal and last updated more than retention ago
  static bool is_expired(const Job &job, Clock::time_point now,
                         Clock::duration retention);

private:
  std::size_t count_processing_locked() const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Job> jobs_;
};

} // namespace smart_cut

#endif // SMART_CUT_JOB_REGISTRY_HPP
