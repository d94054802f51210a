/**
 * @file job_registry.cpp
 * @brief Job store implementation
 */

#include "smart_cut/job_registry.hpp"

#include <utility>

#include <fmt/core.h>

#include "smart_cut/errors.hpp"

namespace smart_cut {

bool JobRegistry::is_expired(const Job &job, Clock::time_point now,
                             Clock::duration retention) {
  return job.is_terminal() && (now - job.updated_at) > retention;
}

std::size_t JobRegistry::count_processing_locked() const {
  std::size_t n = 0;
  for (const auto &kv : jobs_) {
    if (kv.second.status == JobStatus::Processing)
      ++n;
  }
  return n;
}

void JobRegistry::admit(Job job, int max_processing) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t processing = count_processing_locked();
  if (static_cast<long>(processing) >= max_processing) {
    throw TooManyJobsError(fmt::format(
        "Too many concurrent jobs ({}/{}). Try again later.", processing,
        max_processing));
  }
  std::string id = job.id;
  jobs_.emplace(std::move(id), std::move(job));
}

bool JobRegistry::update(const std::string &id,
                         const std::function<void(Job &)> &fn) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end() || it->second.is_terminal())
    return false;

  Job copy = it->second;
  fn(copy);
  it->second = std::move(copy);
  return true;
}

std::optional<Job> JobRegistry::get(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end())
    return std::nullopt;
  return it->second;
}

Job JobRegistry::lookup(const std::string &id, Clock::time_point now,
                        Clock::duration retention) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    throw NotFoundError(fmt::format("Job {} not found", id));
  }
  if (is_expired(it->second, now, retention)) {
    jobs_.erase(it);
    throw ExpiredError(fmt::format("Job {} has expired", id));
  }
  return it->second;
}

std::size_t JobRegistry::sweep(Clock::time_point now,
                               Clock::duration retention) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t evicted = 0;
  for (auto it = jobs_.begin(); it != jobs_.end();) {
    if (is_expired(it->second, now, retention)) {
      it = jobs_.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }
  return evicted;
}

std::size_t JobRegistry::count_processing() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_processing_locked();
}

std::vector<Job> JobRegistry::processing_jobs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Job> out;
  for (const auto &kv : jobs_) {
    if (kv.second.status == JobStatus::Processing)
      out.push_back(kv.second);
  }
  return out;
}

std::size_t JobRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

} // namespace smart_cut
