/**
 * @file worker_pool.hpp
 * @brief Fixed-size worker pool for job execution
 *
 * @details Producer-consumer pattern:
 *
 *          - The orchestrator (producer) pushes one task per admitted job
 *
 *          - N worker threads (consumers) pop and run tasks
 *
 *          - shutdown() stops intake, lets the workers drain the queue and
 *            joins them
 */

#ifndef SMART_CUT_WORKER_POOL_HPP
#define SMART_CUT_WORKER_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace smart_cut {

using Task = std::function<void()>;

/**
 * @class TaskQueue
 * @brief Thread-safe blocking queue of tasks.
 *
 * @attention USAGE:
 *
 *   - Producers call push()
 *
 *   - Workers call pop() in a loop
 *
 *   - Call finish() when nothing more will be pushed
 */
class TaskQueue {
public:
  /**
   * @brief Push a task to the queue.
   * @return false if the queue is already finished (task not queued)
   */
  bool push(Task task);

  /**
   * @brief Pop a task from the queue (blocking).
   * @param task Output: the task to run
   * @return true if a task was retrieved, false if queue is finished and empty
   */
  bool pop(Task &task);

  /**
   * @brief Signal that no more tasks will be pushed.
   */
  void finish();

  bool is_done() const { return done_.load() && empty(); }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.empty();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<Task> tasks_;
  std::atomic<bool> done_{false};
};

/**
 * @class WorkerPool
 * @brief N threads consuming one TaskQueue.
 *
 * @note Tasks must not throw; the job worker records its own failures. A task
 *       that throws anyway is logged and the worker keeps running.
 */
class WorkerPool {
public:
  explicit WorkerPool(std::size_t num_workers);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /**
   * @brief Queue a task.
   * @throws std::runtime_error after shutdown()
   */
  void submit(Task task);

  /**
   * @brief Stop intake, run every queued task, join the workers.
   * @note Idempotent.
   */
  void shutdown();

  std::size_t size() const { return workers_.size(); }

private:
  void worker_loop(std::size_t worker_id);

  TaskQueue queue_;
  std::vector<std::thread> workers_;
  std::once_flag shutdown_once_;
};

} // namespace smart_cut

#endif // SMART_CUT_WORKER_POOL_HPP
