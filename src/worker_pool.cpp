/**
 * @file worker_pool.cpp
 * @brief Worker pool implementation
 */

#include "smart_cut/worker_pool.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "smart_cut/logging.hpp"

namespace smart_cut {

// **----- TaskQueue Implementation -----**

bool TaskQueue::push(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_.load())
      return false;
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

bool TaskQueue::pop(Task &task) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !tasks_.empty() || done_.load(); });

  if (tasks_.empty()) {
    return false;
  }

  task = std::move(tasks_.front());
  tasks_.pop();
  return true;
}

void TaskQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

// **----- WorkerPool Implementation -----**

WorkerPool::WorkerPool(std::size_t num_workers) {
  if (num_workers == 0)
    num_workers = 1;
  workers_.reserve(num_workers);
  for (std::size_t i = 0; i < num_workers; ++i) {
    workers_.emplace_back(&WorkerPool::worker_loop, this, i);
  }
}

WorkerPool::~WorkerPool() { shutdown(); }

void WorkerPool::submit(Task task) {
  if (!queue_.push(std::move(task))) {
    throw std::runtime_error("Worker pool is shut down");
  }
}

void WorkerPool::shutdown() {
  std::call_once(shutdown_once_, [this] {
    queue_.finish();
    for (auto &w : workers_) {
      if (w.joinable())
        w.join();
    }
  });
}

void WorkerPool::worker_loop(std::size_t worker_id) {
  Task task;
  while (queue_.pop(task)) {
    try {
      task();
    } catch (const std::exception &e) {
      LOG_ERROR("[Worker {}] Task failed: {}", worker_id, e.what());
    }
    task = nullptr;
  }
}

} // namespace smart_cut
