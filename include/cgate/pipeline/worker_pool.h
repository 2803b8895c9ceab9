#pragma once

#include "cgate/pipeline/task_queue.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <thread>
#include <vector>

namespace cgate::pipeline {

// WorkerPool runs submitted tasks on a fixed number of threads.
//
// Tasks are started in submission order. An exception thrown by a task is stored in
// the returned future and does not stop the worker. The destructor drains the queue
// and joins every thread.
class WorkerPool {
 public:
  // Throws std::invalid_argument when worker_count is 0.
  explicit WorkerPool(std::size_t worker_count);

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;
  ~WorkerPool();

  // Throws std::runtime_error after shutdown().
  [[nodiscard]] std::future<void> submit(std::function<void()> fn);

  // Stops accepting tasks, finishes the queued ones and joins the workers.
  // Idempotent.
  void shutdown();

  [[nodiscard]] std::size_t size() const noexcept { return worker_count_; }

 private:
  void run();

  std::size_t worker_count_;
  TaskQueue queue_;
  std::vector<std::thread> threads_;
  std::atomic<bool> joined_{false};
};

}  // namespace cgate::pipeline
