#include "cgate/pipeline/worker_pool.h"

#include <memory>
#include <stdexcept>
#include <utility>

namespace cgate::pipeline {

WorkerPool::WorkerPool(std::size_t worker_count) : worker_count_(worker_count) {
  if (worker_count == 0) {
    throw std::invalid_argument("WorkerPool requires at least one worker");
  }
  threads_.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    threads_.emplace_back(&WorkerPool::run, this);
  }
}

WorkerPool::~WorkerPool() { shutdown(); }

std::future<void> WorkerPool::submit(std::function<void()> fn) {
  auto task = std::make_shared<std::packaged_task<void()>>(std::move(fn));
  auto future = task->get_future();
  if (!queue_.enqueue([task] { (*task)(); })) {
    throw std::runtime_error("WorkerPool is shut down");
  }
  return future;
}

void WorkerPool::shutdown() {
  queue_.shutdown();
  if (joined_.exchange(true)) {
    return;
  }
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

void WorkerPool::run() {
  while (auto task = queue_.dequeue()) {
    // packaged_task stores any exception in its future.
    (*task)();
  }
}

}  // namespace cgate::pipeline
