#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace cgate::pipeline {

using Task = std::function<void()>;

// TaskQueue is a thread-safe blocking FIFO shared by the workers of a WorkerPool.
class TaskQueue {
 public:
  // Returns false when the queue has been shut down; the task is dropped.
  bool enqueue(Task task);

  // Blocks until a task is available. Returns nullopt once the queue is shut down
  // and drained.
  std::optional<Task> dequeue();

  // Wakes every blocked dequeue(). Tasks already queued are still handed out.
  void shutdown();

  [[nodiscard]] bool is_shut_down() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<Task> queue_;
  bool shutdown_{false};
};

}  // namespace cgate::pipeline
