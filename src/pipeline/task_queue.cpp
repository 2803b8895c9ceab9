#include "cgate/pipeline/task_queue.h"

#include <utility>

namespace cgate::pipeline {

bool TaskQueue::enqueue(Task task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      return false;
    }
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<Task> TaskQueue::dequeue() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) {
    return std::nullopt;
  }
  Task task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void TaskQueue::shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool TaskQueue::is_shut_down() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

}  // namespace cgate::pipeline
