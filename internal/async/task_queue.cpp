#include "task_queue.hpp"

namespace dispatch::async {

TaskQueue::TaskQueue(std::size_t max_pending) : max_pending_(max_pending) {
}

EnqueueStatus TaskQueue::Enqueue(Task task) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return EnqueueStatus::kClosed;
    if (max_pending_ != 0 && tasks_.size() >= max_pending_) return EnqueueStatus::kFull;
    tasks_.push_back(std::move(task));
  }
  ready_.notify_one();
  return EnqueueStatus::kAccepted;
}

std::optional<Task> TaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);
  ready_.wait(lock, [this] { return closed_ || !tasks_.empty(); });
  if (tasks_.empty()) return std::nullopt;

  Task task = std::move(tasks_.front());
  tasks_.pop_front();
  return task;
}

void TaskQueue::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  ready_.notify_all();
}

std::size_t TaskQueue::Pending() {
  std::lock_guard lock(mutex_);
  return tasks_.size();
}

} // namespace dispatch::async
