#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace dispatch::async {

using Task = std::function<void()>;

enum class EnqueueStatus {
  kAccepted,
  kFull,
  kClosed,
};

/*
  Blocking multi-consumer queue feeding a TaskWorker.

  With a non-zero max_pending, Enqueue refuses work instead of growing
  without bound while every consumer is stuck on a slow backend. After
  Close() consumers still drain what was accepted, then Dequeue returns
  nullopt.
*/
class TaskQueue {
 public:
  explicit TaskQueue(std::size_t max_pending = 0);

  EnqueueStatus Enqueue(Task task);

  // Blocks until a task is available or the queue is closed and drained.
  std::optional<Task> Dequeue();

  void        Close();
  std::size_t Pending();

 private:
  const std::size_t       max_pending_;
  std::mutex              mutex_;
  std::condition_variable ready_;
  std::deque<Task>        tasks_;
  bool                    closed_ = false;
};

} // namespace dispatch::async
