#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "task_queue.hpp"

namespace dispatch::async {

/*
  Fixed pool of threads draining a TaskQueue.

  Used to bound slow calls (geo backend, cluster peers) with a deadline:
  callers Submit() and wait on the returned future with wait_for().
  Submit throws when the worker is stopped or max_pending tasks are
  already waiting; callers treat both like a failed call.
*/
class TaskWorker {
 public:
  TaskWorker(std::string name, size_t threads, size_t max_pending = 0);
  ~TaskWorker();

  void Start();
  void Stop();

  template <typename Fn>
  auto Submit(Fn fn) -> std::future<decltype(fn())> {
    using R   = decltype(fn());
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    auto fut  = task->get_future();
    switch (queue_->Enqueue([task] { (*task)(); })) {
      case EnqueueStatus::kAccepted:
        return fut;
      case EnqueueStatus::kFull:
        throw std::runtime_error("worker " + name_ + " is saturated");
      case EnqueueStatus::kClosed:
        break;
    }
    throw std::runtime_error("worker " + name_ + " is stopped");
  }

 private:
  void Run();

  std::string                name_;
  size_t                     thread_count_;
  std::shared_ptr<TaskQueue> queue_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace dispatch::async
