#include "task_worker.hpp"

#include "internal/observability/logging.hpp"

namespace dispatch::async {

TaskWorker::TaskWorker(std::string name, size_t threads, size_t max_pending)
    : name_(std::move(name)), thread_count_(threads == 0 ? 1 : threads), queue_(std::make_shared<TaskQueue>(max_pending)) {
}

TaskWorker::~TaskWorker() {
  Stop();
}

void TaskWorker::Start() {
  if (running_.exchange(true)) return;
  for (size_t i = 0; i < thread_count_; ++i)
    threads_.emplace_back(&TaskWorker::Run, this);
}

void TaskWorker::Stop() {
  queue_->Close();
  running_ = false;
  for (auto& t : threads_)
    if (t.joinable()) t.join();
  threads_.clear();
}

void TaskWorker::Run() {
  while (auto task = queue_->Dequeue()) {
    try {
      (*task)();
    } catch (const std::exception& e) {
      DISPATCH_LOG_ERROR("background task failed", {observability::StringField("worker", name_), observability::StringField("error", e.what())});
    }
  }
}

} // namespace dispatch::async
