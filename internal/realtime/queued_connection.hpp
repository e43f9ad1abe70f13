#pragma once

#include <atomic>
#include <cstddef>
#include <functional>

#include "connection.hpp"
#include "internal/async/task_worker.hpp"

namespace dispatch::realtime {

/*
  Connection whose Send only queues the frame. A dedicated writer thread
  performs the blocking transport write, so a slow client never stalls
  the thread that produced the message. A client that falls max_queued
  frames behind is closed.
*/
class QueuedConnection final : public Connection {
 public:
  // write returns false once the transport is gone; cancel aborts it.
  using WriteFn  = std::function<bool(const dispatch::realtime::v1::ServerMessage&)>;
  using CancelFn = std::function<void()>;

  QueuedConnection(WriteFn write, CancelFn cancel, size_t max_queued);
  ~QueuedConnection() override;

  bool Send(const dispatch::realtime::v1::ServerMessage& message) override;
  void Close() override;

  // Stops the writer. Queued frames are dropped; no write starts after
  // this returns.
  void Detach();

 private:
  void Write(const dispatch::realtime::v1::ServerMessage& message);

  WriteFn           write_;
  CancelFn          cancel_;
  std::atomic<bool> closed_{false};
  async::TaskWorker writer_;
};

} // namespace dispatch::realtime
