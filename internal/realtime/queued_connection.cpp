#include "queued_connection.hpp"

#include "internal/observability/logging.hpp"

namespace dispatch::realtime {

using dispatch::realtime::v1::ServerMessage;

QueuedConnection::QueuedConnection(WriteFn write, CancelFn cancel, size_t max_queued)
    : write_(std::move(write)), cancel_(std::move(cancel)), writer_("realtime-writer", 1, max_queued) {
  writer_.Start();
}

QueuedConnection::~QueuedConnection() {
  Detach();
}

bool QueuedConnection::Send(const ServerMessage& message) {
  if (closed_.load()) {
    return false;
  }
  try {
    writer_.Submit([this, message] { Write(message); });
  } catch (const std::exception& e) {
    DISPATCH_LOG_WARN("realtime client fell behind, closing", {observability::StringField("error", e.what())});
    Close();
    return false;
  }
  return true;
}

void QueuedConnection::Close() {
  if (closed_.exchange(true)) {
    return;
  }
  if (cancel_) {
    cancel_();
  }
}

void QueuedConnection::Detach() {
  closed_ = true;
  writer_.Stop();
}

void QueuedConnection::Write(const ServerMessage& message) {
  if (closed_.load()) {
    return;
  }
  if (!write_(message)) {
    closed_ = true;
  }
}

} // namespace dispatch::realtime
