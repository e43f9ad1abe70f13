#pragma once

#include "dispatch/realtime/v1/messages.pb.h"

namespace dispatch::realtime {

/*
  Transport side of one client connection. Owned by the transport that
  accepted it; the gateway only holds it while registered.
*/
class Connection {
 public:
  virtual ~Connection() = default;

  // False once the transport is gone.
  virtual bool Send(const dispatch::realtime::v1::ServerMessage& message) = 0;

  // Forcibly terminates the transport. Safe to call more than once.
  virtual void Close() = 0;
};

} // namespace dispatch::realtime
