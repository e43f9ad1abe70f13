#include "time.hpp"

#include <chrono>

namespace dispatch::util {

uint64_t NowMillis() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

google::protobuf::Timestamp MillisToProto(uint64_t ms) {
  google::protobuf::Timestamp ts;
  if (ms != 0) {
    ts.set_seconds(static_cast<int64_t>(ms / 1000));
    ts.set_nanos(static_cast<int32_t>((ms % 1000) * 1'000'000));
  }
  return ts;
}

google::protobuf::Timestamp NowProto() {
  using namespace std::chrono;
  const auto now   = system_clock::now().time_since_epoch();
  const auto secs  = duration_cast<seconds>(now);
  const auto nanos = duration_cast<nanoseconds>(now - secs);

  google::protobuf::Timestamp ts;
  ts.set_seconds(secs.count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

} // namespace dispatch::util
