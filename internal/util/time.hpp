#pragma once

#include <cstdint>

#include <google/protobuf/timestamp.pb.h>

namespace dispatch::util {

// Wall-clock milliseconds since the Unix epoch. Every persisted *_at_ms field uses this scale.
uint64_t NowMillis();

// 0 means "not set" throughout the records and maps to an empty Timestamp.
google::protobuf::Timestamp MillisToProto(uint64_t ms);

google::protobuf::Timestamp NowProto();

} // namespace dispatch::util
