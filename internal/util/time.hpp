#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace fwbuild::util {

/*
  Time utilities. All clock reads go through here.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// Millisecond precision; the status store persists milliseconds.
google::protobuf::Timestamp NowProto();
uint64_t                    ToUnixMillis(const google::protobuf::Timestamp& ts);
google::protobuf::Timestamp TimestampFromUnixMillis(uint64_t ms);

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d);

} // namespace fwbuild::util
