#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace pef::util {

/*
  Clock and conversions between wall time, unix seconds and protobuf
  Timestamp.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

TimePoint FromUnixSeconds(std::int64_t seconds);
std::int64_t ToUnixSeconds(TimePoint tp);

// "YYYY-MM-DD HH:MM:SS" in local time, as written to summaries.
std::string FormatLocal(TimePoint tp);

} // namespace pef::util
