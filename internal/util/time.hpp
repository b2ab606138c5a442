#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace bidsub::util {

/*
  Wall-clock helpers. Deadlines and job timestamps persist as unix
  milliseconds and are shown to operators as RFC 3339 UTC.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

std::string FormatTime(TimePoint tp);

// Accepts RFC 3339 ("2026-11-02T17:00:00Z") or whole unix seconds.
// Throws std::invalid_argument otherwise.
TimePoint ParseTime(const std::string& text);

} // namespace bidsub::util
