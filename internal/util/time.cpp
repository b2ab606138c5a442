#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace bidsub::util {

using google::protobuf::util::TimeUtil;

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  const auto since_epoch = tp.time_since_epoch();
  const auto sec         = std::chrono::floor<std::chrono::seconds>(since_epoch);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.count());
  ts.set_nanos(static_cast<int32_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - sec).count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d) {
  return std::chrono::milliseconds(TimeUtil::DurationToMilliseconds(d));
}

uint64_t ToUnixMillis(TimePoint tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  return ms < 0 ? 0 : static_cast<uint64_t>(ms);
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms));
}

std::string FormatTime(TimePoint tp) {
  return TimeUtil::ToString(ToProto(tp));
}

TimePoint ParseTime(const std::string& text) {
  if (!text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return FromUnixMillis(std::stoull(text) * 1000);
  }

  google::protobuf::Timestamp ts;
  if (!TimeUtil::FromString(text, &ts)) {
    throw std::invalid_argument("not an RFC 3339 time or unix seconds: " + text);
  }
  return FromProto(ts);
}

} // namespace bidsub::util
