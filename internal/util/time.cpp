#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace outbox::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string ToCompactUtc(TimePoint tp) {
  auto sec    = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - sec).count();
  if (micros < 0) {
    sec -= std::chrono::seconds(1);
    micros += 1000000;
  }

  std::time_t t = Clock::to_time_t(sec);
  std::tm     utc{};
  gmtime_r(&t, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y%m%dT%H%M%S") << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
  return out.str();
}

} // namespace outbox::util
