#include "Timestamp.hpp"

namespace syncmeta {

using std::chrono::duration_cast;
using std::chrono::seconds;
using std::chrono::system_clock;

// Sub-second precision is dropped, rounding toward negative infinity so that
// pre-epoch instants land on the second they belong to.
Timestamp::Timestamp(system_clock::time_point tp) : seconds_(0) {
  auto s = duration_cast<seconds>(tp.time_since_epoch());
  if (system_clock::time_point(s) > tp) s -= seconds(1);
  seconds_ = static_cast<int64_t>(s.count());
}

Timestamp Timestamp::now() {
  return Timestamp(system_clock::now());
}

system_clock::time_point Timestamp::toTimePoint() const {
  return system_clock::time_point(duration_cast<system_clock::duration>(seconds(seconds_)));
}

std::ostream& operator<<(std::ostream& os, const Timestamp& t) {
  return os << t.secondsSinceEpoch();
}

} // namespace syncmeta
