#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <ostream>

namespace syncmeta {

// Seconds-precision UTC instant. On the wire it is the integer count of
// seconds since the epoch.
class Timestamp {
public:
  explicit Timestamp(int64_t secondsSinceEpoch) : seconds_(secondsSinceEpoch) {}
  explicit Timestamp(std::chrono::system_clock::time_point tp);

  static Timestamp now();

  int64_t secondsSinceEpoch() const { return seconds_; }
  std::chrono::system_clock::time_point toTimePoint() const;

  bool operator==(const Timestamp& o) const { return seconds_ == o.seconds_; }
  bool operator!=(const Timestamp& o) const { return seconds_ != o.seconds_; }
  bool operator<(const Timestamp& o) const { return seconds_ < o.seconds_; }
  bool operator>(const Timestamp& o) const { return seconds_ > o.seconds_; }
  bool operator<=(const Timestamp& o) const { return seconds_ <= o.seconds_; }
  bool operator>=(const Timestamp& o) const { return seconds_ >= o.seconds_; }

private:
  int64_t seconds_;
};

std::ostream& operator<<(std::ostream& os, const Timestamp& t);

} // namespace syncmeta

namespace std {
template <>
struct hash<syncmeta::Timestamp> {
  size_t operator()(const syncmeta::Timestamp& t) const noexcept {
    return std::hash<int64_t>{}(t.secondsSinceEpoch());
  }
};
} // namespace std
