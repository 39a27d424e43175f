#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace continuity {

// Wall time is persisted; steady time drives timeout decisions so that a
// system clock step cannot end or extend a session.
class Clock {
 public:
  virtual ~Clock() = default;
  virtual int64_t WallMs() const = 0;
  virtual int64_t SteadyMs() const = 0;
};

class SystemClock : public Clock {
 public:
  int64_t WallMs() const override;
  int64_t SteadyMs() const override;
};

class ManualClock : public Clock {
 public:
  explicit ManualClock(int64_t wall_ms = 1700000000000) : wall_ms_(wall_ms), steady_ms_(0) {}

  int64_t WallMs() const override { return wall_ms_.load(); }
  int64_t SteadyMs() const override { return steady_ms_.load(); }

  void Advance(int64_t ms) {
    wall_ms_ += ms;
    steady_ms_ += ms;
  }

  // Steps wall time only, like an NTP correction.
  void StepWall(int64_t ms) { wall_ms_ += ms; }

 private:
  std::atomic<int64_t> wall_ms_;
  std::atomic<int64_t> steady_ms_;
};

SystemClock* DefaultClock();

// "2024-01-02T03:04:05.678Z"
std::string FormatIso8601(int64_t wall_ms);

}  // namespace continuity
