// Wall Clock
//
// Story:
// Registries stamp records with wall-clock times (connected-at,
// disconnected-at) that are reported to administrators. The Clock interface
// is injected so tests can control time without sleeping.
//
// Thread Safety:
// RealClock is stateless. FakeClock is protected by a mutex.

#pragma once

#include <chrono>
#include <mutex>

namespace broker_admin {

/// Abstract interface for obtaining the current wall-clock time.
/// Allows dependency injection for testing.
class Clock {
 public:
  virtual ~Clock() = default;

  /// Returns the current time point.
  virtual std::chrono::system_clock::time_point Now() const = 0;
};

/// Real clock implementation using std::chrono::system_clock.
/// Use this in production code.
class RealClock : public Clock {
 public:
  std::chrono::system_clock::time_point Now() const override {
    return std::chrono::system_clock::now();
  }
};

/// Fake clock for testing. Time is manually controlled via Advance().
/// Starts at time_point{} (Unix epoch).
class FakeClock : public Clock {
 public:
  std::chrono::system_clock::time_point Now() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_time_;
  }

  /// Advances the clock by the specified duration.
  void Advance(std::chrono::system_clock::duration duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_time_ += duration;
  }

  /// Sets the clock to a specific time point.
  void SetTime(std::chrono::system_clock::time_point time) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_time_ = time;
  }

 private:
  mutable std::mutex mutex_;
  std::chrono::system_clock::time_point current_time_{};
};

}  // namespace broker_admin
