#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace rex {
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::system_clock::duration;

/** @brief Time source for all mission and lease bookkeeping.
 *
 * Timers of the control loops use their own steady clock; everything that is
 * compared against a stored timestamp reads time through this interface.
 */
class Clock {
  public:
  virtual ~Clock() = default;
  virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
  public:
  TimePoint now() const override { return std::chrono::system_clock::now(); }
};

/// Clock that only moves when told to.
class ManualClock : public Clock {
  public:
  explicit ManualClock(TimePoint start = std::chrono::system_clock::now())
    : m_now(start) {}

  TimePoint now() const override {
    std::unique_lock lock(m_mutex);
    return m_now;
  }

  void advance(Duration d) {
    std::unique_lock lock(m_mutex);
    m_now += d;
  }

  void set(TimePoint t) {
    std::unique_lock lock(m_mutex);
    m_now = t;
  }

  private:
  mutable std::mutex m_mutex;
  TimePoint m_now;
};

int64_t
toMillis(TimePoint t);
}
