#pragma once

#include <rex/common/clock.hpp>

#include <cstdint>

namespace rex::allocator {
/** @brief Call budget of one provider.
 *
 * Refills to full capacity once per interval. Refills are applied lazily
 * whenever the bucket is touched.
 */
class TokenBucket {
  public:
  TokenBucket() = default;
  TokenBucket(uint32_t capacity, Duration interval, TimePoint now);

  void refillIfDue(TimePoint now);

  bool has(uint32_t amount) const { return amount <= m_tokens; }
  void consume(uint32_t amount);

  uint32_t remaining() const { return m_tokens; }
  uint32_t capacity() const { return m_capacity; }
  TimePoint nextRefill() const { return m_nextRefill; }

  private:
  uint32_t m_capacity = 0;
  uint32_t m_tokens = 0;
  Duration m_interval{};
  TimePoint m_nextRefill;
};
}
