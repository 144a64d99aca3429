#include "token_bucket.hpp"

namespace rex::allocator {
TokenBucket::TokenBucket(uint32_t capacity, Duration interval, TimePoint now)
  : m_capacity(capacity)
  , m_tokens(capacity)
  , m_interval(interval)
  , m_nextRefill(now + interval) {}

void
TokenBucket::refillIfDue(TimePoint now) {
  if(now < m_nextRefill)
    return;

  m_tokens = m_capacity;

  if(m_interval <= Duration::zero()) {
    m_nextRefill = now;
    return;
  }

  // Skip all intervals that passed without anyone touching the bucket.
  auto missed = (now - m_nextRefill) / m_interval;
  m_nextRefill += m_interval * (missed + 1);
}

void
TokenBucket::consume(uint32_t amount) {
  m_tokens = amount > m_tokens ? 0 : m_tokens - amount;
}
}
