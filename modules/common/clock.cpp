#include <rex/common/clock.hpp>

namespace rex {
int64_t
toMillis(TimePoint t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
           t.time_since_epoch())
    .count();
}
}
