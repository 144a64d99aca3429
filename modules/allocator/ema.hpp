#pragma once

namespace rex::allocator {

/// Exponential moving average over delivery outcomes, seeded with the
/// reputation a domain was provisioned with.
class EMA {
  public:
  EMA()
    : value(0)
    , alpha(0) {}

  EMA(double a, double initial)
    : value(initial)
    , alpha(a) {}

  operator double() const { return value; }

  void update(double y) { value += alpha * (y - value); }

  /// Replace the average by an externally computed reading.
  void reset(double v) { value = v; }

  private:
  double value;// current average value
  double alpha;// percentage contribution of new values
};
}
