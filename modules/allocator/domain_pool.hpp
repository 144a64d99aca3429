#pragma once

#include "ema.hpp"

#include <rex/allocator/lease.hpp>
#include <rex/common/status.h>

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rex::allocator {
/** @brief Reputation ranked set of sending domains.
 *
 * Not synchronized, the owning allocator holds its lock around every call.
 */
class DomainPool {
  public:
  struct Limits {
    float customFloor = 0.7f;
    float prewarmedFloor = 0.8f;
    uint32_t retireAfterReadings = 5;
    uint32_t warmupDays = 14;
    double emaAlpha = 0.1;
  };

  struct Entry {
    DomainRecord record;
    EMA reputation;
    uint32_t leases = 0;
  };

  explicit DomainPool(Limits limits);

  rex_status provision(DomainRecord record);

  /** @brief Pick a domain for a mission.
   *
   * Tries the dedicated domain first, then the custom tier, then the
   * pre-warmed tier, round-robin inside each tier. Only active domains at
   * or above their tier floor are returned.
   */
  std::optional<std::string> select(const Constraints& constraints);

  void addLease(const std::string& name);
  void removeLease(const std::string& name);

  rex_status recordOutcome(const std::string& name, DeliveryOutcome outcome);
  rex_status reportReading(const std::string& name, float score);

  size_t advanceWarmupDay();

  float floor(DomainTier tier) const;
  bool eligible(const Entry& e) const;

  const Entry* find(const std::string& name) const;
  const std::map<std::string, Entry>& entries() const { return m_entries; }

  private:
  Limits m_limits;
  std::map<std::string, Entry> m_entries;
  std::array<std::vector<std::string>, 2> m_tiers;
  std::array<size_t, 2> m_cursors = { 0, 0 };

  void applyReading(Entry& e);
};
}
