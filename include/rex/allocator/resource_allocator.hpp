#pragma once

#include <rex/allocator/lease.hpp>
#include <rex/common/status.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/signals2/signal.hpp>

namespace rex {
class Config;
class Clock;

namespace bus {
class MessageBus;
}
}

namespace rex::allocator {
struct ResourceSnapshot {
  struct Crew {
    std::string name;
    uint32_t held = 0;
    uint32_t max = 0;
  };
  struct Quota {
    Provider provider = LLM;
    uint32_t remaining = 0;
    uint32_t capacity = 0;
  };
  struct DomainUsage {
    DomainRecord record;
    uint32_t leases = 0;
    bool eligible = false;
  };

  std::vector<Crew> crews;
  std::vector<Quota> quotas;
  std::vector<DomainUsage> domains;
  size_t liveLeases = 0;
};

/** @brief Sole owner of all finite pools.
 *
 * Grants and releases agent slots per crew, sending domains and API call
 * budgets. Every call is non-blocking: a request that cannot be satisfied
 * is denied immediately and reserves nothing. All pool state is guarded by
 * one internal mutex, events and signals are emitted after it is released.
 */
class ResourceAllocator {
  public:
  using LeaseReleasedSignal = boost::signals2::signal<void(const Lease&)>;

  ResourceAllocator(const Config& config,
                    const Clock& clock,
                    bus::MessageBus& bus);
  ~ResourceAllocator();

  void addCrew(const std::string& name, uint32_t maxSlots);

  AcquireResult acquire(LeaseKind kind,
                        rex_id requester,
                        const Constraints& constraints);

  /** @brief Return a lease to its pool.
   *
   * Unknown or already released ids are a no-op.
   *
   * @return REX_OK if a live lease was released, REX_LEASE_NOT_FOUND
   * otherwise.
   */
  rex_status release(rex_id leaseId);

  /// Release every live lease held by the given mission.
  size_t releaseAll(rex_id holder);

  /// Release all leases whose expiry has passed.
  size_t reapExpired();

  ResourceSnapshot snapshot() const;

  rex_status provisionDomain(DomainRecord record);
  rex_status recordDeliveryOutcome(std::string_view domain,
                                   DeliveryOutcome outcome);
  rex_status reportReputation(std::string_view domain, float score);

  /// @return number of domains that became active.
  size_t advanceWarmupDay();

  std::optional<DomainRecord> domain(std::string_view name) const;

  /// Reputation a domain of the given tier needs to be leased.
  float floor(DomainTier tier) const;

  std::vector<Lease> leasesOf(rex_id holder) const;

  LeaseReleasedSignal& getLeaseReleasedSignal();

  private:
  struct Internal;
  std::unique_ptr<Internal> m_internal;

  const Config& m_config;
  const Clock& m_clock;
  bus::MessageBus& m_bus;
};
}
