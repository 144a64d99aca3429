#pragma once

#include <rex/common/clock.hpp>
#include <rex/common/types.h>

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace rex::allocator {
enum LeaseKind { AgentSlot, Domain, ApiQuota, _LEASE_KIND_COUNT };

enum DenialReason {
  PoolExhausted,
  AlreadyHeld,
  NoEligibleDomain,
  QuotaExhausted,
  UnknownResource,
  InvalidConstraints
};

enum Provider { LLM, Email, SMS, _PROVIDER_COUNT };

enum DomainTier { Custom, Prewarmed };

enum DomainStatus { Warming, Active, CoolingDown, Retired };

enum DeliveryOutcome { Delivered, Bounced, Complained };

const char*
LeaseKindToStr(LeaseKind kind);
const char*
DenialReasonToStr(DenialReason reason);
const char*
ProviderToStr(Provider provider);
const char*
DomainTierToStr(DomainTier tier);
const char*
DomainStatusToStr(DomainStatus status);
const char*
DeliveryOutcomeToStr(DeliveryOutcome outcome);

bool
DomainTierFromStr(std::string_view str, DomainTier* tier);
bool
DomainStatusFromStr(std::string_view str, DomainStatus* status);
bool
DeliveryOutcomeFromStr(std::string_view str, DeliveryOutcome* outcome);

/// Calls per provider a mission wants to spend.
struct QuotaRequest {
  std::array<uint32_t, _PROVIDER_COUNT> amounts = { 0, 0, 0 };

  bool empty() const {
    for(auto a : amounts)
      if(a > 0)
        return false;
    return true;
  }
  uint32_t& operator[](Provider p) { return amounts[p]; }
  uint32_t operator[](Provider p) const { return amounts[p]; }
};

struct Constraints {
  /// Crew to take an agent slot from.
  std::string crew;
  /// Campaign-dedicated domain to prefer.
  std::optional<std::string> dedicatedDomain;
  /// Campaign the mission belongs to, unlocks that campaign's domains.
  std::optional<std::string> campaignId;
  QuotaRequest quota;
};

struct Lease {
  rex_id id = 0;
  LeaseKind kind = AgentSlot;
  /// Crew name, domain name or "api".
  std::string resource;
  rex_id holder = 0;
  TimePoint acquiredAt;
  std::optional<TimePoint> expiresAt;
  QuotaRequest quota;
};

struct Denied {
  DenialReason reason = PoolExhausted;
  std::string detail;
};

using AcquireResult = std::variant<Lease, Denied>;

struct DomainRecord {
  std::string name;
  DomainTier tier = Custom;
  float reputation = 0;
  uint32_t warmupDay = 0;
  DomainStatus status = Warming;
  std::optional<std::string> campaignId;
  uint32_t subFloorReadings = 0;
};

/** @brief Parse a domain given as name:tier:reputation[:status[:campaign]].
 *
 * Status defaults to active.
 */
bool
ParseDomainRecord(std::string_view spec, DomainRecord& out);

inline std::ostream&
operator<<(std::ostream& o, LeaseKind kind) {
  return o << LeaseKindToStr(kind);
}
inline std::ostream&
operator<<(std::ostream& o, DenialReason reason) {
  return o << DenialReasonToStr(reason);
}
inline std::ostream&
operator<<(std::ostream& o, DomainStatus status) {
  return o << DomainStatusToStr(status);
}
}
