#include "domain_pool.hpp"

#include <rex/common/log.h>

namespace rex::allocator {
DomainPool::DomainPool(Limits limits)
  : m_limits(limits) {}

float
DomainPool::floor(DomainTier tier) const {
  return tier == Prewarmed ? m_limits.prewarmedFloor : m_limits.customFloor;
}

bool
DomainPool::eligible(const Entry& e) const {
  return e.record.status == Active &&
         e.record.reputation >= floor(e.record.tier);
}

const DomainPool::Entry*
DomainPool::find(const std::string& name) const {
  auto it = m_entries.find(name);
  if(it == m_entries.end())
    return nullptr;
  return &it->second;
}

rex_status
DomainPool::provision(DomainRecord record) {
  if(record.name.empty() || record.reputation < 0 || record.reputation > 1) {
    return REX_INVALID_ARGUMENT;
  }
  if(m_entries.count(record.name)) {
    rex_log(REX_ALLOCATOR,
            REX_LOCALWARNING,
            "Domain {} is already provisioned!",
            record.name);
    return REX_INVALID_ARGUMENT;
  }

  std::string name = record.name;
  DomainTier tier = record.tier;
  double initial = record.reputation;
  m_entries.emplace(
    name, Entry{ std::move(record), EMA(m_limits.emaAlpha, initial), 0 });
  m_tiers[tier].push_back(name);

  rex_log(REX_ALLOCATOR,
          REX_DEBUG,
          "Provisioned {} domain {} with reputation {}",
          DomainTierToStr(tier),
          name,
          initial);
  return REX_OK;
}

std::optional<std::string>
DomainPool::select(const Constraints& constraints) {
  if(constraints.dedicatedDomain) {
    const Entry* e = find(*constraints.dedicatedDomain);
    if(e && eligible(*e)) {
      return e->record.name;
    }
    rex_log(REX_ALLOCATOR,
            REX_DEBUG,
            "Dedicated domain {} not eligible, falling back to pool.",
            *constraints.dedicatedDomain);
  }

  for(int tier = Custom; tier <= Prewarmed; ++tier) {
    auto& names = m_tiers[tier];
    size_t n = names.size();
    for(size_t i = 0; i < n; ++i) {
      size_t idx = (m_cursors[tier] + i) % n;
      const Entry& e = m_entries.at(names[idx]);

      if(e.record.campaignId && e.record.campaignId != constraints.campaignId)
        continue;
      if(!eligible(e))
        continue;

      m_cursors[tier] = (idx + 1) % n;
      return e.record.name;
    }
  }
  return std::nullopt;
}

void
DomainPool::addLease(const std::string& name) {
  auto it = m_entries.find(name);
  if(it != m_entries.end())
    ++it->second.leases;
}

void
DomainPool::removeLease(const std::string& name) {
  auto it = m_entries.find(name);
  if(it != m_entries.end() && it->second.leases > 0)
    --it->second.leases;
}

rex_status
DomainPool::recordOutcome(const std::string& name, DeliveryOutcome outcome) {
  auto it = m_entries.find(name);
  if(it == m_entries.end())
    return REX_DOMAIN_NOT_FOUND;

  Entry& e = it->second;
  switch(outcome) {
    case Delivered:
      e.reputation.update(1.0);
      break;
    case Bounced:
      e.reputation.update(0.0);
      break;
    case Complained:
      // Complaints weigh twice as much as a bounce.
      e.reputation.update(0.0);
      e.reputation.update(0.0);
      break;
  }
  applyReading(e);
  return REX_OK;
}

rex_status
DomainPool::reportReading(const std::string& name, float score) {
  if(score < 0 || score > 1)
    return REX_INVALID_ARGUMENT;

  auto it = m_entries.find(name);
  if(it == m_entries.end())
    return REX_DOMAIN_NOT_FOUND;

  it->second.reputation.reset(score);
  applyReading(it->second);
  return REX_OK;
}

void
DomainPool::applyReading(Entry& e) {
  DomainRecord& r = e.record;
  r.reputation = static_cast<float>(static_cast<double>(e.reputation));

  if(r.status == Retired)
    return;

  if(r.reputation < floor(r.tier)) {
    ++r.subFloorReadings;
    if(r.subFloorReadings >= m_limits.retireAfterReadings) {
      r.status = Retired;
      rex_log(REX_ALLOCATOR,
              REX_LOCALWARNING,
              "Retired domain {} after {} readings below floor {} (now {})",
              r.name,
              r.subFloorReadings,
              floor(r.tier),
              r.reputation);
    } else if(r.status == Active) {
      r.status = CoolingDown;
      rex_log(REX_ALLOCATOR,
              REX_INFO,
              "Domain {} dropped below floor ({} < {}), cooling down.",
              r.name,
              r.reputation,
              floor(r.tier));
    }
  } else {
    r.subFloorReadings = 0;
    if(r.status == CoolingDown) {
      r.status = Active;
      rex_log(REX_ALLOCATOR,
              REX_INFO,
              "Domain {} recovered to {}, active again.",
              r.name,
              r.reputation);
    }
  }
}

size_t
DomainPool::advanceWarmupDay() {
  size_t activated = 0;
  for(auto& [name, e] : m_entries) {
    DomainRecord& r = e.record;
    if(r.status != Warming)
      continue;

    ++r.warmupDay;
    if(r.warmupDay >= m_limits.warmupDays && r.reputation >= floor(r.tier)) {
      r.status = Active;
      ++activated;
      rex_log(REX_ALLOCATOR,
              REX_INFO,
              "Domain {} finished warmup after {} days.",
              name,
              r.warmupDay);
    }
  }
  return activated;
}
}
