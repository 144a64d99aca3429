#include "domain_pool.hpp"
#include "token_bucket.hpp"

#include <rex/allocator/resource_allocator.hpp>
#include <rex/bus/message_bus.hpp>
#include <rex/common/clock.hpp>
#include <rex/common/config.hpp>
#include <rex/common/log.h>

#include <algorithm>
#include <map>
#include <mutex>
#include <set>
#include <unordered_map>

namespace rex::allocator {
struct ResourceAllocator::Internal {
  explicit Internal(DomainPool::Limits limits)
    : domains(limits) {}

  struct CrewSlots {
    uint32_t held = 0;
    uint32_t max = 0;
  };

  mutable std::mutex mutex;

  std::map<std::string, CrewSlots> crews;
  DomainPool domains;
  std::array<TokenBucket, _PROVIDER_COUNT> buckets;

  std::unordered_map<rex_id, Lease> leases;
  std::map<std::pair<rex_id, LeaseKind>, rex_id> heldByMission;
  rex_id nextLeaseId = 1;

  std::set<std::string> exhaustedPools;

  LeaseReleasedSignal leaseReleased;
};

static DomainPool::Limits
LimitsFromConfig(const Config& config) {
  DomainPool::Limits l;
  l.customFloor = config.getFloat(Config::CustomFloor);
  l.prewarmedFloor = config.getFloat(Config::PrewarmedFloor);
  l.retireAfterReadings = config.getUint32(Config::RetireAfterReadings);
  l.warmupDays = config.getUint32(Config::WarmupDays);
  l.emaAlpha = config.getFloat(Config::ReputationEmaAlpha);
  return l;
}

static std::string
PoolKey(LeaseKind kind, const std::string& resource) {
  switch(kind) {
    case AgentSlot:
      return "crew:" + resource;
    case Domain:
      return "domain";
    case ApiQuota:
      return "api:" + resource;
    default:
      return "!";
  }
}

ResourceAllocator::ResourceAllocator(const Config& config,
                                     const Clock& clock,
                                     bus::MessageBus& bus)
  : m_internal(std::make_unique<Internal>(LimitsFromConfig(config)))
  , m_config(config)
  , m_clock(clock)
  , m_bus(bus) {
  Duration interval = config.getSeconds(Config::QuotaRefillIntervalS);
  TimePoint now = m_clock.now();
  m_internal->buckets[LLM] =
    TokenBucket(config.getUint32(Config::LLMQuota), interval, now);
  m_internal->buckets[Email] =
    TokenBucket(config.getUint32(Config::EmailQuota), interval, now);
  m_internal->buckets[SMS] =
    TokenBucket(config.getUint32(Config::SMSQuota), interval, now);
}

ResourceAllocator::~ResourceAllocator() {
  rex_log(REX_ALLOCATOR,
          REX_DEBUG,
          "Destroy ResourceAllocator with {} live leases.",
          m_internal->leases.size());
}

void
ResourceAllocator::addCrew(const std::string& name, uint32_t maxSlots) {
  std::unique_lock lock(m_internal->mutex);
  auto& crew = m_internal->crews[name];
  crew.max = maxSlots;
}

AcquireResult
ResourceAllocator::acquire(LeaseKind kind,
                           rex_id requester,
                           const Constraints& constraints) {
  std::vector<bus::Event> events;
  AcquireResult result;
  TimePoint now = m_clock.now();
  std::string resource;

  {
    std::unique_lock lock(m_internal->mutex);
    auto& i = *m_internal;

    auto deny = [&result](DenialReason r, std::string detail) {
      result = Denied{ r, std::move(detail) };
    };

    Lease lease;
    lease.kind = kind;
    lease.holder = requester;
    lease.acquiredAt = now;

    if(kind >= _LEASE_KIND_COUNT) {
      deny(InvalidConstraints, "invalid lease kind");
    } else if(i.heldByMission.count({ requester, kind })) {
      deny(AlreadyHeld, LeaseKindToStr(kind));
    } else if(kind == AgentSlot) {
      resource = constraints.crew;
      auto it = i.crews.find(constraints.crew);
      if(it == i.crews.end()) {
        deny(UnknownResource, "crew " + constraints.crew);
      } else if(it->second.held >= it->second.max) {
        deny(PoolExhausted, "crew " + constraints.crew);
      } else {
        ++it->second.held;
        lease.resource = constraints.crew;
        result = lease;
      }
    } else if(kind == Domain) {
      auto name = i.domains.select(constraints);
      if(!name) {
        deny(NoEligibleDomain, "no active domain above its floor");
      } else {
        i.domains.addLease(*name);
        lease.resource = *name;
        lease.expiresAt = now + m_config.getSeconds(Config::DomainLeaseTtlS);
        result = lease;
      }
    } else if(kind == ApiQuota) {
      resource = "api";
      if(constraints.quota.empty()) {
        deny(InvalidConstraints, "empty quota request");
      } else {
        std::optional<Provider> missing;
        for(int p = 0; p < _PROVIDER_COUNT; ++p) {
          auto& bucket = i.buckets[p];
          bucket.refillIfDue(now);
          if(!bucket.has(constraints.quota.amounts[p]) && !missing)
            missing = static_cast<Provider>(p);
        }
        if(missing) {
          resource = ProviderToStr(*missing);
          deny(QuotaExhausted, std::string("provider ") + resource);
        } else {
          TimePoint expires = now;
          for(int p = 0; p < _PROVIDER_COUNT; ++p) {
            uint32_t amount = constraints.quota.amounts[p];
            if(amount == 0)
              continue;
            i.buckets[p].consume(amount);
            expires = std::max(expires, i.buckets[p].nextRefill());
          }
          lease.resource = "api";
          lease.quota = constraints.quota;
          lease.expiresAt = expires;
          result = lease;
        }
      }
    }

    if(auto l = std::get_if<Lease>(&result)) {
      l->id = i.nextLeaseId++;
      i.leases.emplace(l->id, *l);
      i.heldByMission[{ requester, kind }] = l->id;
      i.exhaustedPools.erase(PoolKey(kind, l->resource));

      events.push_back(bus::Event{ bus::ResourceLeaseGranted,
                                   requester,
                                   l->resource,
                                   LeaseKindToStr(kind),
                                   now });
    } else {
      auto& d = std::get<Denied>(result);
      if(d.reason == PoolExhausted || d.reason == NoEligibleDomain ||
         d.reason == QuotaExhausted) {
        std::string key = PoolKey(kind, resource);
        if(i.exhaustedPools.insert(key).second) {
          events.push_back(bus::Event{
            bus::ResourcePoolExhausted, requester, key, d.detail, now });
        }
      }
    }
  }

  if(auto l = std::get_if<Lease>(&result)) {
    rex_log(REX_ALLOCATOR,
            REX_TRACE,
            "Granted {} lease {} on {} to mission {}",
            LeaseKindToStr(kind),
            l->id,
            l->resource,
            requester);
  } else {
    auto& d = std::get<Denied>(result);
    rex_log(REX_ALLOCATOR,
            d.reason == AlreadyHeld ? REX_LOCALERROR : REX_TRACE,
            "Denied {} lease to mission {}: {} ({})",
            LeaseKindToStr(kind),
            requester,
            DenialReasonToStr(d.reason),
            d.detail);
  }

  for(auto& e : events)
    m_bus.publish(std::move(e));

  return result;
}

rex_status
ResourceAllocator::release(rex_id leaseId) {
  Lease lease;
  {
    std::unique_lock lock(m_internal->mutex);
    auto& i = *m_internal;

    auto it = i.leases.find(leaseId);
    if(it == i.leases.end()) {
      return REX_LEASE_NOT_FOUND;
    }
    lease = std::move(it->second);
    i.leases.erase(it);
    i.heldByMission.erase({ lease.holder, lease.kind });

    switch(lease.kind) {
      case AgentSlot: {
        auto crew = i.crews.find(lease.resource);
        if(crew != i.crews.end() && crew->second.held > 0)
          --crew->second.held;
        i.exhaustedPools.erase(PoolKey(AgentSlot, lease.resource));
        break;
      }
      case Domain:
        i.domains.removeLease(lease.resource);
        break;
      case ApiQuota:
      case _LEASE_KIND_COUNT:
        break;
    }
  }

  rex_log(REX_ALLOCATOR,
          REX_TRACE,
          "Released {} lease {} on {} of mission {}",
          LeaseKindToStr(lease.kind),
          lease.id,
          lease.resource,
          lease.holder);

  m_bus.publish(bus::Event{ bus::ResourceLeaseReleased,
                            lease.holder,
                            lease.resource,
                            LeaseKindToStr(lease.kind),
                            m_clock.now() });
  m_internal->leaseReleased(lease);
  return REX_OK;
}

size_t
ResourceAllocator::releaseAll(rex_id holder) {
  std::vector<rex_id> ids;
  {
    std::unique_lock lock(m_internal->mutex);
    for(int k = 0; k < _LEASE_KIND_COUNT; ++k) {
      auto it = m_internal->heldByMission.find({ holder, LeaseKind(k) });
      if(it != m_internal->heldByMission.end())
        ids.push_back(it->second);
    }
  }
  size_t released = 0;
  for(auto id : ids) {
    if(release(id) == REX_OK)
      ++released;
  }
  return released;
}

size_t
ResourceAllocator::reapExpired() {
  std::vector<rex_id> expired;
  TimePoint now = m_clock.now();
  {
    std::unique_lock lock(m_internal->mutex);
    for(auto& [id, lease] : m_internal->leases) {
      if(lease.expiresAt && *lease.expiresAt <= now)
        expired.push_back(id);
    }
  }
  size_t reaped = 0;
  for(auto id : expired) {
    if(release(id) == REX_OK)
      ++reaped;
  }
  if(reaped > 0) {
    rex_log(REX_ALLOCATOR, REX_DEBUG, "Reaped {} expired leases.", reaped);
  }
  return reaped;
}

ResourceSnapshot
ResourceAllocator::snapshot() const {
  ResourceSnapshot s;
  TimePoint now = m_clock.now();

  std::unique_lock lock(m_internal->mutex);
  auto& i = *m_internal;

  for(auto& [name, crew] : i.crews) {
    s.crews.push_back(ResourceSnapshot::Crew{ name, crew.held, crew.max });
  }
  for(int p = 0; p < _PROVIDER_COUNT; ++p) {
    auto& bucket = i.buckets[p];
    bucket.refillIfDue(now);
    s.quotas.push_back(ResourceSnapshot::Quota{
      static_cast<Provider>(p), bucket.remaining(), bucket.capacity() });
  }
  for(auto& [name, e] : i.domains.entries()) {
    s.domains.push_back(
      ResourceSnapshot::DomainUsage{ e.record, e.leases, i.domains.eligible(e) });
  }
  s.liveLeases = i.leases.size();
  return s;
}

rex_status
ResourceAllocator::provisionDomain(DomainRecord record) {
  std::unique_lock lock(m_internal->mutex);
  rex_status s = m_internal->domains.provision(std::move(record));
  if(s == REX_OK)
    m_internal->exhaustedPools.erase(PoolKey(Domain, ""));
  return s;
}

rex_status
ResourceAllocator::recordDeliveryOutcome(std::string_view domain,
                                         DeliveryOutcome outcome) {
  std::unique_lock lock(m_internal->mutex);
  rex_status s =
    m_internal->domains.recordOutcome(std::string(domain), outcome);
  if(s != REX_OK) {
    rex_log(REX_ALLOCATOR,
            REX_LOCALWARNING,
            "Could not record {} outcome for domain {}: {}",
            DeliveryOutcomeToStr(outcome),
            domain,
            rex_status_to_str(s));
  }
  return s;
}

rex_status
ResourceAllocator::reportReputation(std::string_view domain, float score) {
  std::unique_lock lock(m_internal->mutex);
  rex_status s = m_internal->domains.reportReading(std::string(domain), score);
  if(s == REX_OK) {
    m_internal->exhaustedPools.erase(PoolKey(Domain, ""));
  } else {
    rex_log(REX_ALLOCATOR,
            REX_LOCALWARNING,
            "Could not apply reputation {} to domain {}: {}",
            score,
            domain,
            rex_status_to_str(s));
  }
  return s;
}

size_t
ResourceAllocator::advanceWarmupDay() {
  std::unique_lock lock(m_internal->mutex);
  size_t activated = m_internal->domains.advanceWarmupDay();
  if(activated > 0)
    m_internal->exhaustedPools.erase(PoolKey(Domain, ""));
  return activated;
}

std::optional<DomainRecord>
ResourceAllocator::domain(std::string_view name) const {
  std::unique_lock lock(m_internal->mutex);
  auto e = m_internal->domains.find(std::string(name));
  if(!e)
    return std::nullopt;
  return e->record;
}

float
ResourceAllocator::floor(DomainTier tier) const {
  return m_internal->domains.floor(tier);
}

std::vector<Lease>
ResourceAllocator::leasesOf(rex_id holder) const {
  std::vector<Lease> result;
  std::unique_lock lock(m_internal->mutex);
  for(int k = 0; k < _LEASE_KIND_COUNT; ++k) {
    auto it = m_internal->heldByMission.find({ holder, LeaseKind(k) });
    if(it != m_internal->heldByMission.end())
      result.push_back(m_internal->leases.at(it->second));
  }
  return result;
}

ResourceAllocator::LeaseReleasedSignal&
ResourceAllocator::getLeaseReleasedSignal() {
  return m_internal->leaseReleased;
}
}
