#include <rex/allocator/lease.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/lexical_cast.hpp>

#include <vector>

namespace rex::allocator {
const char*
LeaseKindToStr(LeaseKind kind) {
  switch(kind) {
    case AgentSlot:
      return "agent-slot";
    case Domain:
      return "domain";
    case ApiQuota:
      return "api-quota";
    case _LEASE_KIND_COUNT:
      break;
  }
  return "!";
}

const char*
DenialReasonToStr(DenialReason reason) {
  switch(reason) {
    case PoolExhausted:
      return "pool exhausted";
    case AlreadyHeld:
      return "already held";
    case NoEligibleDomain:
      return "no eligible domain";
    case QuotaExhausted:
      return "quota exhausted";
    case UnknownResource:
      return "unknown resource";
    case InvalidConstraints:
      return "invalid constraints";
  }
  return "!";
}

const char*
ProviderToStr(Provider provider) {
  switch(provider) {
    case LLM:
      return "llm";
    case Email:
      return "email";
    case SMS:
      return "sms";
    case _PROVIDER_COUNT:
      break;
  }
  return "!";
}

const char*
DomainTierToStr(DomainTier tier) {
  switch(tier) {
    case Custom:
      return "custom";
    case Prewarmed:
      return "prewarmed";
  }
  return "!";
}

const char*
DomainStatusToStr(DomainStatus status) {
  switch(status) {
    case Warming:
      return "warming";
    case Active:
      return "active";
    case CoolingDown:
      return "cooling-down";
    case Retired:
      return "retired";
  }
  return "!";
}

const char*
DeliveryOutcomeToStr(DeliveryOutcome outcome) {
  switch(outcome) {
    case Delivered:
      return "delivered";
    case Bounced:
      return "bounced";
    case Complained:
      return "complained";
  }
  return "!";
}

bool
DomainTierFromStr(std::string_view str, DomainTier* tier) {
  for(DomainTier t : { Custom, Prewarmed }) {
    if(boost::algorithm::iequals(str, DomainTierToStr(t))) {
      *tier = t;
      return true;
    }
  }
  return false;
}

bool
DomainStatusFromStr(std::string_view str, DomainStatus* status) {
  for(DomainStatus s : { Warming, Active, CoolingDown, Retired }) {
    if(boost::algorithm::iequals(str, DomainStatusToStr(s))) {
      *status = s;
      return true;
    }
  }
  return false;
}

bool
DeliveryOutcomeFromStr(std::string_view str, DeliveryOutcome* outcome) {
  for(DeliveryOutcome o : { Delivered, Bounced, Complained }) {
    if(boost::algorithm::iequals(str, DeliveryOutcomeToStr(o))) {
      *outcome = o;
      return true;
    }
  }
  return false;
}

bool
ParseDomainRecord(std::string_view spec, DomainRecord& out) {
  std::vector<std::string> parts;
  std::string str(spec);
  boost::algorithm::split(parts, str, [](char c) { return c == ':'; });

  if(parts.size() < 3 || parts.size() > 5 || parts[0].empty())
    return false;

  DomainRecord r;
  r.name = parts[0];
  if(!DomainTierFromStr(parts[1], &r.tier))
    return false;

  try {
    r.reputation = boost::lexical_cast<float>(parts[2]);
  } catch(const boost::bad_lexical_cast&) {
    return false;
  }
  if(r.reputation < 0 || r.reputation > 1)
    return false;

  r.status = Active;
  if(parts.size() > 3 && !DomainStatusFromStr(parts[3], &r.status))
    return false;
  if(parts.size() > 4 && !parts[4].empty())
    r.campaignId = parts[4];

  out = std::move(r);
  return true;
}
}
