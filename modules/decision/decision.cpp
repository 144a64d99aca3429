#include <rex/decision/decision.hpp>

#include <algorithm>
#include <array>
#include <cmath>

#include <boost/algorithm/string/predicate.hpp>

namespace rex::decision {
const char*
RequestTypeToStr(RequestType type) {
  switch(type) {
    case StateTransition:
      return "STATE_TRANSITION";
    case EligibilityCheck:
      return "ELIGIBILITY_CHECK";
    case FailureClassification:
      return "FAILURE_CLASSIFICATION";
    case RetryDecision:
      return "RETRY_DECISION";
    case DomainSelection:
      return "DOMAIN_SELECTION";
    case PriorityCheck:
      return "PRIORITY_CHECK";
    case _REQUEST_TYPE_COUNT:
      break;
  }
  return "!";
}

const char*
VerdictToStr(Verdict verdict) {
  switch(verdict) {
    case Allow:
      return "ALLOW";
    case Deny:
      return "DENY";
    case Transition:
      return "TRANSITION";
    case Recoverable:
      return "RECOVERABLE";
    case Terminal:
      return "TERMINAL";
    case Retry:
      return "RETRY";
    case FailTerminal:
      return "FAIL_TERMINAL";
    case Escalate:
      return "ESCALATE";
    case SelectDedicated:
      return "SELECT_DEDICATED";
    case SelectPool:
      return "SELECT_POOL";
    case NoDomain:
      return "NO_DOMAIN";
    case Boost:
      return "BOOST";
    case Maintain:
      return "MAINTAIN";
    case _VERDICT_COUNT:
      break;
  }
  return "!";
}

const char*
LayerToStr(Layer layer) {
  switch(layer) {
    case StateMachineLayer:
      return "state-machine";
    case RuleEngineLayer:
      return "rule-engine";
    case LLMLayer:
      return "llm";
    case LLMFallbackLayer:
      return "llm-fallback";
    case _LAYER_COUNT:
      break;
  }
  return "!";
}

bool
VerdictFromStr(std::string_view str, Verdict* verdict) {
  for(int v = 0; v < _VERDICT_COUNT; ++v) {
    if(boost::algorithm::iequals(str, VerdictToStr(Verdict(v)))) {
      *verdict = Verdict(v);
      return true;
    }
  }
  return false;
}

const std::vector<Verdict>&
AllowedVerdicts(RequestType type) {
  static const std::array<std::vector<Verdict>, _REQUEST_TYPE_COUNT> allowed = {
    std::vector<Verdict>{ Transition, Deny },
    std::vector<Verdict>{ Allow, Deny },
    std::vector<Verdict>{ Recoverable, Terminal },
    std::vector<Verdict>{ Retry, FailTerminal, Escalate },
    std::vector<Verdict>{ SelectDedicated, SelectPool, NoDomain },
    std::vector<Verdict>{ Boost, Maintain },
  };
  static const std::vector<Verdict> none;
  if(type >= _REQUEST_TYPE_COUNT)
    return none;
  return allowed[type];
}

bool
IsAllowed(RequestType type, Verdict verdict) {
  auto& allowed = AllowedVerdicts(type);
  return std::find(allowed.begin(), allowed.end(), verdict) != allowed.end();
}

namespace {
struct Validator {
  std::string* why;

  bool fail(const char* reason) const {
    if(why)
      *why = reason;
    return false;
  }

  bool operator()(const StateTransitionContext& c) const {
    if(c.state >= REX_MISSION_STATE_COUNT)
      return fail("unknown mission state");
    if(c.event >= REX_MISSION_EVENT_COUNT)
      return fail("unknown mission event");
    return true;
  }
  bool operator()(const EligibilityContext& c) const {
    if(c.state >= REX_MISSION_STATE_COUNT)
      return fail("unknown mission state");
    return true;
  }
  bool operator()(const FailureContext& c) const {
    if(c.kind >= REX_ERROR_KIND_COUNT)
      return fail("unknown error kind");
    return true;
  }
  bool operator()(const RetryContext& c) const {
    if(c.retryCount > c.maxRetries)
      return fail("retry count exceeds max retries");
    return true;
  }
  bool operator()(const DomainSelectionContext& c) const {
    if(c.missionType >= REX_MISSION_TYPE_COUNT)
      return fail("unknown mission type");
    if(c.dedicatedReputation) {
      float r = *c.dedicatedReputation;
      if(std::isnan(r) || r < 0 || r > 1)
        return fail("reputation outside 0..1");
    }
    return true;
  }
  bool operator()(const PriorityContext& c) const {
    if(c.queuedForS < 0)
      return fail("negative queue time");
    return true;
  }
};

struct Normalizer {
  ContextFields& out;

  void operator()(const StateTransitionContext& c) const {
    out.emplace_back("state", rex_mission_state_to_str(c.state));
    out.emplace_back("event", rex_mission_event_to_str(c.event));
  }
  void operator()(const EligibilityContext& c) const {
    out.emplace_back("state", rex_mission_state_to_str(c.state));
    out.emplace_back("lease_held", c.leaseHeld ? "true" : "false");
  }
  void operator()(const FailureContext& c) const {
    out.emplace_back("kind", rex_error_kind_to_str(c.kind));
    out.emplace_back("code", c.code);
    out.emplace_back("message", c.message);
  }
  void operator()(const RetryContext& c) const {
    out.emplace_back("retry_count", std::to_string(c.retryCount));
    out.emplace_back("max_retries", std::to_string(c.maxRetries));
    out.emplace_back("recoverable", c.recoverable ? "true" : "false");
    out.emplace_back("priority", std::to_string(c.priority));
  }
  void operator()(const DomainSelectionContext& c) const {
    out.emplace_back("mission_type", rex_mission_type_to_str(c.missionType));
    out.emplace_back("dedicated_domain",
                     c.hasDedicatedDomain ? "true" : "false");
    if(c.dedicatedReputation) {
      out.emplace_back("dedicated_reputation",
                       std::to_string(*c.dedicatedReputation));
    }
  }
  void operator()(const PriorityContext& c) const {
    out.emplace_back("priority", std::to_string(c.priority));
    out.emplace_back("queued_for_s", std::to_string(c.queuedForS));
  }
};
}

bool
Validate(const Request& request, std::string* why) {
  if(request.context.valueless_by_exception()) {
    if(why)
      *why = "empty context";
    return false;
  }
  return std::visit(Validator{ why }, request.context);
}

ContextFields
Normalize(const Context& context) {
  ContextFields fields;
  if(context.valueless_by_exception())
    return fields;
  std::visit(Normalizer{ fields }, context);
  return fields;
}
}
