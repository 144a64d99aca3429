#include "rule_engine.hpp"

#include <rex/common/log.h>
#include <rex/common/mission_profile.hpp>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace rex::decision {
static Decision
Make(Verdict verdict, const char* reason, int64_t argument = 0) {
  Decision d;
  d.verdict = verdict;
  d.layer = RuleEngineLayer;
  d.confidence = 1.0f;
  d.argument = argument;
  d.reason = reason;
  return d;
}

// Codes that signal a transient provider problem: none given, any 5xx or
// a 429.
static bool
IsTransientProviderCode(const std::string& code) {
  if(code.empty() || code == "429")
    return true;
  return code.size() == 3 && code[0] == '5' &&
         std::all_of(code.begin(), code.end(), [](char c) {
           return std::isdigit(static_cast<unsigned char>(c));
         });
}

RuleEngine::RuleEngine(Limits limits)
  : m_limits(limits) {
  const Limits l = m_limits;

  add(
    "invalid-transition",
    StateTransition,
    [](const Request&) { return true; },
    [](const Request&) { return Make(Deny, "invalid transition"); });

  add(
    "ineligible-state",
    EligibilityCheck,
    [](const Request& r) {
      return std::get<EligibilityContext>(r.context).state != REX_QUEUED;
    },
    [](const Request&) { return Make(Deny, "mission is not queued"); });

  add(
    "non-recoverable-kind",
    FailureClassification,
    [](const Request& r) {
      auto kind = std::get<FailureContext>(r.context).kind;
      return kind == REX_ERR_VALIDATION || kind == REX_ERR_INVARIANT ||
             kind == REX_ERR_CANCELLED;
    },
    [](const Request&) { return Make(Terminal, "non-recoverable kind"); });

  add(
    "transient-kind",
    FailureClassification,
    [](const Request& r) {
      auto& c = std::get<FailureContext>(r.context);
      switch(c.kind) {
        case REX_ERR_PROVIDER_TIMEOUT:
        case REX_ERR_RATE_LIMITED:
        case REX_ERR_TIMEOUT:
          return true;
        case REX_ERR_PROVIDER_ERROR:
          return IsTransientProviderCode(c.code);
        default:
          return false;
      }
    },
    [](const Request&) { return Make(Recoverable, "transient kind"); });

  add(
    "escalate-important",
    RetryDecision,
    [l](const Request& r) {
      auto& c = std::get<RetryContext>(r.context);
      bool exhausted = c.retryCount >= c.maxRetries || !c.recoverable;
      return exhausted && c.priority >= l.escalationPriority;
    },
    [](const Request&) {
      return Make(Escalate, "retries exhausted on important mission");
    });

  add(
    "retries-exhausted",
    RetryDecision,
    [](const Request& r) {
      auto& c = std::get<RetryContext>(r.context);
      return c.retryCount >= c.maxRetries;
    },
    [](const Request&) { return Make(FailTerminal, "retries exhausted"); });

  add(
    "not-recoverable",
    RetryDecision,
    [](const Request& r) {
      return !std::get<RetryContext>(r.context).recoverable;
    },
    [](const Request&) { return Make(FailTerminal, "not recoverable"); });

  add(
    "retry-with-budget",
    RetryDecision,
    [](const Request& r) {
      auto& c = std::get<RetryContext>(r.context);
      return c.recoverable && c.retryCount < c.maxRetries;
    },
    [](const Request& r) {
      auto& c = std::get<RetryContext>(r.context);
      return Make(Retry, "retry budget left", c.retryCount + 1);
    });

  add(
    "no-sending",
    DomainSelection,
    [](const Request& r) {
      auto& c = std::get<DomainSelectionContext>(r.context);
      return !GetMissionProfile(c.missionType).sendsMessages;
    },
    [](const Request&) { return Make(NoDomain, "mission sends nothing"); });

  add(
    "rotate-dedicated",
    DomainSelection,
    [l](const Request& r) {
      auto& c = std::get<DomainSelectionContext>(r.context);
      return c.hasDedicatedDomain && c.dedicatedReputation &&
             *c.dedicatedReputation < l.customFloor;
    },
    [](const Request&) {
      return Make(SelectPool, "dedicated domain below floor");
    });

  add(
    "dedicated",
    DomainSelection,
    [](const Request& r) {
      return std::get<DomainSelectionContext>(r.context).hasDedicatedDomain;
    },
    [](const Request&) { return Make(SelectDedicated, "dedicated domain"); });

  add(
    "pool",
    DomainSelection,
    [](const Request& r) {
      auto& c = std::get<DomainSelectionContext>(r.context);
      return GetMissionProfile(c.missionType).sendsMessages &&
             !c.hasDedicatedDomain;
    },
    [](const Request&) { return Make(SelectPool, "shared pool"); });

  add(
    "boost-starved",
    PriorityCheck,
    [l](const Request& r) {
      auto& c = std::get<PriorityContext>(r.context);
      return c.queuedForS > l.boostAfterS && c.priority < l.maxPriority;
    },
    [l](const Request& r) {
      auto& c = std::get<PriorityContext>(r.context);
      return Make(Boost,
                  "queued past boost threshold",
                  std::min(c.priority + l.boostStep, l.maxPriority));
    });

  add(
    "maintain",
    PriorityCheck,
    [](const Request&) { return true; },
    [](const Request&) { return Make(Maintain, "within threshold"); });
}

void
RuleEngine::add(std::string name,
                RequestType type,
                std::function<bool(const Request&)> predicate,
                std::function<Decision(const Request&)> action) {
  m_rules.push_back(
    Rule{ std::move(name), type, std::move(predicate), std::move(action) });
}

rex_status
RuleEngine::addRule(Rule rule, std::string_view before) {
  if(rule.name.empty() || !rule.predicate || !rule.action ||
     rule.type >= _REQUEST_TYPE_COUNT) {
    return REX_INVALID_ARGUMENT;
  }
  if(rule.type == StateTransition || rule.type == EligibilityCheck) {
    rex_log(REX_DECISION,
            REX_LOCALERROR,
            "Rule {} rejected, {} rules cannot be changed.",
            rule.name,
            RequestTypeToStr(rule.type));
    return REX_INVALID_ARGUMENT;
  }

  std::unique_lock lock(m_rulesMutex);
  auto named = [](std::string_view name) {
    return [name](const Rule& r) { return r.name == name; };
  };
  if(std::any_of(m_rules.begin(), m_rules.end(), named(rule.name)))
    return REX_INVALID_ARGUMENT;

  auto pos = m_rules.end();
  if(!before.empty()) {
    pos = std::find_if(m_rules.begin(), m_rules.end(), named(before));
    if(pos == m_rules.end())
      return REX_RULE_NOT_FOUND;
    if(pos->type != rule.type)
      return REX_INVALID_ARGUMENT;
  } else {
    pos = std::find_if(
      m_rules.begin(), m_rules.end(), [&rule](const Rule& r) {
        return r.type == rule.type;
      });
  }

  rex_log(REX_DECISION,
          REX_INFO,
          "Adding {} rule {}{}{}.",
          RequestTypeToStr(rule.type),
          rule.name,
          before.empty() ? "" : " before ",
          before);
  m_rules.insert(pos, std::move(rule));
  return REX_OK;
}

rex_status
RuleEngine::setRuleEnabled(std::string_view name, bool enabled) {
  std::unique_lock lock(m_rulesMutex);
  for(Rule& rule : m_rules) {
    if(rule.name != name)
      continue;
    if(rule.type == StateTransition || rule.type == EligibilityCheck)
      return REX_INVALID_ARGUMENT;
    rule.enabled = enabled;
    rex_log(REX_DECISION,
            REX_INFO,
            "Rule {} {}.",
            rule.name,
            enabled ? "enabled" : "disabled");
    return REX_OK;
  }
  return REX_RULE_NOT_FOUND;
}

std::vector<Rule>
RuleEngine::rules() const {
  std::shared_lock lock(m_rulesMutex);
  return m_rules;
}

std::optional<Decision>
RuleEngine::resolve(const Request& request) const {
  RequestType type = request.type();

  std::shared_lock lock(m_rulesMutex);
  for(const Rule& rule : m_rules) {
    if(rule.type != type || !rule.enabled)
      continue;

    auto start = std::chrono::steady_clock::now();
    bool matched = rule.predicate(request);
    std::optional<Decision> d;
    if(matched)
      d = rule.action(request);
    auto took = std::chrono::steady_clock::now() - start;

    if(took > m_limits.budget) {
      rex_log(REX_DECISION,
              REX_LOCALWARNING,
              "Rule {} took {}us, budget is {}ms.",
              rule.name,
              std::chrono::duration_cast<std::chrono::microseconds>(took)
                .count(),
              m_limits.budget.count());
    }

    if(d && !IsAllowed(type, d->verdict)) {
      rex_log(REX_DECISION,
              REX_LOCALERROR,
              "Rule {} answered {} to a {} request, ignoring it.",
              rule.name,
              VerdictToStr(d->verdict),
              RequestTypeToStr(type));
      continue;
    }

    if(d) {
      d->layer = RuleEngineLayer;
      d->confidence = 1.0f;
      d->reason = rule.name + ": " + d->reason;
      return d;
    }
  }
  return std::nullopt;
}

Decision
RuleEngine::fallback(RequestType type) const {
  switch(type) {
    case StateTransition:
    case EligibilityCheck:
      return Make(Deny, "conservative default");
    case FailureClassification:
      return Make(Terminal, "conservative default");
    case RetryDecision:
      return Make(Escalate, "conservative default");
    case DomainSelection:
      return Make(SelectPool, "conservative default");
    case PriorityCheck:
      return Make(Maintain, "conservative default");
    case _REQUEST_TYPE_COUNT:
      break;
  }
  return Make(Deny, "conservative default");
}
}
