#pragma once

#include <rex/common/types.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace rex::decision {
enum RequestType {
  StateTransition,
  EligibilityCheck,
  FailureClassification,
  RetryDecision,
  DomainSelection,
  PriorityCheck,
  _REQUEST_TYPE_COUNT
};

enum Verdict {
  Allow,
  Deny,
  Transition,
  Recoverable,
  Terminal,
  Retry,
  FailTerminal,
  Escalate,
  SelectDedicated,
  SelectPool,
  NoDomain,
  Boost,
  Maintain,
  _VERDICT_COUNT
};

/// Which layer produced a decision.
enum Layer {
  StateMachineLayer,
  RuleEngineLayer,
  LLMLayer,
  LLMFallbackLayer,
  _LAYER_COUNT
};

const char*
RequestTypeToStr(RequestType type);

const char*
VerdictToStr(Verdict verdict);

const char*
LayerToStr(Layer layer);

bool
VerdictFromStr(std::string_view str, Verdict* verdict);

struct StateTransitionContext {
  rex_mission_state state = REX_QUEUED;
  rex_mission_event event = REX_EV_DISPATCH;
};

struct EligibilityContext {
  rex_mission_state state = REX_QUEUED;
  bool leaseHeld = false;
};

struct FailureContext {
  rex_error_kind kind = REX_ERR_UNKNOWN;
  std::string code;
  std::string message;
};

struct RetryContext {
  uint32_t retryCount = 0;
  uint32_t maxRetries = 0;
  bool recoverable = false;
  int32_t priority = 0;
};

struct DomainSelectionContext {
  rex_mission_type missionType = REX_CAMPAIGN_EXECUTION;
  bool hasDedicatedDomain = false;
  std::optional<float> dedicatedReputation;
};

struct PriorityContext {
  int32_t priority = 0;
  int64_t queuedForS = 0;
};

/// Alternatives are ordered like RequestType, the index is the type.
using Context = std::variant<StateTransitionContext,
                             EligibilityContext,
                             FailureContext,
                             RetryContext,
                             DomainSelectionContext,
                             PriorityContext>;

struct Request {
  rex_id missionId = 0;
  Context context;

  RequestType type() const { return static_cast<RequestType>(context.index()); }
};

struct Decision {
  Verdict verdict = Deny;
  Layer layer = RuleEngineLayer;
  float confidence = 1.0f;

  /// Target of a Transition verdict.
  rex_mission_state target = REX_QUEUED;

  /// Next attempt for Retry, new priority for Boost.
  int64_t argument = 0;

  std::string reason;
};

/** @brief One predicate to action rule of the rule engine.
 *
 * Predicate and action must be free of side effects. The action is only run
 * if the predicate matched, and its verdict must be allowed for the type.
 */
struct Rule {
  std::string name;
  RequestType type = FailureClassification;
  std::function<bool(const Request&)> predicate;
  std::function<Decision(const Request&)> action;
  bool enabled = true;
};

using ContextFields = std::vector<std::pair<std::string, std::string>>;

/// Verdicts a resolver may answer with for the given request type.
const std::vector<Verdict>&
AllowedVerdicts(RequestType type);

bool
IsAllowed(RequestType type, Verdict verdict);

/** @brief Check context values at the boundary.
 *
 * @return True if the context is well formed. Otherwise the reason is
 * written to `why`.
 */
bool
Validate(const Request& request, std::string* why);

/// Flatten a context into ordered key/value pairs.
ContextFields
Normalize(const Context& context);

inline std::ostream&
operator<<(std::ostream& o, RequestType type) {
  return o << RequestTypeToStr(type);
}
inline std::ostream&
operator<<(std::ostream& o, Verdict verdict) {
  return o << VerdictToStr(verdict);
}
inline std::ostream&
operator<<(std::ostream& o, Layer layer) {
  return o << LayerToStr(layer);
}
}
