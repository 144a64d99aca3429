#pragma once

#include <rex/common/status.h>
#include <rex/decision/decision.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace rex::decision {
/** @brief Second layer, ordered predicate to action rules.
 *
 * Rules are evaluated in order, first match wins. Rules never have side
 * effects, the only observable thing besides the decision is a log line when
 * a rule exceeds its time budget.
 *
 * Rules for failure classification, retries, domain selection and priority
 * checks may be added and switched on or off at runtime. Lifecycle rules are
 * fixed.
 */
class RuleEngine {
  public:
  struct Limits {
    int32_t escalationPriority = 50;
    int64_t boostAfterS = 86400;
    int32_t boostStep = 20;
    int32_t maxPriority = 100;
    float customFloor = 0.7f;
    std::chrono::milliseconds budget{ 50 };
  };

  explicit RuleEngine(Limits limits);

  std::optional<Decision> resolve(const Request& request) const;

  /// Conservative default used when no layer produced an answer.
  Decision fallback(RequestType type) const;

  /** @brief Insert a rule.
   *
   * The rule is placed ahead of the rule named `before`, or ahead of every
   * rule of its type if `before` is empty.
   */
  rex_status addRule(Rule rule, std::string_view before = "");

  rex_status setRuleEnabled(std::string_view name, bool enabled);

  /// Copy of the rules in evaluation order.
  std::vector<Rule> rules() const;
  const Limits& limits() const { return m_limits; }

  private:
  Limits m_limits;
  mutable std::shared_mutex m_rulesMutex;
  std::vector<Rule> m_rules;

  void add(std::string name,
           RequestType type,
           std::function<bool(const Request&)> predicate,
           std::function<Decision(const Request&)> action);
};
}
