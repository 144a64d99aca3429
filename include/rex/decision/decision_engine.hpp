#pragma once

#include <rex/common/status.h>
#include <rex/decision/decision.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rex {
class Config;
class Clock;

namespace bus {
class MessageBus;
}
}

namespace rex::decision {
class AuditTrail;
class Reasoner;

/** @brief Answers orchestration questions through three layers.
 *
 * The state machine is asked first, then the rule engine, and only if both
 * decline the reasoner. Reasoner calls run on a private thread pool and are
 * bounded by the configured timeout. Any failure of the reasoner degrades to
 * the rule engine's conservative default, recorded as llm-fallback.
 *
 * Every resolved request is appended to the audit trail and published on the
 * bus. resolve() never throws.
 */
class DecisionEngine {
  public:
  struct Stats {
    std::array<uint64_t, _LAYER_COUNT> byLayer = {};
    uint64_t cacheHits = 0;
    uint64_t cacheMisses = 0;
    uint64_t fallbacks = 0;
    uint64_t invalidRequests = 0;
    uint64_t highConfidence = 0;
    uint64_t mediumConfidence = 0;
    uint64_t lowConfidence = 0;
    int64_t totalLatencyUs = 0;
    double meanLatencyUs = 0;
  };

  DecisionEngine(const Config& config,
                 const Clock& clock,
                 bus::MessageBus& bus,
                 AuditTrail& audit,
                 std::shared_ptr<Reasoner> reasoner);
  ~DecisionEngine();

  Decision resolve(const Request& request);

  /** @brief Add a rule to the rule engine while running.
   *
   * Only failure classification, retry, domain selection and priority rules
   * can be added. The rule goes ahead of `before`, or ahead of every rule of
   * its type.
   */
  rex_status addRule(Rule rule, std::string_view before = "");
  rex_status setRuleEnabled(std::string_view name, bool enabled);

  /// Rule names in evaluation order.
  std::vector<std::string> ruleNames() const;

  Stats stats() const;

  /// Number of calls handed to the reasoner, cache hits excluded.
  uint64_t reasonerCalls() const;

  private:
  struct Internal;
  std::unique_ptr<Internal> m_internal;

  const Clock& m_clock;
  bus::MessageBus& m_bus;
  AuditTrail& m_audit;

  Decision askReasoner(const Request& request);
  void record(const Request& request, const Decision& d, int64_t latencyUs);
};
}
