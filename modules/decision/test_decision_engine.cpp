#include <catch2/catch.hpp>

#include <rex/bus/message_bus.hpp>
#include <rex/common/clock.hpp>
#include <rex/common/config.hpp>
#include <rex/decision/audit_trail.hpp>
#include <rex/decision/decision_engine.hpp>

#include "mocks.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <variant>

using namespace rex;
using namespace rex::decision;
using namespace std::chrono_literals;

namespace {
struct EngineFixture {
  Config config;
  ManualClock clock;
  bus::MessageBus bus;
  AuditTrail audit;

  EngineFixture() { config.set(Config::ReasonerTimeoutMs, uint64_t(100)); }

  DecisionEngine make(std::shared_ptr<Reasoner> reasoner) {
    return DecisionEngine(config, clock, bus, audit, std::move(reasoner));
  }
};

Request
Ambiguous(rex_id mission, std::string message = "") {
  return Request{ mission,
                  FailureContext{ REX_ERR_UNKNOWN, "E42", std::move(message) } };
}
}

TEST_CASE_METHOD(EngineFixture,
                 "The reasoner is never asked when the state machine answers",
                 "[decision][engine]") {
  auto reasoner = std::make_shared<ScriptedReasoner>("TERMINAL");
  DecisionEngine engine(config, clock, bus, audit, reasoner);

  auto d = engine.resolve(
    Request{ 1, StateTransitionContext{ REX_RUNNING, REX_EV_COMPLETE } });
  REQUIRE(d.layer == StateMachineLayer);
  REQUIRE(d.target == REX_COMPLETED);

  auto e =
    engine.resolve(Request{ 1, EligibilityContext{ REX_QUEUED, false } });
  REQUIRE(e.layer == StateMachineLayer);
  REQUIRE(e.verdict == Allow);

  auto r = engine.resolve(Request{ 1, RetryContext{ 0, 3, true, 0 } });
  REQUIRE(r.layer == RuleEngineLayer);

  REQUIRE(reasoner->calls() == 0);
  REQUIRE(engine.reasonerCalls() == 0);
  REQUIRE(audit.size() == 3);
}

TEST_CASE_METHOD(EngineFixture,
                 "Ambiguous failures go to the reasoner and are cached",
                 "[decision][engine]") {
  auto reasoner = std::make_shared<ScriptedReasoner>("recoverable", 1.7f);
  DecisionEngine engine(config, clock, bus, audit, reasoner);

  auto d = engine.resolve(Ambiguous(1, "lead bob@corp.com bounced"));
  REQUIRE(d.layer == LLMLayer);
  REQUIRE(d.verdict == Recoverable);
  REQUIRE(d.confidence == 1.0f);
  REQUIRE(reasoner->calls() == 1);

  auto seen = reasoner->requests().at(0);
  REQUIRE(seen.type == FailureClassification);
  for(auto& [key, value] : seen.context) {
    REQUIRE(value.find("bob@corp.com") == std::string::npos);
  }
  REQUIRE(seen.allowed == std::vector<std::string>{ "RECOVERABLE", "TERMINAL" });

  // Same failure with another message hits the cache.
  auto again = engine.resolve(Ambiguous(2, "other text"));
  REQUIRE(again.layer == LLMLayer);
  REQUIRE(again.verdict == Recoverable);
  REQUIRE(reasoner->calls() == 1);

  auto s = engine.stats();
  REQUIRE(s.cacheHits == 1);
  REQUIRE(s.cacheMisses == 1);
  REQUIRE(s.byLayer[LLMLayer] == 2);

  // Past the TTL the reasoner is asked again.
  clock.advance(config.getSeconds(Config::ReasonerCacheTtlS) + 1s);
  engine.resolve(Ambiguous(3));
  REQUIRE(reasoner->calls() == 2);
}

TEST_CASE_METHOD(EngineFixture,
                 "A hanging reasoner degrades within the timeout bound",
                 "[decision][engine]") {
  auto reasoner = std::make_shared<TimingOutReasoner>(500ms);
  DecisionEngine engine(config, clock, bus, audit, reasoner);

  auto start = std::chrono::steady_clock::now();
  auto d = engine.resolve(Ambiguous(1));
  auto took = std::chrono::steady_clock::now() - start;

  REQUIRE(d.layer == LLMFallbackLayer);
  REQUIRE(d.verdict == Terminal);
  REQUIRE(d.confidence == 0.0f);
  REQUIRE(took < 400ms);

  auto records = audit.records();
  REQUIRE(records.size() == 1);
  REQUIRE(records[0].layer == "llm-fallback");
  REQUIRE(records[0].output == "TERMINAL");
  REQUIRE(engine.stats().fallbacks == 1);
}

TEST_CASE_METHOD(EngineFixture,
                 "Reasoner failures fall back to the conservative default",
                 "[decision][engine]") {
  SECTION("Decision outside the allowed values") {
    auto engine = make(std::make_shared<ScriptedReasoner>("BOOST"));
    auto d = engine.resolve(Ambiguous(1));
    REQUIRE(d.layer == LLMFallbackLayer);
    REQUIRE(d.verdict == Terminal);
  }
  SECTION("Malformed response") {
    auto engine = make(
      std::make_shared<ScriptedReasoner>("", 0, REX_MALFORMED_RESPONSE));
    REQUIRE(engine.resolve(Ambiguous(1)).layer == LLMFallbackLayer);
  }
  SECTION("Throwing provider") {
    auto engine = make(std::make_shared<ThrowingReasoner>());
    REQUIRE(engine.resolve(Ambiguous(1)).layer == LLMFallbackLayer);
  }
  SECTION("No provider configured") {
    auto engine = make(nullptr);
    auto d = engine.resolve(Ambiguous(1));
    REQUIRE(d.layer == LLMFallbackLayer);
    REQUIRE(d.verdict == Terminal);
  }
  REQUIRE(audit.size() == 1);
}

TEST_CASE_METHOD(EngineFixture,
                 "Invalid contexts get the conservative default",
                 "[decision][engine]") {
  auto reasoner = std::make_shared<ScriptedReasoner>("RETRY");
  DecisionEngine engine(config, clock, bus, audit, reasoner);

  auto d = engine.resolve(Request{ 1, RetryContext{ 4, 3, true, 0 } });
  REQUIRE(d.layer == RuleEngineLayer);
  REQUIRE(d.verdict == Escalate);

  auto r = engine.resolve(
    Request{ 1, DomainSelectionContext{ REX_CAMPAIGN_EXECUTION, true, 1.5f } });
  REQUIRE(r.verdict == SelectPool);

  REQUIRE(reasoner->calls() == 0);
  REQUIRE(engine.stats().invalidRequests == 2);
}

TEST_CASE_METHOD(EngineFixture,
                 "Every decision is recorded and published",
                 "[decision][engine]") {
  std::vector<std::string> published;
  bus.subscribe(bus::DecisionResolved, [&published](const bus::Event& e) {
    published.push_back(e.subject + " " + e.detail);
  });

  auto engine = make(nullptr);
  engine.resolve(Request{ 7, PriorityContext{ 10, 100000 } });

  REQUIRE(published ==
          std::vector<std::string>{ "PRIORITY_CHECK rule-engine:BOOST:30" });

  auto records = audit.records();
  REQUIRE(records.size() == 1);
  REQUIRE(records[0].sequence == 1);
  REQUIRE(records[0].missionId == 7);
  REQUIRE(records[0].requestType == "PRIORITY_CHECK");
  REQUIRE(records[0].inputs.size() == 2);

  std::string json = AuditTrail::toJson(records[0]);
  REQUIRE(json.find('\n') == std::string::npos);
  REQUIRE(json.find("\"layer\": \"rule-engine\"") != std::string::npos);
}

TEST_CASE_METHOD(EngineFixture,
                 "Rules added at runtime answer before the reasoner",
                 "[decision][engine][rules]") {
  auto reasoner = std::make_shared<ScriptedReasoner>("RECOVERABLE");
  DecisionEngine engine(config, clock, bus, audit, reasoner);

  Rule e42;
  e42.name = "e42-is-terminal";
  e42.type = FailureClassification;
  e42.predicate = [](const Request& r) {
    return std::get<FailureContext>(r.context).code == "E42";
  };
  e42.action = [](const Request&) {
    Decision d;
    d.verdict = Terminal;
    d.reason = "known bad";
    return d;
  };
  REQUIRE(engine.addRule(e42) == REX_OK);

  auto names = engine.ruleNames();
  REQUIRE(std::find(names.begin(), names.end(), "e42-is-terminal") !=
          names.end());

  auto d = engine.resolve(Ambiguous(1));
  REQUIRE(d.layer == RuleEngineLayer);
  REQUIRE(d.verdict == Terminal);
  REQUIRE(reasoner->calls() == 0);

  REQUIRE(engine.setRuleEnabled("e42-is-terminal", false) == REX_OK);
  auto e = engine.resolve(Ambiguous(2));
  REQUIRE(e.layer == LLMLayer);
  REQUIRE(e.verdict == Recoverable);
  REQUIRE(reasoner->calls() == 1);
}

TEST_CASE_METHOD(EngineFixture,
                 "Decision history is filtered by mission",
                 "[decision][audit]") {
  DecisionEngine engine = make(nullptr);
  for(rex_id m = 1; m <= 3; ++m) {
    engine.resolve(Request{ m, RetryContext{ 0, 3, true, 0 } });
    engine.resolve(Request{ m, PriorityContext{ 10, 0 } });
  }

  auto all = audit.history();
  REQUIRE(all.size() == 6);
  REQUIRE(all.front().missionId == 1);
  REQUIRE(all.back().missionId == 3);

  auto recent = audit.history(3);
  REQUIRE(recent.size() == 3);
  REQUIRE(recent.front().sequence == all[3].sequence);
  REQUIRE(recent.back().sequence == all[5].sequence);

  auto second = audit.history(50, 2);
  REQUIRE(second.size() == 2);
  REQUIRE(second[0].requestType == "RETRY_DECISION");
  REQUIRE(second[1].requestType == "PRIORITY_CHECK");
  for(auto& r : second)
    REQUIRE(r.missionId == 2);

  REQUIRE(audit.history(1, 2).at(0).requestType == "PRIORITY_CHECK");
  REQUIRE(audit.history(50, 42).empty());
  REQUIRE(audit.history(0).empty());
}
