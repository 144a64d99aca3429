#include <catch2/catch.hpp>

#include "redact.hpp"
#include "rule_engine.hpp"

#include <algorithm>
#include <string>
#include <variant>

using namespace rex::decision;

static Verdict
Answer(const RuleEngine& rules, Context c) {
  auto d = rules.resolve(Request{ 1, std::move(c) });
  REQUIRE(d);
  REQUIRE(d->layer == RuleEngineLayer);
  REQUIRE(d->confidence == 1.0f);
  return d->verdict;
}

static Rule
CodeRule(std::string name, std::string code, Verdict verdict) {
  Rule r;
  r.name = std::move(name);
  r.type = FailureClassification;
  r.predicate = [code](const Request& req) {
    return std::get<FailureContext>(req.context).code == code;
  };
  r.action = [verdict](const Request&) {
    Decision d;
    d.verdict = verdict;
    d.confidence = 0.2f;
    d.reason = "by code";
    return d;
  };
  return r;
}

static size_t
Position(const RuleEngine& rules, const std::string& name) {
  auto all = rules.rules();
  auto it = std::find_if(
    all.begin(), all.end(), [&name](const Rule& r) { return r.name == name; });
  return it - all.begin();
}

TEST_CASE("Rule engine classifies failures", "[decision][rules]") {
  RuleEngine rules{ RuleEngine::Limits{} };

  REQUIRE(Answer(rules, FailureContext{ REX_ERR_VALIDATION, "", "" }) ==
          Terminal);
  REQUIRE(Answer(rules, FailureContext{ REX_ERR_INVARIANT, "", "" }) ==
          Terminal);
  REQUIRE(Answer(rules, FailureContext{ REX_ERR_RATE_LIMITED, "", "" }) ==
          Recoverable);
  REQUIRE(Answer(rules, FailureContext{ REX_ERR_PROVIDER_ERROR, "503", "" }) ==
          Recoverable);
  REQUIRE(Answer(rules, FailureContext{ REX_ERR_PROVIDER_ERROR, "429", "" }) ==
          Recoverable);

  // Ambiguous failures are left to the next layer.
  REQUIRE(!rules.resolve(
    Request{ 1, FailureContext{ REX_ERR_PROVIDER_ERROR, "403", "" } }));
  REQUIRE(
    !rules.resolve(Request{ 1, FailureContext{ REX_ERR_UNKNOWN, "", "" } }));
}

TEST_CASE("Rule engine decides retries", "[decision][rules]") {
  RuleEngine::Limits limits;
  limits.escalationPriority = 50;
  RuleEngine rules{ limits };

  auto retry = rules.resolve(Request{ 1, RetryContext{ 1, 3, true, 10 } });
  REQUIRE(retry);
  REQUIRE(retry->verdict == Retry);
  REQUIRE(retry->argument == 2);

  REQUIRE(Answer(rules, RetryContext{ 3, 3, true, 10 }) == FailTerminal);
  REQUIRE(Answer(rules, RetryContext{ 0, 3, false, 10 }) == FailTerminal);
  REQUIRE(Answer(rules, RetryContext{ 3, 3, true, 80 }) == Escalate);
  REQUIRE(Answer(rules, RetryContext{ 0, 3, false, 50 }) == Escalate);
}

TEST_CASE("Rule engine picks a domain strategy", "[decision][rules]") {
  RuleEngine rules{ RuleEngine::Limits{} };

  REQUIRE(Answer(rules, DomainSelectionContext{ REX_ICP_EXTRACTION, false }) ==
          NoDomain);
  REQUIRE(Answer(rules,
                 DomainSelectionContext{ REX_CAMPAIGN_EXECUTION, false }) ==
          SelectPool);
  REQUIRE(Answer(rules,
                 DomainSelectionContext{ REX_CAMPAIGN_EXECUTION, true }) ==
          SelectDedicated);
  REQUIRE(Answer(rules,
                 DomainSelectionContext{
                   REX_LEAD_REACTIVATION, true, 0.6f }) == SelectPool);
  REQUIRE(Answer(rules,
                 DomainSelectionContext{
                   REX_LEAD_REACTIVATION, true, 0.7f }) == SelectDedicated);
}

TEST_CASE("Rule engine boosts starved missions", "[decision][rules]") {
  RuleEngine rules{ RuleEngine::Limits{} };

  auto boost = rules.resolve(Request{ 1, PriorityContext{ 40, 90000 } });
  REQUIRE(boost);
  REQUIRE(boost->verdict == Boost);
  REQUIRE(boost->argument == 60);

  auto capped = rules.resolve(Request{ 1, PriorityContext{ 95, 90000 } });
  REQUIRE(capped->verdict == Boost);
  REQUIRE(capped->argument == 100);

  REQUIRE(Answer(rules, PriorityContext{ 100, 90000 }) == Maintain);
  REQUIRE(Answer(rules, PriorityContext{ 40, 3600 }) == Maintain);
}

TEST_CASE("Rule engine denies invalid transitions and ineligible missions",
          "[decision][rules]") {
  RuleEngine rules{ RuleEngine::Limits{} };
  REQUIRE(Answer(rules,
                 StateTransitionContext{ REX_COMPLETED, REX_EV_DISPATCH }) ==
          Deny);
  REQUIRE(Answer(rules, EligibilityContext{ REX_RUNNING, false }) == Deny);
}

TEST_CASE("Conservative defaults per request type", "[decision][rules]") {
  RuleEngine rules{ RuleEngine::Limits{} };
  REQUIRE(rules.fallback(StateTransition).verdict == Deny);
  REQUIRE(rules.fallback(EligibilityCheck).verdict == Deny);
  REQUIRE(rules.fallback(FailureClassification).verdict == Terminal);
  REQUIRE(rules.fallback(RetryDecision).verdict == Escalate);
  REQUIRE(rules.fallback(DomainSelection).verdict == SelectPool);
  REQUIRE(rules.fallback(PriorityCheck).verdict == Maintain);

  for(int t = 0; t < _REQUEST_TYPE_COUNT; ++t) {
    auto d = rules.fallback(RequestType(t));
    REQUIRE(IsAllowed(RequestType(t), d.verdict));
  }
}

TEST_CASE("Redaction removes contact data", "[decision][redact]") {
  REQUIRE(Redact("bounce from jane.doe@example.com") == "bounce from [email]");
  REQUIRE(Redact("call +1 (555) 123-4567 now") == "call [number] now");
  REQUIRE(Redact("account 123456789012") == "account [number]");
  REQUIRE(Redact("reputation 0.75, code 503") == "reputation 0.75, code 503");

  ContextFields f{ { "kind", "unknown" },
                   { "contact_email", "a@b.io" },
                   { "message", "lead x@y.com failed" } };
  auto r = RedactFields(f);
  REQUIRE(r[0].second == "unknown");
  REQUIRE(r[1].second == "[redacted]");
  REQUIRE(r[2].second == "lead [email] failed");
}

TEST_CASE("Rules are added and switched at runtime", "[decision][rules]") {
  RuleEngine rules{ RuleEngine::Limits{} };
  Request forbidden{ 1, FailureContext{ REX_ERR_PROVIDER_ERROR, "403", "" } };
  REQUIRE(!rules.resolve(forbidden));

  REQUIRE(rules.addRule(CodeRule("auth-failure", "403", Terminal)) == REX_OK);
  REQUIRE(Position(rules, "auth-failure") <
          Position(rules, "non-recoverable-kind"));

  auto d = rules.resolve(forbidden);
  REQUIRE(d);
  REQUIRE(d->verdict == Terminal);
  REQUIRE(d->layer == RuleEngineLayer);
  REQUIRE(d->confidence == 1.0f);
  REQUIRE(d->reason == "auth-failure: by code");

  REQUIRE(rules.addRule(CodeRule("auth-failure", "401", Terminal)) ==
          REX_INVALID_ARGUMENT);

  REQUIRE(rules.setRuleEnabled("auth-failure", false) == REX_OK);
  REQUIRE(!rules.resolve(forbidden));
  REQUIRE(rules.setRuleEnabled("auth-failure", true) == REX_OK);
  REQUIRE(rules.resolve(forbidden));

  // Built-in rules may be switched off as well.
  REQUIRE(Answer(rules, PriorityContext{ 40, 90000 }) == Boost);
  REQUIRE(rules.setRuleEnabled("boost-starved", false) == REX_OK);
  REQUIRE(Answer(rules, PriorityContext{ 40, 90000 }) == Maintain);

  REQUIRE(rules.setRuleEnabled("no-such-rule", false) == REX_RULE_NOT_FOUND);
}

TEST_CASE("Rules are placed ahead of a named rule", "[decision][rules]") {
  RuleEngine rules{ RuleEngine::Limits{} };

  REQUIRE(rules.addRule(CodeRule("teapot", "418", Recoverable),
                        "transient-kind") == REX_OK);
  REQUIRE(Position(rules, "teapot") + 1 == Position(rules, "transient-kind"));
  REQUIRE(Position(rules, "teapot") > Position(rules, "non-recoverable-kind"));

  REQUIRE(Answer(rules, FailureContext{ REX_ERR_UNKNOWN, "418", "" }) ==
          Recoverable);
  // Earlier rules still win.
  REQUIRE(Answer(rules, FailureContext{ REX_ERR_VALIDATION, "418", "" }) ==
          Terminal);

  REQUIRE(rules.addRule(CodeRule("a", "1", Terminal), "no-such-rule") ==
          REX_RULE_NOT_FOUND);
  REQUIRE(rules.addRule(CodeRule("b", "2", Terminal), "pool") ==
          REX_INVALID_ARGUMENT);
}

TEST_CASE("Malformed and lifecycle rules are refused", "[decision][rules]") {
  RuleEngine rules{ RuleEngine::Limits{} };
  size_t count = rules.rules().size();

  REQUIRE(rules.addRule(CodeRule("", "1", Terminal)) == REX_INVALID_ARGUMENT);

  Rule noPredicate = CodeRule("no-predicate", "1", Terminal);
  noPredicate.predicate = nullptr;
  REQUIRE(rules.addRule(noPredicate) == REX_INVALID_ARGUMENT);

  Rule lifecycle = CodeRule("lifecycle", "1", Allow);
  lifecycle.type = StateTransition;
  REQUIRE(rules.addRule(lifecycle) == REX_INVALID_ARGUMENT);
  REQUIRE(rules.setRuleEnabled("invalid-transition", false) ==
          REX_INVALID_ARGUMENT);

  REQUIRE(rules.rules().size() == count);
}

TEST_CASE("Rules answering a verdict outside their type are skipped",
          "[decision][rules]") {
  RuleEngine rules{ RuleEngine::Limits{} };
  REQUIRE(rules.addRule(CodeRule("confused", "418", Boost)) == REX_OK);

  REQUIRE(!rules.resolve(
    Request{ 1, FailureContext{ REX_ERR_PROVIDER_ERROR, "418", "" } }));
  REQUIRE(Answer(rules, FailureContext{ REX_ERR_RATE_LIMITED, "418", "" }) ==
          Recoverable);
}
