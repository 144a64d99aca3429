#include "reasoner_cache.hpp"
#include "redact.hpp"
#include "rule_engine.hpp"
#include "state_machine.hpp"

#include <rex/bus/message_bus.hpp>
#include <rex/common/clock.hpp>
#include <rex/common/config.hpp>
#include <rex/common/log.h>
#include <rex/decision/audit_trail.hpp>
#include <rex/decision/decision_engine.hpp>
#include <rex/decision/reasoner.hpp>

#include <algorithm>
#include <cmath>
#include <future>
#include <mutex>

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/rolling_mean.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace rex::decision {
static RuleEngine::Limits
RuleLimitsFromConfig(const Config& config) {
  RuleEngine::Limits l;
  l.escalationPriority = config.getInt32(Config::EscalationPriority);
  l.boostAfterS = config.getUint64(Config::PriorityBoostAfterS);
  l.customFloor = config.getFloat(Config::CustomFloor);
  l.budget = config.getMilliseconds(Config::RuleBudgetMs);
  return l;
}

struct DecisionEngine::Internal {
  static constexpr size_t LatencyWindowSize = 256;

  Internal(const Config& config, std::shared_ptr<Reasoner> r)
    : rules(RuleLimitsFromConfig(config))
    , cache(config.getSeconds(Config::ReasonerCacheTtlS),
            config.getUint32(Config::ReasonerCacheSize))
    , reasoner(r ? std::move(r) : std::make_shared<UnavailableReasoner>())
    , reasonerTimeout(config.getMilliseconds(Config::ReasonerTimeoutMs))
    , reasonerPool(2)
    , acc_latency(boost::accumulators::tag::rolling_window::window_size =
                    LatencyWindowSize) {}

  StateMachine stateMachine;
  RuleEngine rules;
  ReasonerCache cache;

  std::shared_ptr<Reasoner> reasoner;
  std::chrono::milliseconds reasonerTimeout;
  boost::asio::thread_pool reasonerPool;

  mutable std::mutex statsMutex;
  Stats stats;
  uint64_t reasonerCalls = 0;
  ::boost::accumulators::accumulator_set<
    double,
    ::boost::accumulators::stats<::boost::accumulators::tag::rolling_mean>>
    acc_latency;
};

DecisionEngine::DecisionEngine(const Config& config,
                               const Clock& clock,
                               bus::MessageBus& bus,
                               AuditTrail& audit,
                               std::shared_ptr<Reasoner> reasoner)
  : m_internal(std::make_unique<Internal>(config, std::move(reasoner)))
  , m_clock(clock)
  , m_bus(bus)
  , m_audit(audit) {
  rex_log(REX_DECISION,
          REX_DEBUG,
          "DecisionEngine uses {} reasoner with timeout {}ms and {} rules.",
          m_internal->reasoner->name(),
          m_internal->reasonerTimeout.count(),
          m_internal->rules.rules().size());
}

rex_status
DecisionEngine::addRule(Rule rule, std::string_view before) {
  return m_internal->rules.addRule(std::move(rule), before);
}

rex_status
DecisionEngine::setRuleEnabled(std::string_view name, bool enabled) {
  return m_internal->rules.setRuleEnabled(name, enabled);
}

std::vector<std::string>
DecisionEngine::ruleNames() const {
  std::vector<std::string> names;
  for(auto& r : m_internal->rules.rules())
    names.push_back(r.name);
  return names;
}

DecisionEngine::~DecisionEngine() {
  m_internal->reasonerPool.stop();
  m_internal->reasonerPool.join();
}

Decision
DecisionEngine::resolve(const Request& request) {
  auto start = std::chrono::steady_clock::now();
  RequestType type = request.type();

  Decision d;
  std::string why;
  if(!Validate(request, &why)) {
    d = m_internal->rules.fallback(type);
    d.reason = "invalid context: " + why;
    rex_log(REX_DECISION,
            REX_LOCALWARNING,
            "Invalid {} request for mission {}: {}",
            RequestTypeToStr(type),
            request.missionId,
            why);
    std::unique_lock lock(m_internal->statsMutex);
    ++m_internal->stats.invalidRequests;
  } else if(auto sm = m_internal->stateMachine.resolve(request)) {
    d = std::move(*sm);
  } else if(auto rule = m_internal->rules.resolve(request)) {
    d = std::move(*rule);
  } else {
    d = askReasoner(request);
  }

  int64_t latencyUs = std::chrono::duration_cast<std::chrono::microseconds>(
                        std::chrono::steady_clock::now() - start)
                        .count();
  record(request, d, latencyUs);
  return d;
}

Decision
DecisionEngine::askReasoner(const Request& request) {
  auto& i = *m_internal;
  RequestType type = request.type();
  ContextFields fields = Normalize(request.context);
  std::string key = ReasonerCache::key(type, fields);

  if(auto cached = i.cache.get(key, m_clock.now())) {
    {
      std::unique_lock lock(i.statsMutex);
      ++i.stats.cacheHits;
    }
    Decision d;
    d.verdict = cached->verdict;
    d.layer = LLMLayer;
    d.confidence = cached->confidence;
    d.reason = "cached reasoner answer";
    return d;
  }

  ReasonerRequest req;
  req.type = type;
  req.context = RedactFields(fields);
  for(Verdict v : AllowedVerdicts(type))
    req.allowed.emplace_back(VerdictToStr(v));

  {
    std::unique_lock lock(i.statsMutex);
    ++i.stats.cacheMisses;
    ++i.reasonerCalls;
  }

  auto fallback = [this, type, &request](const std::string& why) {
    Decision d = m_internal->rules.fallback(type);
    d.layer = LLMFallbackLayer;
    d.confidence = 0;
    d.reason = "reasoner failed: " + why;
    rex_log(REX_REASONER,
            REX_LOCALWARNING,
            "Falling back to {} for {} of mission {}: {}",
            VerdictToStr(d.verdict),
            RequestTypeToStr(type),
            request.missionId,
            why);
    std::unique_lock lock(m_internal->statsMutex);
    ++m_internal->stats.fallbacks;
    return d;
  };

  auto promise = std::make_shared<std::promise<ReasonerResult>>();
  auto future = promise->get_future();
  std::shared_ptr<Reasoner> reasoner = i.reasoner;

  boost::asio::post(i.reasonerPool, [promise, reasoner, req]() {
    ReasonerResult res;
    try {
      res = reasoner->resolve(req);
    } catch(const std::exception& e) {
      res.status = REX_GENERIC_ERROR;
      res.error = e.what();
    }
    promise->set_value(std::move(res));
  });

  if(future.wait_for(i.reasonerTimeout) != std::future_status::ready) {
    return fallback("timeout after " +
                    std::to_string(i.reasonerTimeout.count()) + "ms");
  }

  ReasonerResult res = future.get();
  if(res.status != REX_OK) {
    return fallback(std::string(rex_status_to_str(res.status)) + " " +
                    Redact(res.error));
  }

  Verdict verdict;
  if(!VerdictFromStr(res.decision, &verdict) || !IsAllowed(type, verdict)) {
    return fallback("decision '" + Redact(res.decision) +
                    "' not allowed for " + RequestTypeToStr(type));
  }

  float confidence = res.confidence;
  if(!(confidence >= 0))
    confidence = 0;
  confidence = std::min(confidence, 1.0f);

  i.cache.put(key, ReasonerCache::Answer{ verdict, confidence }, m_clock.now());

  Decision d;
  d.verdict = verdict;
  d.layer = LLMLayer;
  d.confidence = confidence;
  d.reason = std::string("answered by ") + reasoner->name() + " reasoner";
  return d;
}

void
DecisionEngine::record(const Request& request,
                       const Decision& d,
                       int64_t latencyUs) {
  RequestType type = request.type();

  {
    auto& i = *m_internal;
    std::unique_lock lock(i.statsMutex);
    ++i.stats.byLayer[d.layer];
    if(d.confidence >= 0.9f)
      ++i.stats.highConfidence;
    else if(d.confidence >= 0.7f)
      ++i.stats.mediumConfidence;
    else
      ++i.stats.lowConfidence;
    i.stats.totalLatencyUs += latencyUs;
    i.acc_latency(static_cast<double>(latencyUs));
  }

  std::string output = VerdictToStr(d.verdict);
  if(d.verdict == Transition)
    output += std::string(":") + rex_mission_state_to_str(d.target);
  else if(d.verdict == Retry || d.verdict == Boost)
    output += ":" + std::to_string(d.argument);

  DecisionRecord r;
  r.missionId = request.missionId;
  r.requestType = RequestTypeToStr(type);
  r.layer = LayerToStr(d.layer);
  r.inputs = RedactFields(Normalize(request.context));
  r.output = output;
  r.confidence = d.confidence;
  r.latencyUs = latencyUs;
  r.timestampMs = toMillis(m_clock.now());
  r.reason = d.reason;
  m_audit.append(std::move(r));

  rex_log(REX_DECISION,
          REX_TRACE,
          "{} for mission {} resolved by {} to {} ({})",
          RequestTypeToStr(type),
          request.missionId,
          LayerToStr(d.layer),
          output,
          d.reason);

  m_bus.publish(bus::Event{ bus::DecisionResolved,
                            request.missionId,
                            RequestTypeToStr(type),
                            std::string(LayerToStr(d.layer)) + ":" + output,
                            m_clock.now() });
}

DecisionEngine::Stats
DecisionEngine::stats() const {
  std::unique_lock lock(m_internal->statsMutex);
  Stats s = m_internal->stats;
  uint64_t resolved = 0;
  for(auto n : s.byLayer)
    resolved += n;
  if(resolved > 0) {
    s.meanLatencyUs =
      boost::accumulators::rolling_mean(m_internal->acc_latency);
  }
  return s;
}

uint64_t
DecisionEngine::reasonerCalls() const {
  std::unique_lock lock(m_internal->statsMutex);
  return m_internal->reasonerCalls;
}
}
