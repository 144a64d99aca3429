#include <catch2/catch.hpp>

#include "mocks.hpp"

#include <rex/allocator/resource_allocator.hpp>
#include <rex/bus/message_bus.hpp>
#include <rex/common/mission_profile.hpp>
#include <rex/decision/audit_trail.hpp>
#include <rex/decision/decision_engine.hpp>

#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace rex;
using namespace std::chrono_literals;

namespace {
bool
WaitFor(std::function<bool()> condition,
        std::chrono::milliseconds timeout = 3000ms) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(condition())
      return true;
    std::this_thread::sleep_for(5ms);
  }
  return condition();
}

void
WithDomain(Config& config) {
  config.set(Config::Domains,
             Config::StringVector{ "mail.acme.io:custom:0.75" });
}

const allocator::ResourceSnapshot::DomainUsage*
FindDomain(const allocator::ResourceSnapshot& s, const std::string& name) {
  for(auto& d : s.domains) {
    if(d.record.name == name)
      return &d;
  }
  return nullptr;
}
}

TEST_CASE("Reputation drop only affects future leases",
          "[orchestrator][scenario][domain]") {
  OrchestratorMock mock(nullptr, &WithDomain);
  auto& o = *mock.orchestrator;

  rex_id first = o.submitMission(REX_LEAD_REACTIVATION, 5);
  REQUIRE(mock.scheduler().scheduleTick() == 1);

  auto running = o.getMissionStatus(first);
  REQUIRE(running->state == REX_RUNNING);
  REQUIRE(running->domain == std::string("mail.acme.io"));

  REQUIRE(o.reportReputation("mail.acme.io", 0.65f) == REX_OK);

  auto snap = o.getResourceSnapshot();
  auto domain = FindDomain(snap, "mail.acme.io");
  REQUIRE(domain);
  REQUIRE(!domain->eligible);
  REQUIRE(domain->leases == 1);

  // The running mission keeps its domain and may finish.
  REQUIRE(mock.state(first) == REX_RUNNING);
  REQUIRE(o.reportCompleted(first, "reactivated 3 leads") == REX_OK);
  REQUIRE(mock.state(first) == REX_COMPLETED);
  REQUIRE(FindDomain(o.getResourceSnapshot(), "mail.acme.io")->leases == 0);

  rex_id second = o.submitMission(REX_LEAD_REACTIVATION, 5);
  REQUIRE(mock.scheduler().scheduleTick() == 0);
  REQUIRE(mock.state(second) == REX_QUEUED);
  REQUIRE(mock.heldSlots(GetMissionProfile(REX_LEAD_REACTIVATION).crew) == 0);

  REQUIRE(o.reportReputation("mail.acme.io", 0.72f) == REX_OK);
  REQUIRE(mock.scheduler().scheduleTick() == 1);
  REQUIRE(mock.state(second) == REX_RUNNING);
}

TEST_CASE("Deterministic decisions never reach the reasoner",
          "[orchestrator][decision]") {
  auto reasoner = std::make_shared<ScriptedReasoner>("TERMINAL");
  OrchestratorMock mock(reasoner, &WithDomain);
  auto& o = *mock.orchestrator;

  rex_id a = o.submitMission(REX_CAMPAIGN_EXECUTION, 60);
  rex_id b = o.submitMission(REX_ICP_EXTRACTION, 10);
  rex_id c = o.submitMission(REX_ICP_EXTRACTION, 10);
  REQUIRE(mock.scheduler().scheduleTick() == 3);

  REQUIRE(o.reportProgress(a, 0.5f) == REX_OK);
  REQUIRE(o.reportCompleted(a, "sent") == REX_OK);
  REQUIRE(o.reportFailure(
            b, scheduler::ErrorDetail{ "503", "bad gateway",
                                       REX_ERR_PROVIDER_ERROR }) == REX_OK);
  REQUIRE(o.cancelMission(c) == REX_OK);
  mock.scheduler().recoveryTick();
  mock.clock.advance(3h);
  mock.scheduler().monitorTick();
  mock.scheduler().recoveryTick();
  mock.scheduler().scheduleTick();

  REQUIRE(reasoner->calls() == 0);

  auto stats = o.decisionEngine().stats();
  REQUIRE(stats.byLayer[decision::StateMachineLayer] > 0);
  REQUIRE(stats.byLayer[decision::RuleEngineLayer] > 0);
  REQUIRE(stats.byLayer[decision::LLMLayer] == 0);
  REQUIRE(stats.byLayer[decision::LLMFallbackLayer] == 0);

  // Every resolved decision leaves a trace.
  uint64_t resolved = 0;
  for(auto n : stats.byLayer)
    resolved += n;
  REQUIRE(o.auditTrail().size() == resolved);
}

TEST_CASE("Ambiguous failures are classified by the reasoner",
          "[orchestrator][decision][reasoner]") {
  auto reasoner = std::make_shared<ScriptedReasoner>("RECOVERABLE", 0.8f);
  OrchestratorMock mock(reasoner);
  auto& o = *mock.orchestrator;

  rex_id id = o.submitMission(REX_ICP_EXTRACTION, 10);
  REQUIRE(mock.scheduler().scheduleTick() == 1);

  scheduler::ErrorDetail weird{
    "E_STRANGE", "crew lost contact with jane.doe@acme.io", REX_ERR_UNKNOWN
  };
  REQUIRE(o.reportFailure(id, weird) == REX_OK);
  REQUIRE(mock.state(id) == REX_RETRY_PENDING);
  REQUIRE(reasoner->calls() == 1);

  auto req = reasoner->requests().at(0);
  REQUIRE(req.type == decision::FailureClassification);
  REQUIRE(std::find(req.allowed.begin(), req.allowed.end(), "RECOVERABLE") !=
          req.allowed.end());
  for(auto& [key, value] : req.context)
    REQUIRE(value.find("jane.doe@acme.io") == std::string::npos);

  auto records = o.auditTrail().records();
  auto llm = std::find_if(
    records.begin(), records.end(), [](const decision::DecisionRecord& r) {
      return r.layer == "llm";
    });
  REQUIRE(llm != records.end());
  REQUIRE(llm->requestType == "FAILURE_CLASSIFICATION");
  REQUIRE(llm->output == "RECOVERABLE");
  REQUIRE(llm->confidence == 0.8f);
}

TEST_CASE("A hanging reasoner degrades to the conservative default",
          "[orchestrator][decision][reasoner]") {
  auto reasoner = std::make_shared<TimingOutReasoner>(300ms);
  OrchestratorMock mock(reasoner, [](Config& config) {
    config.set(Config::ReasonerTimeoutMs, uint64_t(50));
  });
  auto& o = *mock.orchestrator;

  rex_id id = o.submitMission(REX_ICP_EXTRACTION, 10);
  REQUIRE(mock.scheduler().scheduleTick() == 1);

  auto before = std::chrono::steady_clock::now();
  REQUIRE(o.reportFailure(id,
                          scheduler::ErrorDetail{
                            "", "crew vanished", REX_ERR_UNKNOWN }) == REX_OK);
  auto took = std::chrono::steady_clock::now() - before;
  REQUIRE(took < 250ms);

  auto s = o.getMissionStatus(id);
  REQUIRE(s->state == REX_FAILED);
  REQUIRE(!s->error->escalated);
  REQUIRE(o.decisionEngine().stats().fallbacks == 1);
  REQUIRE(mock.heldSlots(GetMissionProfile(REX_ICP_EXTRACTION).crew) == 0);
}

TEST_CASE("Bus observers see the mission lifecycle",
          "[orchestrator][bus]") {
  Config config;
  ManualClock clock;
  Orchestrator o(config, nullptr, &clock);

  std::mutex mutex;
  std::vector<bus::Event> events;
  auto conn = o.messageBus().subscribeAll([&](const bus::Event& e) {
    if(e.topic == bus::DecisionResolved)
      return;
    std::unique_lock lock(mutex);
    events.push_back(e);
  });

  rex_id id = o.submitMission(REX_ICP_EXTRACTION,
                              1,
                              scheduler::MissionPayload{
                                std::nullopt, std::nullopt, "{\"icp\":1}" });
  REQUIRE(o.missionScheduler().scheduleTick() == 1);
  REQUIRE(o.reportCompleted(id, "done") == REX_OK);
  conn.disconnect();

  std::vector<bus::Topic> mission;
  for(auto& e : events) {
    if(e.missionId == id)
      mission.push_back(e.topic);
  }
  REQUIRE(mission.front() == bus::MissionCreated);
  REQUIRE(mission.back() == bus::MissionCompleted);

  auto assigned = std::find_if(
    events.begin(), events.end(), [](const bus::Event& e) {
      return e.topic == bus::MissionAssigned;
    });
  REQUIRE(assigned != events.end());
  REQUIRE(assigned->subject == GetMissionProfile(REX_ICP_EXTRACTION).crew);
  REQUIRE(assigned->detail.find("{\"icp\":1}") != std::string::npos);

  size_t transitions =
    std::count_if(events.begin(), events.end(), [id](const bus::Event& e) {
      return e.topic == bus::MissionStateChanged && e.missionId == id;
    });
  REQUIRE(transitions == 3);

  size_t granted =
    std::count_if(events.begin(), events.end(), [](const bus::Event& e) {
      return e.topic == bus::ResourceLeaseGranted;
    });
  size_t released =
    std::count_if(events.begin(), events.end(), [](const bus::Event& e) {
      return e.topic == bus::ResourceLeaseReleased;
    });
  REQUIRE(granted == 2);
  REQUIRE(released == 2);
}

TEST_CASE("Lease observers may query the mission they belong to",
          "[orchestrator][bus]") {
  // Shared with the worker, which outlives this test if the tick hangs.
  auto mock = std::make_shared<OrchestratorMock>();
  auto& o = *mock->orchestrator;
  rex_id id = o.submitMission(REX_ICP_EXTRACTION, 1);

  auto seen = std::make_shared<std::vector<rex_mission_state>>();
  auto look = [&o, seen](const bus::Event& e) {
    auto s = o.getMissionStatus(e.missionId);
    seen->push_back(s ? s->state : REX_MISSION_STATE_COUNT);
  };
  auto granted = o.messageBus().subscribe(bus::ResourceLeaseGranted, look);
  auto released = o.messageBus().subscribe(bus::ResourceLeaseReleased, look);

  auto done = std::make_shared<std::promise<size_t>>();
  std::future<size_t> dispatched = done->get_future();
  std::thread worker([mock, id, done]() {
    size_t n = mock->scheduler().scheduleTick();
    mock->orchestrator->reportCompleted(id, "done");
    done->set_value(n);
  });

  bool finished = dispatched.wait_for(3s) == std::future_status::ready;
  if(finished)
    worker.join();
  else
    worker.detach();
  REQUIRE(finished);

  REQUIRE(dispatched.get() == 1);
  REQUIRE(seen->size() >= 2);
  REQUIRE(seen->front() == REX_RUNNING);
  REQUIRE(seen->back() == REX_COMPLETED);
  REQUIRE(mock->heldSlots(GetMissionProfile(REX_ICP_EXTRACTION).crew) == 0);

  granted.disconnect();
  released.disconnect();
}

TEST_CASE("Control loops run on their own", "[orchestrator][loops]") {
  OrchestratorMock mock(nullptr, [](Config& config) {
    config.set(Config::WorkerThreads, uint32_t(2));
    config.set(Config::ScheduleIntervalMs, uint64_t(20));
    config.set(Config::MonitorIntervalMs, uint64_t(20));
    config.set(Config::RecoveryIntervalMs, uint64_t(20));
  });
  auto& o = *mock.orchestrator;

  o.start();
  REQUIRE(o.running());

  rex_id id = o.submitMission(REX_ICP_EXTRACTION, 1);
  REQUIRE(WaitFor([&]() { return mock.dispatcher.orders().size() == 1; }));
  REQUIRE(mock.state(id) == REX_RUNNING);

  REQUIRE(o.reportFailure(id,
                          scheduler::ErrorDetail{
                            "429", "slow down", REX_ERR_RATE_LIMITED }) ==
          REX_OK);

  // Wait for the recovery loop to plan the retry, then let the backoff pass.
  REQUIRE(WaitFor([&]() {
    mock.clock.advance(100ms);
    return mock.dispatcher.orders().size() == 2;
  }));
  REQUIRE(mock.dispatcher.orders().back().attempt == 2);

  // Silence beyond the timeout is picked up by the monitor.
  mock.clock.advance(3h);
  REQUIRE(WaitFor([&]() { return mock.scheduler().stats().timedOut == 1; }));

  o.stop();
  REQUIRE(!o.running());
  o.stop();
}
