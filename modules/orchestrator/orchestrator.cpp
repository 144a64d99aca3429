#include <rex/bus/message_bus.hpp>
#include <rex/common/clock.hpp>
#include <rex/common/config.hpp>
#include <rex/common/log.h>
#include <rex/common/mission_profile.hpp>
#include <rex/decision/audit_trail.hpp>
#include <rex/decision/decision_engine.hpp>
#include <rex/decision/reasoner.hpp>
#include <rex/orchestrator/orchestrator.hpp>
#include <rex/scheduler/dispatcher.hpp>
#include <rex/scheduler/mission_scheduler.hpp>

#include <algorithm>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/exception/diagnostic_information.hpp>

using boost::asio::io_context;

namespace rex {
struct Orchestrator::Internal {
  Internal(const Config& config,
           std::shared_ptr<decision::Reasoner> reasoner,
           const Clock* externalClock,
           scheduler::MissionDispatcher* externalDispatcher)
    : ownedClock(externalClock ? nullptr : std::make_unique<SystemClock>())
    , clock(externalClock ? *externalClock : *ownedClock)
    , audit(std::string(config.getString(Config::AuditFile)))
    , resources(config, clock, messageBus)
    , engine(config, clock, messageBus, audit, std::move(reasoner))
    , ownedDispatcher(
        externalDispatcher
          ? nullptr
          : std::make_unique<scheduler::BusDispatcher>(messageBus, clock))
    , dispatcher(externalDispatcher ? *externalDispatcher : *ownedDispatcher)
    , missions(config, clock, messageBus, resources, engine, dispatcher) {}

  std::unique_ptr<Clock> ownedClock;
  const Clock& clock;

  bus::MessageBus messageBus;
  decision::AuditTrail audit;
  allocator::ResourceAllocator resources;
  decision::DecisionEngine engine;

  std::unique_ptr<scheduler::BusDispatcher> ownedDispatcher;
  scheduler::MissionDispatcher& dispatcher;

  io_context context;
  std::optional<boost::asio::executor_work_guard<io_context::executor_type>>
    work;
  std::vector<std::thread> threads;
  std::atomic_bool running = false;

  // Destroyed first, its timers live in the context above.
  scheduler::MissionScheduler missions;
};

Orchestrator::Orchestrator(const Config& config,
                           std::shared_ptr<decision::Reasoner> reasoner,
                           const Clock* clock,
                           scheduler::MissionDispatcher* dispatcher)
  : m_internal(std::make_unique<Internal>(config,
                                          std::move(reasoner),
                                          clock,
                                          dispatcher))
  , m_config(config) {
  size_t crewCount = 0;
  const char* const* crews = GetCrewNames(&crewCount);
  uint32_t slots = m_config.getUint32(Config::CrewMaxSlots);
  for(size_t i = 0; i < crewCount; ++i) {
    m_internal->resources.addCrew(crews[i], slots);
  }

  size_t domains = provisionConfiguredDomains();

  rex_log(REX_GENERAL,
          REX_DEBUG,
          "Created orchestrator {} with {} crews of {} slots and {} domains.",
          m_config.getString(Config::LocalName),
          crewCount,
          slots,
          domains);
}

Orchestrator::~Orchestrator() {
  stop();
}

size_t
Orchestrator::provisionConfiguredDomains() {
  size_t provisioned = 0;
  for(auto& spec : m_config.getStringVector(Config::Domains)) {
    allocator::DomainRecord record;
    if(!allocator::ParseDomainRecord(spec, record)) {
      rex_log(REX_GENERAL,
              REX_LOCALERROR,
              "Invalid domain specification \"{}\"! Expected "
              "name:tier:reputation[:status[:campaign]].",
              spec);
      continue;
    }
    if(m_internal->resources.provisionDomain(std::move(record)) == REX_OK)
      ++provisioned;
  }
  return provisioned;
}

void
Orchestrator::start() {
  auto& i = *m_internal;
  if(i.running.exchange(true))
    return;

  uint32_t threadCount =
    std::max<uint32_t>(1, m_config.getUint32(Config::WorkerThreads));

  rex_log(REX_GENERAL,
          REX_INFO,
          "Starting orchestrator loops on {} threads.",
          threadCount);

  i.context.restart();
  i.work.emplace(boost::asio::make_work_guard(i.context));
  i.missions.start(i.context);

  for(uint32_t t = 0; t < threadCount; ++t) {
    i.threads.emplace_back([this]() {
      auto& context = m_internal->context;
      while(!context.stopped()) {
        try {
          context.run();
        } catch(std::exception& e) {
          rex_log(REX_GENERAL,
                  REX_LOCALERROR,
                  "Exception in io context: {}, diagnostic info: {}",
                  e.what(),
                  boost::diagnostic_information(e));
        }
      }
    });
  }
}

void
Orchestrator::stop() {
  auto& i = *m_internal;
  if(!i.running.exchange(false))
    return;

  rex_log(REX_GENERAL, REX_INFO, "Stopping orchestrator loops.");

  i.missions.stop();
  i.work.reset();
  i.context.stop();
  for(auto& t : i.threads) {
    if(t.joinable())
      t.join();
  }
  i.threads.clear();
}

bool
Orchestrator::running() const {
  return m_internal->running;
}

rex_id
Orchestrator::submitMission(rex_mission_type type,
                            int32_t priority,
                            scheduler::MissionPayload payload) {
  return m_internal->missions.submit(type, priority, std::move(payload));
}

rex_status
Orchestrator::cancelMission(rex_id id) {
  return m_internal->missions.cancel(id);
}

rex_status
Orchestrator::updateMissionPriority(rex_id id, int32_t priority) {
  return m_internal->missions.updatePriority(id, priority);
}

rex_status
Orchestrator::rescheduleMission(rex_id id, TimePoint notBefore) {
  return m_internal->missions.reschedule(id, notBefore);
}

std::optional<scheduler::MissionStatus>
Orchestrator::getMissionStatus(rex_id id) const {
  return m_internal->missions.status(id);
}

allocator::ResourceSnapshot
Orchestrator::getResourceSnapshot() const {
  return m_internal->resources.snapshot();
}

rex_status
Orchestrator::reportProgress(rex_id id, float fraction) {
  return m_internal->missions.reportProgress(id, fraction);
}

rex_status
Orchestrator::reportCompleted(rex_id id, std::string result) {
  return m_internal->missions.reportCompleted(id, std::move(result));
}

rex_status
Orchestrator::reportFailure(rex_id id, scheduler::ErrorDetail error) {
  return m_internal->missions.reportFailure(id, std::move(error));
}

rex_status
Orchestrator::recordDeliveryOutcome(std::string_view domain,
                                    allocator::DeliveryOutcome outcome) {
  return m_internal->resources.recordDeliveryOutcome(domain, outcome);
}

rex_status
Orchestrator::reportReputation(std::string_view domain, float score) {
  return m_internal->resources.reportReputation(domain, score);
}

rex_status
Orchestrator::provisionDomain(allocator::DomainRecord record) {
  rex_status s = m_internal->resources.provisionDomain(std::move(record));
  if(s == REX_OK)
    m_internal->missions.wake();
  return s;
}

size_t
Orchestrator::advanceWarmupDay() {
  size_t activated = m_internal->resources.advanceWarmupDay();
  if(activated > 0)
    m_internal->missions.wake();
  return activated;
}

std::vector<decision::DecisionRecord>
Orchestrator::getDecisionHistory(size_t limit, rex_id missionId) const {
  return m_internal->audit.history(limit, missionId);
}

bus::MessageBus&
Orchestrator::messageBus() {
  return m_internal->messageBus;
}

allocator::ResourceAllocator&
Orchestrator::resourceAllocator() {
  return m_internal->resources;
}

decision::DecisionEngine&
Orchestrator::decisionEngine() {
  return m_internal->engine;
}

decision::AuditTrail&
Orchestrator::auditTrail() {
  return m_internal->audit;
}

scheduler::MissionScheduler&
Orchestrator::missionScheduler() {
  return m_internal->missions;
}
}
