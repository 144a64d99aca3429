#include "mission_queue.hpp"

#include <rex/allocator/resource_allocator.hpp>
#include <rex/bus/message_bus.hpp>
#include <rex/common/clock.hpp>
#include <rex/common/config.hpp>
#include <rex/common/log.h>
#include <rex/common/mission_profile.hpp>
#include <rex/decision/decision_engine.hpp>
#include <rex/scheduler/mission_scheduler.hpp>

#include <algorithm>
#include <atomic>
#include <deque>
#include <list>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/pool/pool_alloc.hpp>
#include <boost/signals2/connection.hpp>

namespace rex::scheduler {
using allocator::AcquireResult;
using allocator::Denied;
using allocator::Lease;
using decision::Decision;
using decision::Request;

namespace {
struct Mission {
  std::mutex mutex;

  rex_id id = 0;
  rex_mission_type type = REX_CAMPAIGN_EXECUTION;
  int32_t priority = 0;
  rex_mission_state state = REX_QUEUED;
  std::string crew;
  std::optional<std::string> domain;
  uint32_t retryCount = 0;
  uint32_t maxRetries = 0;
  float progress = 0;

  TimePoint createdAt;
  TimePoint queuedSince;
  TimePoint lastProgressAt;
  std::optional<TimePoint> startedAt;
  std::optional<TimePoint> completedAt;
  std::optional<TimePoint> retryAt;
  std::optional<TimePoint> notBefore;

  std::optional<std::string> result;
  std::optional<ErrorDetail> error;

  /// Never changes after submission, may be read without the lock.
  MissionPayload payload;

  std::vector<rex_id> leases;

  MissionStatus status() const {
    MissionStatus s;
    s.id = id;
    s.type = type;
    s.priority = priority;
    s.state = state;
    s.crew = crew;
    s.domain = domain;
    s.retryCount = retryCount;
    s.maxRetries = maxRetries;
    s.progress = progress;
    s.createdAt = createdAt;
    s.startedAt = startedAt;
    s.completedAt = completedAt;
    s.lastProgressAt = lastProgressAt;
    s.notBefore = notBefore;
    s.dependencies = payload.dependencies;
    s.result = result;
    s.error = error;
    return s;
  }
};
using MissionPtr = std::shared_ptr<Mission>;
using Events = std::vector<bus::Event>;
using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

enum class Dependencies { Met, Waiting, Broken };
}

struct MissionScheduler::Internal {
  Internal(const Config& config,
           const Clock& clock,
           allocator::ResourceAllocator& allocator,
           decision::DecisionEngine& engine)
    : config(config)
    , clock(clock)
    , resources(allocator)
    , engine(engine)
    , keepFinished(config.getUint32(Config::KeepFinishedMissions)) {}

  const Config& config;
  const Clock& clock;
  allocator::ResourceAllocator& resources;
  decision::DecisionEngine& engine;

  template<typename T>
  using Allocator =
    boost::fast_pool_allocator<T,
                               boost::default_user_allocator_new_delete,
                               boost::details::pool::default_mutex,
                               64>;
  using FailureMailbox = std::list<rex_id, Allocator<rex_id>>;

  mutable std::mutex missionsMutex;
  std::map<rex_id, MissionPtr> missions;
  std::set<rex_id> runningIds;
  std::set<rex_id> retryPendingIds;
  std::deque<rex_id> finished;
  const size_t keepFinished;
  std::atomic<rex_id> nextMissionId = 1;

  MissionQueue queue;

  std::mutex mailboxMutex;
  FailureMailbox mailbox;

  std::mutex scheduleTickMutex;
  std::mutex monitorTickMutex;
  std::mutex recoveryTickMutex;

  std::atomic<uint64_t> submitted = 0, scheduled = 0, completed = 0,
                        failed = 0, timedOut = 0, retried = 0, cancelled = 0,
                        escalated = 0, dispatchErrors = 0;

  std::optional<Strand> scheduleStrand, monitorStrand, recoveryStrand;
  std::unique_ptr<boost::asio::steady_timer> scheduleTimer, monitorTimer,
    recoveryTimer;
  std::atomic_bool running = false;
  std::atomic_bool wakePending = false;

  /// Releases made by the scheduling loop itself must not wake it again.
  std::atomic<std::thread::id> scheduleTickThread{ std::thread::id() };

  boost::signals2::scoped_connection leaseReleasedConnection;

  MissionPtr find(rex_id id) const {
    std::unique_lock lock(missionsMutex);
    auto it = missions.find(id);
    if(it == missions.end())
      return nullptr;
    return it->second;
  }

  /// Missions currently in the given index.
  std::vector<MissionPtr> collect(const std::set<rex_id>& ids) const {
    std::unique_lock lock(missionsMutex);
    std::vector<MissionPtr> v;
    v.reserve(ids.size());
    for(rex_id id : ids) {
      auto it = missions.find(id);
      if(it != missions.end())
        v.push_back(it->second);
    }
    return v;
  }

  std::set<rex_id>* indexOf(rex_mission_state state) {
    switch(state) {
      case REX_RUNNING:
        return &runningIds;
      case REX_RETRY_PENDING:
        return &retryPendingIds;
      default:
        return nullptr;
    }
  }

  /** @brief Follow a state change in the loop indices.
   *
   * Finished missions stay queryable until more than keepFinished newer ones
   * finished. Called with the mission locked.
   */
  void track(rex_id id, rex_mission_state from, rex_mission_state to) {
    std::unique_lock lock(missionsMutex);
    if(auto index = indexOf(from))
      index->erase(id);
    if(auto index = indexOf(to))
      index->insert(id);

    if(!rex_mission_state_is_terminal(to))
      return;
    finished.push_back(id);
    while(finished.size() > keepFinished) {
      missions.erase(finished.front());
      finished.pop_front();
    }
  }

  /** @brief State of the prerequisites of a mission.
   *
   * A prerequisite that ended in any state other than COMPLETED, or that is
   * no longer known, can never be met.
   */
  Dependencies checkDependencies(const Mission& m, std::string& why) const {
    Dependencies result = Dependencies::Met;
    for(rex_id dep : m.payload.dependencies) {
      MissionPtr d = find(dep);
      if(!d) {
        why = "dependency " + std::to_string(dep) + " is unknown";
        return Dependencies::Broken;
      }

      rex_mission_state s;
      {
        std::unique_lock lock(d->mutex);
        s = d->state;
      }
      if(s == REX_COMPLETED)
        continue;
      if(rex_mission_state_is_terminal(s)) {
        why = "dependency " + std::to_string(dep) + " ended " +
              rex_mission_state_to_str(s);
        return Dependencies::Broken;
      }
      result = Dependencies::Waiting;
    }
    return result;
  }

  void pushFailure(rex_id id) {
    std::unique_lock lock(mailboxMutex);
    mailbox.push_back(id);
  }

  FailureMailbox drainFailures() {
    std::unique_lock lock(mailboxMutex);
    FailureMailbox drained;
    drained.swap(mailbox);
    return drained;
  }

  Duration backoff(uint32_t retryCount) const {
    auto base = config.getMilliseconds(Config::BackoffBaseMs);
    auto cap = config.getMilliseconds(Config::BackoffCapMs);
    auto exponent = std::min<uint32_t>(retryCount, 30);
    auto delay = base * (int64_t(1) << exponent);
    return std::min(delay, cap);
  }

  /// Ask the engine and apply the answer. Only the engine moves missions.
  bool applyEvent(Mission& m, rex_mission_event event, Events& out) {
    Decision d = engine.resolve(
      Request{ m.id, decision::StateTransitionContext{ m.state, event } });
    if(d.verdict != decision::Transition) {
      rex_log(REX_SCHEDULER,
              REX_LOCALWARNING,
              "Mission {} in state {} refused event {}: {}",
              m.id,
              rex_mission_state_to_str(m.state),
              rex_mission_event_to_str(event),
              d.reason);
      return false;
    }

    rex_mission_state from = m.state;
    m.state = d.target;
    track(m.id, from, m.state);

    TimePoint now = clock.now();
    out.push_back(
      bus::Event{ bus::MissionStateChanged,
                  m.id,
                  rex_mission_type_to_str(m.type),
                  std::string(rex_mission_state_to_str(from)) + "->" +
                    rex_mission_state_to_str(m.state),
                  now });

    if(m.state == REX_COMPLETED) {
      out.push_back(bus::Event{ bus::MissionCompleted,
                                m.id,
                                rex_mission_type_to_str(m.type),
                                m.result.value_or(""),
                                now });
    } else if(m.state == REX_FAILED) {
      std::string detail = m.error ? m.error->message : std::string();
      if(m.error && m.error->escalated)
        detail = "escalated: " + detail;
      out.push_back(bus::Event{ bus::MissionFailed,
                                m.id,
                                rex_mission_type_to_str(m.type),
                                detail,
                                now });
    }

    if(rex_mission_state_is_terminal(m.state))
      m.completedAt = now;

    rex_log(REX_SCHEDULER,
            REX_DEBUG,
            "Mission {} {} -> {} on {}",
            m.id,
            rex_mission_state_to_str(from),
            rex_mission_state_to_str(m.state),
            rex_mission_event_to_str(event));
    return true;
  }

  void releaseLeases(Mission& m) {
    for(rex_id lease : m.leases)
      resources.release(lease);
    m.leases.clear();
    // Leases that expired or were released elsewhere.
    resources.releaseAll(m.id);
  }

  /// Decide about escalation and move the mission to FAILED.
  void failMission(Mission& m,
                   rex_mission_event event,
                   bool recoverable,
                   Events& out) {
    Decision d = engine.resolve(
      Request{ m.id,
               decision::RetryContext{ std::min(m.retryCount, m.maxRetries),
                                       m.maxRetries,
                                       recoverable,
                                       m.priority } });
    if(!m.error)
      m.error = ErrorDetail();
    if(d.verdict == decision::Escalate) {
      m.error->escalated = true;
    }

    if(!applyEvent(m, event, out))
      return;

    releaseLeases(m);
    ++failed;
    if(m.error->escalated) {
      ++escalated;
      rex_log(REX_SCHEDULER,
              REX_GLOBALWARNING,
              "Escalating failed {} mission {} (priority {}): {}",
              rex_mission_type_to_str(m.type),
              m.id,
              m.priority,
              m.error->message);
    }
  }

  void forceFail(Mission& m, const std::string& why, Events& out) {
    rex_log(REX_SCHEDULER,
            REX_FATAL,
            "Invariant violated by mission {}: {}. Forcing it to fail.",
            m.id,
            why);
    m.error = ErrorDetail{ "invariant", why, REX_ERR_INVARIANT, false };
    rex_mission_event event = m.state == REX_RETRY_PENDING
                                ? REX_EV_RETRIES_EXHAUSTED
                                : REX_EV_INVARIANT_VIOLATION;
    if(applyEvent(m, event, out))
      ++failed;
    releaseLeases(m);
    queue.remove(m.id);
  }

  void failDependent(Mission& m, const std::string& why, Events& out) {
    rex_log(REX_SCHEDULER,
            REX_LOCALWARNING,
            "Mission {} can never run: {}.",
            m.id,
            why);
    m.error = ErrorDetail{ "dependency", why, REX_ERR_VALIDATION, false };
    failMission(m, REX_EV_DEPENDENCY_FAILED, false, out);
    queue.remove(m.id);
  }

  void checkPriority(Mission& m, TimePoint now) {
    // Waiting for the requested start time is not starvation.
    TimePoint since = m.queuedSince;
    if(m.notBefore && *m.notBefore > since)
      since = *m.notBefore;
    int64_t queuedFor =
      std::chrono::duration_cast<std::chrono::seconds>(now - since).count();
    queuedFor = std::max<int64_t>(0, queuedFor);
    Decision d = engine.resolve(
      Request{ m.id, decision::PriorityContext{ m.priority, queuedFor } });
    if(d.verdict != decision::Boost)
      return;

    rex_log(REX_SCHEDULER,
            REX_INFO,
            "Boosting mission {} from priority {} to {} after {}s in queue.",
            m.id,
            m.priority,
            d.argument,
            queuedFor);
    m.priority = static_cast<int32_t>(d.argument);
    m.queuedSince = now;
    queue.reprioritize(m.id, m.priority);
  }

  /** @brief Acquire every lease a queued mission needs.
   *
   * On a full grant the mission moves to RUNNING and a dispatch order is
   * returned. Otherwise everything acquired in this attempt is given back.
   */
  std::optional<DispatchOrder> tryAssign(Mission& m,
                                         TimePoint now,
                                         Events& out) {
    Decision eligible = engine.resolve(Request{
      m.id, decision::EligibilityContext{ m.state, !m.leases.empty() } });
    if(eligible.verdict != decision::Allow) {
      if(!m.leases.empty())
        forceFail(m, "queued mission holds leases", out);
      return std::nullopt;
    }

    const MissionProfile& profile = GetMissionProfile(m.type);

    decision::DomainSelectionContext ds;
    ds.missionType = m.type;
    ds.hasDedicatedDomain = m.payload.dedicatedDomain.has_value();
    if(m.payload.dedicatedDomain) {
      if(auto r = resources.domain(*m.payload.dedicatedDomain))
        ds.dedicatedReputation = r->reputation;
    }
    Decision domainStrategy = engine.resolve(Request{ m.id, ds });

    allocator::Constraints c;
    c.crew = profile.crew;
    c.campaignId = m.payload.campaignId;
    if(domainStrategy.verdict == decision::SelectDedicated)
      c.dedicatedDomain = m.payload.dedicatedDomain;
    c.quota[allocator::LLM] = profile.llmCalls;
    c.quota[allocator::Email] = profile.emailCalls;
    c.quota[allocator::SMS] = profile.smsCalls;

    std::vector<Lease> acquired;
    bool invariantBroken = false;
    std::string denial;

    auto acquire = [&](allocator::LeaseKind kind) {
      AcquireResult r = resources.acquire(kind, m.id, c);
      if(auto lease = std::get_if<Lease>(&r)) {
        acquired.push_back(*lease);
        return true;
      }
      auto& d = std::get<Denied>(r);
      if(d.reason == allocator::AlreadyHeld)
        invariantBroken = true;
      denial = std::string(allocator::DenialReasonToStr(d.reason)) + " (" +
               d.detail + ")";
      return false;
    };

    bool granted = acquire(allocator::AgentSlot) &&
                   (domainStrategy.verdict == decision::NoDomain ||
                    acquire(allocator::Domain)) &&
                   (c.quota.empty() || acquire(allocator::ApiQuota));

    auto rollback = [&]() {
      for(auto& lease : acquired)
        resources.release(lease.id);
    };

    if(!granted) {
      rollback();
      if(invariantBroken) {
        forceFail(m, "second lease of the same kind requested", out);
        return std::nullopt;
      }
      rex_log(REX_SCHEDULER,
              REX_TRACE,
              "Mission {} stays queued: {}",
              m.id,
              denial);
      checkPriority(m, now);
      return std::nullopt;
    }

    for(auto& lease : acquired)
      m.leases.push_back(lease.id);

    if(!applyEvent(m, REX_EV_DISPATCH, out) ||
       !applyEvent(m, REX_EV_START, out)) {
      forceFail(m, "dispatch transition refused", out);
      return std::nullopt;
    }

    m.crew = profile.crew;
    m.domain.reset();
    for(auto& lease : acquired) {
      if(lease.kind == allocator::Domain)
        m.domain = lease.resource;
    }
    m.startedAt = now;
    m.lastProgressAt = now;
    m.progress = 0;
    queue.remove(m.id);
    ++scheduled;

    DispatchOrder order;
    order.missionId = m.id;
    order.type = m.type;
    order.priority = m.priority;
    order.attempt = m.retryCount + 1;
    order.crew = m.crew;
    order.domain = m.domain;
    order.payload = m.payload.body;
    return order;
  }
};

MissionScheduler::MissionScheduler(const Config& config,
                                   const Clock& clock,
                                   bus::MessageBus& bus,
                                   allocator::ResourceAllocator& allocator,
                                   decision::DecisionEngine& engine,
                                   MissionDispatcher& dispatcher)
  : m_internal(std::make_unique<Internal>(config, clock, allocator, engine))
  , m_config(config)
  , m_clock(clock)
  , m_bus(bus)
  , m_allocator(allocator)
  , m_engine(engine)
  , m_dispatcher(dispatcher) {
  m_internal->leaseReleasedConnection =
    m_allocator.getLeaseReleasedSignal().connect(
      [this](const allocator::Lease&) {
        if(std::this_thread::get_id() != m_internal->scheduleTickThread)
          wake();
      });
}

MissionScheduler::~MissionScheduler() {
  stop();
  rex_log(REX_SCHEDULER,
          REX_DEBUG,
          "Destroy MissionScheduler with {} missions.",
          m_internal->missions.size());
}

static void
Publish(bus::MessageBus& bus, Events& events) {
  for(auto& e : events)
    bus.publish(std::move(e));
  events.clear();
}

rex_id
MissionScheduler::submit(rex_mission_type type,
                         int32_t priority,
                         MissionPayload payload) {
  auto& i = *m_internal;
  TimePoint now = m_clock.now();

  if(type >= REX_MISSION_TYPE_COUNT) {
    rex_log(REX_SCHEDULER,
            REX_LOCALERROR,
            "Rejecting mission of unknown type {}!",
            static_cast<int>(type));
    return 0;
  }

  rex_id issued = i.nextMissionId;
  for(rex_id dep : payload.dependencies) {
    if(dep == 0 || dep >= issued) {
      rex_log(REX_SCHEDULER,
              REX_LOCALERROR,
              "Rejecting {} mission depending on unknown mission {}!",
              rex_mission_type_to_str(type),
              dep);
      return 0;
    }
  }

  auto m = std::make_shared<Mission>();
  m->id = i.nextMissionId++;
  m->type = type;
  m->priority = priority;
  m->maxRetries = m_config.getUint32(Config::MaxRetries);
  m->createdAt = now;
  m->queuedSince = now;
  m->lastProgressAt = now;
  m->notBefore = payload.notBefore;
  m->payload = std::move(payload);

  {
    std::unique_lock lock(i.missionsMutex);
    i.missions.emplace(m->id, m);
  }
  i.queue.push(QueueEntry{ m->id, m->priority, m->createdAt });
  ++i.submitted;

  rex_log(REX_SCHEDULER,
          REX_DEBUG,
          "Submitted {} mission {} with priority {}.",
          rex_mission_type_to_str(m->type),
          m->id,
          priority);

  m_bus.publish(bus::Event{ bus::MissionCreated,
                            m->id,
                            rex_mission_type_to_str(m->type),
                            rex_mission_state_to_str(REX_QUEUED),
                            now });
  wake();
  return m->id;
}

rex_status
MissionScheduler::cancel(rex_id id) {
  auto& i = *m_internal;
  MissionPtr m = i.find(id);
  if(!m)
    return REX_MISSION_NOT_FOUND;

  Events events;
  {
    bus::MessageBus::Deferral deferral(m_bus);
    std::unique_lock lock(m->mutex);
    if(rex_mission_state_is_terminal(m->state))
      return REX_ALREADY_TERMINAL;

    m->error =
      ErrorDetail{ "cancelled", "cancelled on request", REX_ERR_CANCELLED };
    if(!i.applyEvent(*m, REX_EV_CANCEL, events))
      return REX_INVALID_TRANSITION;

    m->retryAt.reset();
    i.releaseLeases(*m);
    i.queue.remove(id);
    ++i.cancelled;
  }
  Publish(m_bus, events);
  return REX_OK;
}

rex_status
MissionScheduler::updatePriority(rex_id id, int32_t priority) {
  auto& i = *m_internal;
  MissionPtr m = i.find(id);
  if(!m)
    return REX_MISSION_NOT_FOUND;

  {
    std::unique_lock lock(m->mutex);
    if(rex_mission_state_is_terminal(m->state))
      return REX_ALREADY_TERMINAL;

    rex_log(REX_SCHEDULER,
            REX_INFO,
            "Mission {} priority {} -> {}.",
            id,
            m->priority,
            priority);
    m->priority = priority;
    if(m->state == REX_QUEUED)
      i.queue.reprioritize(id, priority);
  }
  wake();
  return REX_OK;
}

rex_status
MissionScheduler::reschedule(rex_id id, TimePoint notBefore) {
  auto& i = *m_internal;
  MissionPtr m = i.find(id);
  if(!m)
    return REX_MISSION_NOT_FOUND;

  {
    std::unique_lock lock(m->mutex);
    if(rex_mission_state_is_terminal(m->state))
      return REX_ALREADY_TERMINAL;
    if(m->state != REX_QUEUED)
      return REX_INVALID_TRANSITION;

    m->notBefore = notBefore;
    rex_log(REX_SCHEDULER, REX_DEBUG, "Mission {} rescheduled.", id);
  }
  wake();
  return REX_OK;
}

std::optional<MissionStatus>
MissionScheduler::status(rex_id id) const {
  MissionPtr m = m_internal->find(id);
  if(!m)
    return std::nullopt;
  std::unique_lock lock(m->mutex);
  return m->status();
}

rex_status
MissionScheduler::reportProgress(rex_id id, float fraction) {
  if(!(fraction >= 0 && fraction <= 1))
    return REX_INVALID_ARGUMENT;

  MissionPtr m = m_internal->find(id);
  if(!m)
    return REX_MISSION_NOT_FOUND;

  std::unique_lock lock(m->mutex);
  if(rex_mission_state_is_terminal(m->state))
    return REX_ALREADY_TERMINAL;
  if(m->state != REX_RUNNING)
    return REX_INVALID_TRANSITION;

  m->progress = std::max(m->progress, fraction);
  m->lastProgressAt = m_clock.now();
  return REX_OK;
}

rex_status
MissionScheduler::reportCompleted(rex_id id, std::string result) {
  auto& i = *m_internal;
  MissionPtr m = i.find(id);
  if(!m)
    return REX_MISSION_NOT_FOUND;

  Events events;
  {
    bus::MessageBus::Deferral deferral(m_bus);
    std::unique_lock lock(m->mutex);
    if(rex_mission_state_is_terminal(m->state))
      return REX_ALREADY_TERMINAL;
    if(m->state != REX_RUNNING)
      return REX_INVALID_TRANSITION;

    m->result = std::move(result);
    if(!i.applyEvent(*m, REX_EV_COMPLETE, events))
      return REX_INVALID_TRANSITION;

    m->progress = 1;
    i.releaseLeases(*m);
    ++i.completed;
  }
  Publish(m_bus, events);
  return REX_OK;
}

rex_status
MissionScheduler::reportFailure(rex_id id, ErrorDetail error) {
  auto& i = *m_internal;
  MissionPtr m = i.find(id);
  if(!m)
    return REX_MISSION_NOT_FOUND;

  Events events;
  {
    bus::MessageBus::Deferral deferral(m_bus);
    std::unique_lock lock(m->mutex);
    if(rex_mission_state_is_terminal(m->state))
      return REX_ALREADY_TERMINAL;
    if(m->state != REX_RUNNING)
      return REX_INVALID_TRANSITION;

    Decision cls = m_engine.resolve(Request{
      id, decision::FailureContext{ error.kind, error.code, error.message } });

    rex_log(REX_SCHEDULER,
            REX_DEBUG,
            "Mission {} failed with {} ({}), classified {} by {}.",
            id,
            rex_error_kind_to_str(error.kind),
            error.code,
            decision::VerdictToStr(cls.verdict),
            decision::LayerToStr(cls.layer));

    error.escalated = false;
    m->error = std::move(error);

    if(cls.verdict == decision::Recoverable) {
      if(!i.applyEvent(*m, REX_EV_RECOVERABLE_FAILURE, events))
        return REX_INVALID_TRANSITION;
      i.releaseLeases(*m);
      m->retryAt.reset();
      i.pushFailure(id);
    } else {
      i.failMission(*m, REX_EV_TERMINAL_FAILURE, false, events);
    }
  }
  Publish(m_bus, events);
  return REX_OK;
}

size_t
MissionScheduler::scheduleTick() {
  auto& i = *m_internal;
  std::unique_lock tickLock(i.scheduleTickMutex);
  i.scheduleTickThread = std::this_thread::get_id();

  size_t batch = m_config.getUint32(Config::DispatchBatch);
  size_t dispatched = 0;

  for(const QueueEntry& entry : i.queue.snapshot()) {
    if(dispatched >= batch)
      break;

    MissionPtr m = i.find(entry.id);
    if(!m) {
      i.queue.remove(entry.id);
      continue;
    }

    std::string unmet;
    Dependencies dependencies = i.checkDependencies(*m, unmet);

    std::optional<DispatchOrder> order;
    Events events;
    {
      bus::MessageBus::Deferral deferral(m_bus);
      std::unique_lock lock(m->mutex);
      if(m->state != REX_QUEUED) {
        i.queue.remove(entry.id);
        continue;
      }

      TimePoint now = m_clock.now();
      if(dependencies == Dependencies::Broken) {
        i.failDependent(*m, unmet, events);
      } else if(dependencies == Dependencies::Waiting) {
        rex_log(REX_SCHEDULER,
                REX_TRACE,
                "Mission {} waits for its dependencies.",
                m->id);
      } else if(m->notBefore && *m->notBefore > now) {
        rex_log(REX_SCHEDULER,
                REX_TRACE,
                "Mission {} is not due yet.",
                m->id);
      } else try {
        order = i.tryAssign(*m, now, events);
      } catch(const std::exception& e) {
        rex_log(REX_SCHEDULER,
                REX_LOCALERROR,
                "Exception while scheduling mission {}: {}. It stays queued.",
                m->id,
                e.what());
      }
    }
    Publish(m_bus, events);

    if(!order)
      continue;

    ++dispatched;
    rex_status s = REX_GENERIC_ERROR;
    std::string why;
    try {
      s = m_dispatcher.dispatch(*order);
      why = rex_status_to_str(s);
    } catch(const std::exception& e) {
      why = e.what();
    }

    if(s != REX_OK) {
      ++i.dispatchErrors;
      rex_log(REX_SCHEDULER,
              REX_LOCALERROR,
              "Could not dispatch mission {} to {}: {}",
              order->missionId,
              order->crew,
              why);
      reportFailure(order->missionId,
                    ErrorDetail{ "", "dispatch failed: " + why,
                                 REX_ERR_PROVIDER_ERROR });
    }
  }
  i.scheduleTickThread = std::thread::id();
  return dispatched;
}

size_t
MissionScheduler::monitorTick() {
  auto& i = *m_internal;
  std::unique_lock tickLock(i.monitorTickMutex);

  TimePoint now = m_clock.now();
  Duration timeout = m_config.getSeconds(Config::MissionTimeoutS);
  size_t timedOut = 0;

  for(auto& m : i.collect(i.runningIds)) {
    Events events;
    {
      bus::MessageBus::Deferral deferral(m_bus);
      std::unique_lock lock(m->mutex);
      if(m->state != REX_RUNNING || now - m->lastProgressAt <= timeout)
        continue;

      int64_t silentFor = std::chrono::duration_cast<std::chrono::seconds>(
                            now - m->lastProgressAt)
                            .count();
      rex_log(REX_SCHEDULER,
              REX_LOCALWARNING,
              "Mission {} made no progress for {}s, retry {}/{}.",
              m->id,
              silentFor,
              m->retryCount,
              m->maxRetries);

      m->error = ErrorDetail{ "timeout",
                              "no progress for " + std::to_string(silentFor) +
                                "s",
                              REX_ERR_TIMEOUT };
      ++timedOut;
      ++i.timedOut;

      if(m->retryCount < m->maxRetries) {
        if(i.applyEvent(*m, REX_EV_TIMEOUT_RETRY, events)) {
          i.releaseLeases(*m);
          m->retryAt.reset();
          i.pushFailure(m->id);
        }
      } else {
        i.failMission(*m, REX_EV_TIMEOUT_EXHAUSTED, true, events);
      }
    }
    Publish(m_bus, events);
  }

  m_allocator.reapExpired();
  return timedOut;
}

size_t
MissionScheduler::recoveryTick() {
  auto& i = *m_internal;
  std::unique_lock tickLock(i.recoveryTickMutex);

  TimePoint now = m_clock.now();

  for(rex_id id : i.drainFailures()) {
    MissionPtr m = i.find(id);
    if(!m)
      continue;

    Events events;
    {
      bus::MessageBus::Deferral deferral(m_bus);
      std::unique_lock lock(m->mutex);
      if(m->state != REX_RETRY_PENDING || m->retryAt)
        continue;

      Decision d = m_engine.resolve(
        Request{ id,
                 decision::RetryContext{ m->retryCount,
                                         m->maxRetries,
                                         true,
                                         m->priority } });

      if(d.verdict == decision::Retry && m->retryCount < m->maxRetries) {
        Duration wait = i.backoff(m->retryCount);
        m->retryAt = now + wait;
        rex_log(REX_SCHEDULER,
                REX_DEBUG,
                "Mission {} retries in {}ms (attempt {}).",
                id,
                std::chrono::duration_cast<std::chrono::milliseconds>(wait)
                  .count(),
                m->retryCount + 1);
      } else {
        if(!m->error)
          m->error = ErrorDetail();
        m->error->escalated = d.verdict == decision::Escalate;
        if(i.applyEvent(*m, REX_EV_RETRIES_EXHAUSTED, events)) {
          i.releaseLeases(*m);
          ++i.failed;
          if(m->error->escalated) {
            ++i.escalated;
            rex_log(REX_SCHEDULER,
                    REX_GLOBALWARNING,
                    "Escalating failed {} mission {} (priority {}): {}",
                    rex_mission_type_to_str(m->type),
                    id,
                    m->priority,
                    m->error->message);
          }
        }
      }
    }
    Publish(m_bus, events);
  }

  size_t requeued = 0;
  for(auto& m : i.collect(i.retryPendingIds)) {
    Events events;
    {
      bus::MessageBus::Deferral deferral(m_bus);
      std::unique_lock lock(m->mutex);
      if(m->state != REX_RETRY_PENDING || !m->retryAt || *m->retryAt > now)
        continue;

      if(!i.applyEvent(*m, REX_EV_BACKOFF_ELAPSED, events))
        continue;

      ++m->retryCount;
      m->retryAt.reset();
      m->queuedSince = now;
      m->progress = 0;
      i.queue.push(QueueEntry{ m->id, m->priority, m->createdAt });
      ++requeued;
      ++i.retried;
    }
    Publish(m_bus, events);
  }

  if(requeued > 0)
    wake();
  return requeued;
}

void
MissionScheduler::start(boost::asio::io_context& ioContext) {
  auto& i = *m_internal;
  if(i.running.exchange(true))
    return;

  i.scheduleStrand.emplace(boost::asio::make_strand(ioContext));
  i.monitorStrand.emplace(boost::asio::make_strand(ioContext));
  i.recoveryStrand.emplace(boost::asio::make_strand(ioContext));
  using boost::asio::steady_timer;
  i.scheduleTimer = std::make_unique<steady_timer>(*i.scheduleStrand);
  i.monitorTimer = std::make_unique<steady_timer>(*i.monitorStrand);
  i.recoveryTimer = std::make_unique<steady_timer>(*i.recoveryStrand);

  rex_log(REX_SCHEDULER, REX_DEBUG, "Starting scheduler loops.");

  boost::asio::post(*i.scheduleStrand, [this]() { startScheduleTimer(); });
  boost::asio::post(*i.monitorStrand, [this]() { startMonitorTimer(); });
  boost::asio::post(*i.recoveryStrand, [this]() { startRecoveryTimer(); });
}

void
MissionScheduler::stop() {
  auto& i = *m_internal;
  if(!i.running.exchange(false))
    return;

  rex_log(REX_SCHEDULER, REX_DEBUG, "Stopping scheduler loops.");

  boost::asio::post(*i.scheduleStrand, [this]() {
    m_internal->scheduleTimer->cancel();
  });
  boost::asio::post(*i.monitorStrand, [this]() {
    m_internal->monitorTimer->cancel();
  });
  boost::asio::post(*i.recoveryStrand, [this]() {
    m_internal->recoveryTimer->cancel();
  });
}

void
MissionScheduler::wake() {
  auto& i = *m_internal;
  if(!i.running || i.wakePending.exchange(true))
    return;
  boost::asio::post(*i.scheduleStrand, [this]() {
    m_internal->scheduleTimer->cancel();
  });
}

void
MissionScheduler::startScheduleTimer() {
  auto& i = *m_internal;
  i.scheduleTimer->expires_after(
    m_config.getMilliseconds(Config::ScheduleIntervalMs));
  i.scheduleTimer->async_wait([this](const boost::system::error_code&) {
    // A cancelled wait is an early wakeup.
    if(!m_internal->running)
      return;
    m_internal->wakePending = false;
    scheduleTick();
    startScheduleTimer();
  });
}

void
MissionScheduler::startMonitorTimer() {
  auto& i = *m_internal;
  i.monitorTimer->expires_after(
    m_config.getMilliseconds(Config::MonitorIntervalMs));
  i.monitorTimer->async_wait([this](const boost::system::error_code& ec) {
    if(!m_internal->running)
      return;
    if(!ec)
      monitorTick();
    startMonitorTimer();
  });
}

void
MissionScheduler::startRecoveryTimer() {
  auto& i = *m_internal;
  i.recoveryTimer->expires_after(
    m_config.getMilliseconds(Config::RecoveryIntervalMs));
  i.recoveryTimer->async_wait([this](const boost::system::error_code& ec) {
    if(!m_internal->running)
      return;
    if(!ec)
      recoveryTick();
    startRecoveryTimer();
  });
}

MissionScheduler::Stats
MissionScheduler::stats() const {
  auto& i = *m_internal;
  Stats s;
  s.submitted = i.submitted;
  s.scheduled = i.scheduled;
  s.completed = i.completed;
  s.failed = i.failed;
  s.timedOut = i.timedOut;
  s.retried = i.retried;
  s.cancelled = i.cancelled;
  s.escalated = i.escalated;
  s.dispatchErrors = i.dispatchErrors;
  return s;
}

size_t
MissionScheduler::queuedCount() const {
  return m_internal->queue.size();
}
}
