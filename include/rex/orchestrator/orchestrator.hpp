#pragma once

#include <rex/allocator/lease.hpp>
#include <rex/allocator/resource_allocator.hpp>
#include <rex/common/status.h>
#include <rex/decision/audit_trail.hpp>
#include <rex/scheduler/mission.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rex {
class Config;
class Clock;

namespace bus {
class MessageBus;
}
namespace decision {
class AuditTrail;
class DecisionEngine;
class Reasoner;
}
namespace scheduler {
class MissionDispatcher;
class MissionScheduler;
}

/** @brief One orchestration core instance.
 *
 * Owns the message bus, the resource allocator, the decision engine and the
 * mission scheduler and wires them together. The control loops run on an
 * internal io_context once start() was called.
 */
class Orchestrator {
  public:
  /** @brief Build the core.
   *
   * @param reasoner Heavy reasoning provider, may be null.
   * @param clock Time source, a system clock is used if null.
   * @param dispatcher Crew dispatcher, a bus dispatcher is used if null.
   */
  explicit Orchestrator(const Config& config,
                        std::shared_ptr<decision::Reasoner> reasoner = nullptr,
                        const Clock* clock = nullptr,
                        scheduler::MissionDispatcher* dispatcher = nullptr);
  ~Orchestrator();

  void start();
  void stop();
  bool running() const;

  rex_id submitMission(rex_mission_type type,
                       int32_t priority,
                       scheduler::MissionPayload payload = {});
  rex_status cancelMission(rex_id id);
  rex_status updateMissionPriority(rex_id id, int32_t priority);
  rex_status rescheduleMission(rex_id id, TimePoint notBefore);
  std::optional<scheduler::MissionStatus> getMissionStatus(rex_id id) const;
  allocator::ResourceSnapshot getResourceSnapshot() const;

  rex_status reportProgress(rex_id id, float fraction);
  rex_status reportCompleted(rex_id id, std::string result);
  rex_status reportFailure(rex_id id, scheduler::ErrorDetail error);

  rex_status recordDeliveryOutcome(std::string_view domain,
                                   allocator::DeliveryOutcome outcome);
  rex_status reportReputation(std::string_view domain, float score);
  rex_status provisionDomain(allocator::DomainRecord record);
  size_t advanceWarmupDay();

  /// Recent decisions, oldest first, optionally about one mission only.
  std::vector<decision::DecisionRecord> getDecisionHistory(
    size_t limit = 50,
    rex_id missionId = 0) const;

  bus::MessageBus& messageBus();
  allocator::ResourceAllocator& resourceAllocator();
  decision::DecisionEngine& decisionEngine();
  decision::AuditTrail& auditTrail();
  scheduler::MissionScheduler& missionScheduler();

  private:
  struct Internal;
  std::unique_ptr<Internal> m_internal;

  const Config& m_config;

  size_t provisionConfiguredDomains();
};
}
