#pragma once

#include <rex/common/status.h>
#include <rex/scheduler/dispatcher.hpp>
#include <rex/scheduler/mission.hpp>

#include <cstdint>
#include <memory>
#include <optional>

namespace boost::asio {
class io_context;
}

namespace rex {
class Config;
class Clock;

namespace bus {
class MessageBus;
}
namespace allocator {
class ResourceAllocator;
}
namespace decision {
class DecisionEngine;
}
}

namespace rex::scheduler {
/** @brief Owns the lifecycle of every mission.
 *
 * Three loops drive missions forward:
 *  - scheduling: assigns queued missions to crews once all leases are held,
 *  - monitoring: detects missions without progress and reaps expired leases,
 *  - recovery: decides about failed missions and requeues them after backoff.
 *
 * Each loop is a tick function. start() runs the ticks on steady_timers of
 * the given io_context, tests call them directly. All mutation of a mission
 * happens under its own lock, there is no global mission lock.
 *
 * Bus handlers run synchronously on the thread that raised the event.
 * Events raised while a mission is locked are held back and delivered after
 * the lock is released, so handlers may query the scheduler.
 *
 * Finished missions stay queryable until keep-finished-missions newer ones
 * have finished.
 */
class MissionScheduler {
  public:
  struct Stats {
    uint64_t submitted = 0;
    uint64_t scheduled = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
    uint64_t timedOut = 0;
    uint64_t retried = 0;
    uint64_t cancelled = 0;
    uint64_t escalated = 0;
    uint64_t dispatchErrors = 0;
  };

  MissionScheduler(const Config& config,
                   const Clock& clock,
                   bus::MessageBus& bus,
                   allocator::ResourceAllocator& allocator,
                   decision::DecisionEngine& engine,
                   MissionDispatcher& dispatcher);
  ~MissionScheduler();

  /** @brief Queue a new mission.
   *
   * @return The new mission id, or 0 if the type is unknown or a dependency
   * names a mission that was never submitted.
   */
  rex_id submit(rex_mission_type type,
                int32_t priority,
                MissionPayload payload = MissionPayload());

  rex_status cancel(rex_id id);

  /// Change the priority of a mission that has not finished yet.
  rex_status updatePriority(rex_id id, int32_t priority);

  /// Move the earliest start of a queued mission.
  rex_status reschedule(rex_id id, TimePoint notBefore);

  std::optional<MissionStatus> status(rex_id id) const;

  rex_status reportProgress(rex_id id, float fraction);
  rex_status reportCompleted(rex_id id, std::string result);
  rex_status reportFailure(rex_id id, ErrorDetail error);

  /// @return Number of missions dispatched.
  size_t scheduleTick();

  /// @return Number of missions that timed out.
  size_t monitorTick();

  /// @return Number of missions requeued.
  size_t recoveryTick();

  void start(boost::asio::io_context& ioContext);
  void stop();

  /// Run the scheduling loop as soon as possible.
  void wake();

  Stats stats() const;
  size_t queuedCount() const;

  private:
  struct Internal;
  std::unique_ptr<Internal> m_internal;

  const Config& m_config;
  const Clock& m_clock;
  bus::MessageBus& m_bus;
  allocator::ResourceAllocator& m_allocator;
  decision::DecisionEngine& m_engine;
  MissionDispatcher& m_dispatcher;

  void startScheduleTimer();
  void startMonitorTimer();
  void startRecoveryTimer();
};
}
